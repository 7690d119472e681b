#include "min_priority_queue.h"
#include <algorithm>
#include <new>
#include <stdexcept>
#include "errors.h"

MinPriorityQueue::MinPriorityQueue(std::pmr::memory_resource* resource)
    : heap(resource)
{
}

void MinPriorityQueue::reserve(size_t count)
{
    try {
        heap.reserve(count);
    }
    catch (const std::bad_alloc&) {
        throw AllocationFailure("priority queue");
    }
}

void MinPriorityQueue::insert(NodeIndex node, uint64_t weight)
{
    try {
        heap.push_back(Entry{weight, node});
    }
    catch (const std::bad_alloc&) {
        throw AllocationFailure("priority queue");
    }
    std::push_heap(heap.begin(), heap.end(), Compare());
}

NodeIndex MinPriorityQueue::extract_min()
{
    if (heap.empty())
        throw std::out_of_range("extract_min on an empty priority queue");

    std::pop_heap(heap.begin(), heap.end(), Compare());
    NodeIndex node = heap.back().node;
    heap.pop_back();
    return node;
}
