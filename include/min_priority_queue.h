#pragma once
#include <cstddef>
#include <cstdint>
#include <memory_resource>
#include <vector>
#include "node_arena.h"

/*
 * binary min-heap of node indices keyed by weight
 * equal weights are ordered by node index ascending, which is the order the
 * nodes were created in the arena, so the output is reproducible
 */
class MinPriorityQueue {
public:
    explicit MinPriorityQueue(std::pmr::memory_resource* resource = std::pmr::get_default_resource());

    void reserve(size_t count);

    void insert(NodeIndex node, uint64_t weight);
    void insert(const NodeArena& arena, NodeIndex node) { insert(node, arena[node].weight); }

    // throws std::out_of_range when the queue is empty
    NodeIndex extract_min();

    size_t size() const { return heap.size(); }
    bool empty() const { return heap.empty(); }

private:
    struct Entry {
        uint64_t weight;
        NodeIndex node;
    };

    struct Compare {
        bool operator()(const Entry& a, const Entry& b) const {
            if (a.weight != b.weight) return a.weight > b.weight;
            return a.node > b.node;
        }
    };

    std::pmr::vector<Entry> heap;
};
