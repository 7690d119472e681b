#include "node_arena.h"
#include <new>
#include <string>
#include "errors.h"

NodeArena::NodeArena(std::pmr::memory_resource* resource)
    : nodes(resource)
{
}

void NodeArena::reserve(size_t count)
{
    if (!nodes.empty() || nodes.capacity() > 0)
        release();

    try {
        nodes.reserve(count);
    }
    catch (const std::bad_alloc&) {
        throw AllocationFailure("node arena of " + std::to_string(count) + " nodes");
    }
}

NodeIndex NodeArena::add_leaf(uint8_t symbol, uint64_t weight)
{
    return push(Node{true, symbol, weight, NO_NODE, NO_NODE});
}

NodeIndex NodeArena::add_internal(NodeIndex left, NodeIndex right)
{
    uint64_t weight = nodes[left].weight + nodes[right].weight;
    return push(Node{false, 0, weight, left, right});
}

NodeIndex NodeArena::push(const Node& node)
{
    // growing would move the region, so stay inside what reserve() handed out
    if (nodes.size() == nodes.capacity())
        throw AllocationFailure("node arena is full at " + std::to_string(nodes.size()) + " nodes");

    nodes.push_back(node);
    return static_cast<NodeIndex>(nodes.size() - 1);
}

void NodeArena::release()
{
    std::pmr::vector<Node> empty(nodes.get_allocator());
    nodes.swap(empty);
}
