#pragma once
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory_resource>
#include <vector>

using NodeIndex = uint32_t;

const NodeIndex NO_NODE = std::numeric_limits<NodeIndex>::max();

struct Node {
    bool has_symbol;
    uint8_t symbol;
    uint64_t weight;
    NodeIndex left, right;

    bool is_leaf() const { return left == NO_NODE && right == NO_NODE; }
};

/*
 * holds every node of one encoding run in a single contiguous region
 * nodes refer to each other by index, the region is returned to the
 * memory resource as a whole by release()
 */
class NodeArena {
public:
    explicit NodeArena(std::pmr::memory_resource* resource = std::pmr::get_default_resource());

    // allocate room for exactly count nodes, the arena never grows past it
    void reserve(size_t count);

    NodeIndex add_leaf(uint8_t symbol, uint64_t weight);
    NodeIndex add_internal(NodeIndex left, NodeIndex right);

    const Node& operator[](NodeIndex index) const { return nodes[index]; }

    size_t size() const { return nodes.size(); }
    size_t capacity() const { return nodes.capacity(); }
    bool empty() const { return nodes.empty(); }

    std::pmr::memory_resource* resource() const { return nodes.get_allocator().resource(); }

    void release();

private:
    NodeIndex push(const Node& node);

    std::pmr::vector<Node> nodes;
};
