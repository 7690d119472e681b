#include "tree_builder.h"
#include "errors.h"
#include "min_priority_queue.h"

size_t tree_node_count(size_t distinct)
{
    return distinct == 0 ? 0 : 2 * distinct - 1;
}

NodeIndex build_tree(const FrequencyMap& frequencies, NodeArena& arena)
{
    size_t distinct = distinct_symbols(frequencies);
    if (distinct == 0)
        throw EmptyInputError();

    arena.reserve(tree_node_count(distinct));

    MinPriorityQueue pq(arena.resource());
    pq.reserve(distinct);

    // leaves go in by ascending byte value, their indices settle weight ties
    for (size_t i = 0; i < SYMBOL_COUNT; i++) {
        if (frequencies[i] > 0)
            pq.insert(arena, arena.add_leaf(static_cast<uint8_t>(i), frequencies[i]));
    }

    while (pq.size() > 1) {
        NodeIndex l = pq.extract_min();
        NodeIndex r = pq.extract_min();
        pq.insert(arena, arena.add_internal(l, r));
    }

    return pq.extract_min();
}
