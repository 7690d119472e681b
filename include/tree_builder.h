#pragma once
#include "frequency.h"
#include "node_arena.h"

/*
 * build the Huffman tree for the given frequencies into arena and return
 * the index of its root
 * a single distinct symbol yields a tree that is just that leaf
 * throws EmptyInputError when every frequency is zero
 */
NodeIndex build_tree(const FrequencyMap& frequencies, NodeArena& arena);

// number of nodes a tree over k distinct symbols consists of
size_t tree_node_count(size_t distinct);
