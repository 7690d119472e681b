#pragma once
#include <cstddef>
#include <cstdint>
#include <memory_resource>
#include <string>
#include <string_view>
#include <vector>
#include "node_arena.h"

/*
 * byte value -> code as a string of '0' / '1' characters
 * a slot with an empty string has no entry, real codes are never empty
 */
class CodeTable {
public:
    explicit CodeTable(std::pmr::memory_resource* resource = std::pmr::get_default_resource());

    void assign(uint8_t symbol, std::string_view code);

    // nullptr when symbol has no entry
    const std::pmr::string* find(uint8_t symbol) const;
    bool contains(uint8_t symbol) const { return find(symbol) != nullptr; }

    // throws MissingCodeError when symbol has no entry
    const std::pmr::string& code(uint8_t symbol) const;

    size_t size() const { return entries; }
    bool empty() const { return entries == 0; }

    std::pmr::memory_resource* resource() const { return codes.get_allocator().resource(); }

    // drops every entry and hands the storage back to the memory resource
    void clear();

private:
    std::pmr::vector<std::pmr::string> codes;
    size_t entries = 0;
};

void build_code_table(const NodeArena& arena, NodeIndex root, CodeTable& table);

bool is_prefix_free(const CodeTable& table);
