#include "code_table.h"
#include <algorithm>
#include <new>
#include "configuration.h"
#include "errors.h"

CodeTable::CodeTable(std::pmr::memory_resource* resource)
    : codes(resource)
{
}

void CodeTable::assign(uint8_t symbol, std::string_view code)
{
    if (code.empty())
        throw InvalidCodeError("empty code for byte " + std::to_string(symbol));

    try {
        if (codes.empty()) codes.resize(SYMBOL_COUNT);
        if (codes[symbol].empty()) entries++;
        codes[symbol].assign(code.begin(), code.end());
    }
    catch (const std::bad_alloc&) {
        throw AllocationFailure("code table");
    }
}

const std::pmr::string* CodeTable::find(uint8_t symbol) const
{
    if (codes.empty() || codes[symbol].empty()) return nullptr;
    return &codes[symbol];
}

const std::pmr::string& CodeTable::code(uint8_t symbol) const
{
    const std::pmr::string* c = find(symbol);
    if (!c) throw MissingCodeError(symbol);
    return *c;
}

void CodeTable::clear()
{
    std::pmr::vector<std::pmr::string> empty(codes.get_allocator());
    codes.swap(empty);
    entries = 0;
}

static void collect_codes(const NodeArena& arena, NodeIndex index, std::pmr::string& path, CodeTable& table)
{
    const Node& node = arena[index];
    if (node.is_leaf()) {
        table.assign(node.symbol, path);
        return;
    }

    path.push_back('0');
    collect_codes(arena, node.left, path, table);
    path.back() = '1';
    collect_codes(arena, node.right, path, table);
    path.pop_back();
}

/*
 * walk the tree depth first, '0' for a left edge and '1' for a right edge
 * the address of each leaf becomes its code
 */
void build_code_table(const NodeArena& arena, NodeIndex root, CodeTable& table)
{
    table.clear();

    // a lone leaf has an empty address
    if (arena[root].is_leaf()) {
        table.assign(arena[root].symbol, std::string_view(&SINGLE_SYMBOL_CODE, 1));
        return;
    }

    // no code is longer than the alphabet, so the path never grows past this
    std::pmr::string path(table.resource());
    try {
        path.reserve(SYMBOL_COUNT);
    }
    catch (const std::bad_alloc&) {
        throw AllocationFailure("code table traversal path");
    }
    collect_codes(arena, root, path, table);
}

bool is_prefix_free(const CodeTable& table)
{
    std::vector<std::string> codes;
    for (size_t i = 0; i < SYMBOL_COUNT; i++) {
        if (const std::pmr::string* c = table.find(static_cast<uint8_t>(i)))
            codes.emplace_back(c->begin(), c->end());
    }
    std::sort(codes.begin(), codes.end());

    // after sorting, a code that prefixes any other also prefixes its successor
    for (size_t i = 1; i < codes.size(); i++) {
        const std::string& a = codes[i - 1];
        const std::string& b = codes[i];
        if (b.compare(0, a.size(), a) == 0) return false;
    }
    return true;
}
