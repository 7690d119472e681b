#pragma once
#include <cstddef>
#include <cstdint>
#include <memory_resource>
#include <string>
#include <vector>
#include "code_table.h"
#include "errors.h"
#include "frequency.h"
#include "node_arena.h"

enum class SessionState {
    Idle,
    CountingFrequencies,
    BuildingTree,
    ExtractingCodes,
    Encoding,
    Done,
    Failed
};

const char* state_name(SessionState state);

/*
 * one Huffman encoding run at a time: counts frequencies, builds the tree,
 * extracts the code table and substitutes the input
 * all tree and table memory comes from the memory resource given at
 * construction and is handed back on reset() or destruction
 * not thread-safe, callers sharing a session must serialize access
 */
class Session {
public:
    explicit Session(std::pmr::memory_resource* resource = std::pmr::get_default_resource());

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
    Session(Session&&) = default;

    /*
     * encode data and return one '0' / '1' character per bit
     * a session in Done or Failed is reset first
     * throws EmptyInputError for empty data without building anything
     */
    std::string encode(const uint8_t* data, size_t size);
    std::string encode(const std::vector<uint8_t>& data) { return encode(data.data(), data.size()); }
    std::string encode(const std::string& text);

    void reset();

    SessionState state() const { return current; }
    const FrequencyMap& frequencies() const { return freq; }
    const CodeTable& code_table() const { return table; }

    // nodes the last tree consisted of, the tree itself is gone after code extraction
    size_t node_count() const { return nodes_built; }

private:
    FrequencyMap freq{};
    NodeArena arena;
    CodeTable table;
    SessionState current = SessionState::Idle;
    size_t nodes_built = 0;
};

Session create_session(std::pmr::memory_resource* resource = std::pmr::get_default_resource());
std::string encode(Session& session, const std::vector<uint8_t>& bytes);
void reset_or_destroy(Session& session);
