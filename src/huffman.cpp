#include "huffman.hpp"
#include <new>
#include <stdexcept>
#include "encoder.h"
#include "tree_builder.h"

const char* state_name(SessionState state)
{
    switch (state) {
        case SessionState::Idle:                return "idle";
        case SessionState::CountingFrequencies: return "counting frequencies";
        case SessionState::BuildingTree:        return "building tree";
        case SessionState::ExtractingCodes:     return "extracting codes";
        case SessionState::Encoding:            return "encoding";
        case SessionState::Done:                return "done";
        case SessionState::Failed:              return "failed";
    }
    return "unknown";
}

Session::Session(std::pmr::memory_resource* resource)
    : arena(resource), table(resource)
{
}

std::string Session::encode(const std::string& text)
{
    return encode(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

std::string Session::encode(const uint8_t* data, size_t size)
{
    if (current != SessionState::Idle)
        reset();

    if (size == 0) {
        current = SessionState::Failed;
        throw EmptyInputError();
    }

    try {
        current = SessionState::CountingFrequencies;
        freq = count_frequencies(data, size);

        current = SessionState::BuildingTree;
        NodeIndex root = build_tree(freq, arena);
        nodes_built = arena.size();

        current = SessionState::ExtractingCodes;
        build_code_table(arena, root, table);
        arena.release();

        current = SessionState::Encoding;
        std::string encoded;
        try {
            encoded.reserve(encoded_length(freq, table));
        }
        catch (const std::bad_alloc&) {
            throw AllocationFailure("encoded output");
        }
        catch (const std::length_error&) {
            throw AllocationFailure("encoded output exceeds the maximum string size");
        }
        encode_bits(data, size, table, encoded);

        current = SessionState::Done;
        return encoded;
    }
    catch (...) {
        current = SessionState::Failed;
        arena.release();
        throw;
    }
}

void Session::reset()
{
    arena.release();
    table.clear();
    freq.fill(0);
    nodes_built = 0;
    current = SessionState::Idle;
}

Session create_session(std::pmr::memory_resource* resource)
{
    return Session(resource);
}

std::string encode(Session& session, const std::vector<uint8_t>& bytes)
{
    return session.encode(bytes);
}

void reset_or_destroy(Session& session)
{
    session.reset();
}
