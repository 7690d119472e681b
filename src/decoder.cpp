#include "decoder.h"
#include <cstdint>
#include "configuration.h"
#include "errors.h"

namespace {

struct TrieNode {
    int child[2] = {-1, -1};
    int symbol = -1;   // byte value at a leaf, -1 otherwise
};

std::vector<TrieNode> build_trie(const CodeTable& table)
{
    std::vector<TrieNode> trie(1);

    for (size_t s = 0; s < SYMBOL_COUNT; s++) {
        const std::pmr::string* code = table.find(static_cast<uint8_t>(s));
        if (!code) continue;

        int at = 0;
        for (char c : *code) {
            if (c != '0' && c != '1')
                throw InvalidCodeError("code of byte " + std::to_string(s) + " contains '" + c + "'");
            if (trie[at].symbol >= 0)
                throw InvalidCodeError("code table is not prefix-free");

            int bit = c - '0';
            if (trie[at].child[bit] < 0) {
                trie[at].child[bit] = static_cast<int>(trie.size());
                trie.emplace_back();
            }
            at = trie[at].child[bit];
        }

        if (trie[at].symbol >= 0 || trie[at].child[0] >= 0 || trie[at].child[1] >= 0)
            throw InvalidCodeError("code table is not prefix-free");
        trie[at].symbol = static_cast<int>(s);
    }
    return trie;
}

}

std::vector<uint8_t> decode_bits(const std::string& bits, const CodeTable& table)
{
    std::vector<TrieNode> trie = build_trie(table);
    std::vector<uint8_t> out;

    int at = 0;
    for (size_t i = 0; i < bits.size(); i++) {
        char c = bits[i];
        if (c != '0' && c != '1')
            throw InvalidCodeError("unexpected character at bit " + std::to_string(i));

        at = trie[at].child[c - '0'];
        if (at < 0)
            throw InvalidCodeError("no code matches the bits ending at position " + std::to_string(i));

        if (trie[at].symbol >= 0) {
            out.push_back(static_cast<uint8_t>(trie[at].symbol));
            at = 0;
        }
    }

    if (at != 0)
        throw InvalidCodeError("bit-string ends inside a code");

    return out;
}
