#include "encoder.h"
#include <new>
#include "errors.h"

uint64_t encoded_length(const FrequencyMap& frequencies, const CodeTable& table)
{
    uint64_t length = 0;
    for (size_t i = 0; i < SYMBOL_COUNT; i++) {
        if (frequencies[i] == 0) continue;
        length += frequencies[i] * table.code(static_cast<uint8_t>(i)).size();
    }
    return length;
}

void encode_bits(const uint8_t* data, size_t size, const CodeTable& table, std::string& out)
{
    try {
        for (size_t i = 0; i < size; i++) {
            const std::pmr::string* code = table.find(data[i]);
            if (!code) throw MissingCodeError(data[i]);
            out.append(code->data(), code->size());
        }
    }
    catch (const std::bad_alloc&) {
        throw AllocationFailure("encoded output of " + std::to_string(out.size()) + " bits");
    }
    catch (const std::length_error&) {
        throw AllocationFailure("encoded output exceeds the maximum string size");
    }
}

void encode_bits(const std::vector<uint8_t>& data, const CodeTable& table, std::string& out)
{
    encode_bits(data.data(), data.size(), table, out);
}
