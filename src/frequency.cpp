#include "frequency.h"

FrequencyMap count_frequencies(const uint8_t* data, size_t size)
{
    FrequencyMap frequencies{};
    for (size_t i = 0; i < size; i++) frequencies[data[i]]++;
    return frequencies;
}

FrequencyMap count_frequencies(const std::vector<uint8_t>& data)
{
    return count_frequencies(data.data(), data.size());
}

size_t distinct_symbols(const FrequencyMap& frequencies)
{
    size_t count = 0;
    for (uint64_t f : frequencies)
        if (f > 0) count++;
    return count;
}

uint64_t frequency_total(const FrequencyMap& frequencies)
{
    uint64_t total = 0;
    for (uint64_t f : frequencies) total += f;
    return total;
}
