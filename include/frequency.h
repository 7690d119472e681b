#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>
#include "configuration.h"

using FrequencyMap = std::array<uint64_t, SYMBOL_COUNT>;

FrequencyMap count_frequencies(const uint8_t* data, size_t size);
FrequencyMap count_frequencies(const std::vector<uint8_t>& data);

size_t distinct_symbols(const FrequencyMap& frequencies);
uint64_t frequency_total(const FrequencyMap& frequencies);
