#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "code_table.h"
#include "frequency.h"

// sum over all symbols of occurrence count times code length
uint64_t encoded_length(const FrequencyMap& frequencies, const CodeTable& table);

/*
 * append the code of every byte of data to out, in input order
 * throws MissingCodeError for a byte the table has no entry for
 */
void encode_bits(const uint8_t* data, size_t size, const CodeTable& table, std::string& out);
void encode_bits(const std::vector<uint8_t>& data, const CodeTable& table, std::string& out);
