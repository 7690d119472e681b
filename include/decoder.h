#pragma once
#include <string>
#include <vector>
#include "code_table.h"

/*
 * turn a bit-string produced with table back into bytes
 * throws InvalidCodeError on characters other than '0' / '1', on a bit
 * sequence no code starts with and on a trailing partial code
 */
std::vector<uint8_t> decode_bits(const std::string& bits, const CodeTable& table);
