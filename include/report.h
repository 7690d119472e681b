#pragma once
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>
#include "huffman.hpp"

// printable byte as itself, anything else as \xNN
std::string symbol_label(uint8_t symbol);

void print_code_table(const Session& session, std::ostream& out);

/*
 * check that table is prefix-free and that decoding encoded with it gives
 * back input, throws InvalidCodeError otherwise
 */
void verify_round_trip(const CodeTable& table, const std::vector<uint8_t>& input, const std::string& encoded, std::ostream& log);
