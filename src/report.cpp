#include "report.h"
#include <cctype>
#include <cstdio>
#include <iomanip>
#include "decoder.h"

std::string symbol_label(uint8_t symbol)
{
    if (std::isprint(symbol) && symbol != ' ')
        return std::string(1, static_cast<char>(symbol));

    char buf[8];
    std::snprintf(buf, sizeof(buf), "\\x%02x", symbol);
    return buf;
}

void print_code_table(const Session& session, std::ostream& out)
{
    const FrequencyMap& freq = session.frequencies();
    const CodeTable& table = session.code_table();

    out << table.size() << " symbols, " << session.node_count() << " tree nodes" << std::endl;
    for (size_t i = 0; i < SYMBOL_COUNT; i++) {
        uint8_t symbol = static_cast<uint8_t>(i);
        if (!table.contains(symbol)) continue;
        out << std::setw(6) << symbol_label(symbol) << std::setw(10) << freq[i]
            << "  " << table.code(symbol) << std::endl;
    }
}

void verify_round_trip(const CodeTable& table, const std::vector<uint8_t>& input, const std::string& encoded, std::ostream& log)
{
    if (!is_prefix_free(table))
        throw InvalidCodeError("verification failed: code table is not prefix-free");

    if (decode_bits(encoded, table) != input)
        throw InvalidCodeError("verification failed: decoded output does not match the input");

    log << "verified " << input.size() << " bytes" << std::endl;
}
