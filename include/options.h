#pragma once
#include <ostream>
#include <string>
#include "configuration.h"

enum class InputMode { Text, File, Image, Directory };

struct Options {
    InputMode mode = InputMode::Text;
    std::string input;
    std::string image_format = DEFAULT_IMAGE_FORMAT;
    bool print_table = false;
    bool verify = false;
};

enum class ParseResult { Run, Help, Error };

ParseResult parse_options(int argc, const char* const argv[], Options& options, std::ostream& err);
void print_usage(std::ostream& out);
