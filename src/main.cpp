#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>
#include "batch.h"
#include "huffman.hpp"
#include "image_loader.h"
#include "options.h"
#include "report.h"

std::vector<uint8_t> read_file(const std::string& path)
{
    std::ifstream f(path, std::ios::binary);
    if (!f)
        throw std::runtime_error("Cannot open input file " + path);

    return std::vector<uint8_t>((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

int main(int argc, char* argv[])
{
    Options options;
    switch (parse_options(argc, argv, options, std::cerr)) {
        case ParseResult::Help:
            print_usage(std::cout);
            return 0;
        case ParseResult::Error:
            print_usage(std::cerr);
            return 1;
        case ParseResult::Run:
            break;
    }

    try {
        Session session = create_session();

        if (options.mode == InputMode::Directory) {
            BatchResult result = encode_directory(session, options, std::cout, std::cerr);
            return result.failed == 0 ? 0 : 1;
        }

        std::vector<uint8_t> input;
        switch (options.mode) {
            case InputMode::File:  input = read_file(options.input); break;
            case InputMode::Image: input = image_bytes(load_image(options.input)); break;
            default:               input.assign(options.input.begin(), options.input.end()); break;
        }

        std::string encoded = encode(session, input);
        std::cout << encoded << std::endl;

        if (options.print_table) print_code_table(session, std::cerr);
        if (options.verify) verify_round_trip(session.code_table(), input, encoded, std::cerr);
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
