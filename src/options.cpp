#include "options.h"

void print_usage(std::ostream& out)
{
    out << "Usage: huffman_encoder [options] <text>" << std::endl;
    out << "  --file <path>     encode the raw bytes of a file" << std::endl;
    out << "  --image <path>    encode the raw pixel bytes of an image" << std::endl;
    out << "  --dir <path>      encode every image in a directory and print statistics" << std::endl;
    out << "  --format <ext>    image extension searched by --dir (default " << DEFAULT_IMAGE_FORMAT << ")" << std::endl;
    out << "  --table           print the code table to stderr" << std::endl;
    out << "  --verify          decode the result and compare it with the input" << std::endl;
    out << "  --help            print this message" << std::endl;
}

ParseResult parse_options(int argc, const char* const argv[], Options& options, std::ostream& err)
{
    bool have_input = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto take_value = [&](std::string& target) -> bool {
            if (i + 1 >= argc) {
                err << "Error: " << arg << " requires a value." << std::endl;
                return false;
            }
            target = argv[++i];
            return true;
        };

        auto take_input = [&](InputMode mode) -> bool {
            if (!take_value(options.input)) return false;
            options.mode = mode;
            have_input = true;
            return true;
        };

        if (arg == "--file") {
            if (!take_input(InputMode::File)) return ParseResult::Error;
        } else if (arg == "--image") {
            if (!take_input(InputMode::Image)) return ParseResult::Error;
        } else if (arg == "--dir") {
            if (!take_input(InputMode::Directory)) return ParseResult::Error;
        } else if (arg == "--format") {
            if (!take_value(options.image_format)) return ParseResult::Error;
        } else if (arg == "--table") {
            options.print_table = true;
        } else if (arg == "--verify") {
            options.verify = true;
        } else if (arg == "--help" || arg == "-h") {
            return ParseResult::Help;
        } else {
            options.mode = InputMode::Text;
            options.input = arg;
            have_input = true;
        }
    }

    if (!have_input) {
        err << "Please provide text for encoding" << std::endl;
        return ParseResult::Error;
    }
    return ParseResult::Run;
}
