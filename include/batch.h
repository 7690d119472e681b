#pragma once
#include <cstddef>
#include <ostream>
#include "huffman.hpp"
#include "options.h"

struct BatchResult {
    size_t encoded = 0;
    size_t failed = 0;
};

/*
 * encode every image of options.input with one session,
 * one line per image on out: path, input bytes, encoded bits, bits per byte
 * an image that cannot be read or encoded is reported on log and skipped
 */
BatchResult encode_directory(Session& session, const Options& options, std::ostream& out, std::ostream& log);
