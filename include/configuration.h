#pragma once
#include <cstddef>
#include <string>

// number of distinct byte symbols an input can contain
const size_t SYMBOL_COUNT = 256;

// code assigned when the input holds a single distinct symbol
const char SINGLE_SYMBOL_CODE = '1';

// extension used by the image batch mode when --format is not given
const std::string DEFAULT_IMAGE_FORMAT = "png";
