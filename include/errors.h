#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

struct HuffmanError : std::runtime_error {
    explicit HuffmanError(const std::string& what) : std::runtime_error(what) {}
};

struct EmptyInputError : HuffmanError {
    EmptyInputError() : HuffmanError("input is empty, nothing to encode") {}
};

struct AllocationFailure : HuffmanError {
    explicit AllocationFailure(const std::string& what)
        : HuffmanError("allocation failed: " + what) {}
};

// a byte reached the encoder without a code table entry
struct MissingCodeError : HuffmanError {
    uint8_t symbol;

    explicit MissingCodeError(uint8_t s)
        : HuffmanError("no code for byte " + std::to_string(s)), symbol(s) {}
};

struct InvalidCodeError : HuffmanError {
    explicit InvalidCodeError(const std::string& what) : HuffmanError(what) {}
};
