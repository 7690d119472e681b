#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <opencv2/opencv.hpp>

std::vector<std::filesystem::path> find_image_files_recursively(const std::filesystem::path& dir, const std::string& image_format);

// throws std::runtime_error when the file cannot be decoded
cv::Mat load_image(const std::filesystem::path& path);

// raw pixel bytes of image, row by row, channels wider than a byte in little-endian order
std::vector<uint8_t> image_bytes(const cv::Mat& image);
