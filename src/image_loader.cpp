#include "image_loader.h"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

static std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::vector<std::filesystem::path> find_image_files_recursively(const std::filesystem::path& dir, const std::string& image_format)
{
    std::vector<std::filesystem::path> image_files;

    if (!std::filesystem::exists(dir) || !std::filesystem::is_directory(dir)) {
        std::cerr << "Invalid directory: " << dir << std::endl;
        return image_files;
    }

    const std::string wanted = "." + to_lower(image_format);
    for (const auto& entry : std::filesystem::recursive_directory_iterator(dir)) {
        if (entry.is_regular_file() && to_lower(entry.path().extension().string()) == wanted)
            image_files.push_back(entry.path());
    }

    // directory iteration order is unspecified
    std::sort(image_files.begin(), image_files.end());
    return image_files;
}

cv::Mat load_image(const std::filesystem::path& path)
{
    cv::Mat img = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
    if (img.empty())
        throw std::runtime_error("Could not load image " + path.string());

    return img;
}

std::vector<uint8_t> image_bytes(const cv::Mat& image)
{
    if (image.empty()) return {};

    cv::Mat continuous = image.isContinuous() ? image : image.clone();

    const uint8_t* begin = continuous.ptr<uint8_t>(0);
    size_t size = continuous.total() * continuous.elemSize();
    std::vector<uint8_t> bytes(begin, begin + size);

    // multi-byte channels are emitted little-endian whatever the host order
    const uint16_t one = 1;
    bool host_little_endian = *reinterpret_cast<const uint8_t*>(&one) == 1;
    size_t channel_size = continuous.elemSize1();
    if (!host_little_endian && channel_size > 1) {
        for (size_t i = 0; i < bytes.size(); i += channel_size)
            std::reverse(bytes.begin() + i, bytes.begin() + i + channel_size);
    }
    return bytes;
}
