#include "ImageDecoder.hpp"

#include <algorithm>
#include <climits>

#define STB_IMAGE_IMPLEMENTATION
#define STBI_ONLY_PNG
#define STBI_ONLY_JPEG
#include "stb_image.h"

namespace Spraynet::Assets {

void PixelBuffer::releaseArray(void* data) {
    delete[] static_cast<uint8_t*>(data);
}

PixelBuffer::PixelBuffer(std::initializer_list<uint8_t> bytes)
    : m_data(bytes.size() > 0 ? new uint8_t[bytes.size()] : nullptr, &PixelBuffer::releaseArray)
    , m_size(bytes.size()) {
    std::copy(bytes.begin(), bytes.end(), m_data.get());
}

PixelBuffer PixelBuffer::adopt(uint8_t* data, size_t size, Release release) {
    PixelBuffer buffer;
    buffer.m_data = std::unique_ptr<uint8_t, Release>(data, release);
    buffer.m_size = data ? size : 0;
    return buffer;
}

PixelBuffer PixelBuffer::filled(size_t size, uint8_t value) {
    PixelBuffer buffer;
    if (size > 0) {
        buffer.m_data = std::unique_ptr<uint8_t, Release>(new uint8_t[size], &PixelBuffer::releaseArray);
        std::fill_n(buffer.m_data.get(), size, value);
        buffer.m_size = size;
    }
    return buffer;
}

DecodedImage makePlaceholderImage() {
    DecodedImage image;
    image.width = 2;
    image.height = 2;
    image.channels = 4;
    image.pixels = PixelBuffer::filled(2 * 2 * 4, 0xFF);
    image.placeholder = true;
    return image;
}

bool StbImageDecoder::decode(const uint8_t* data, size_t size, DecodedImage& out, std::string& error) {
    if (size == 0) {
        out = makePlaceholderImage();
        return true;
    }

    if (size > static_cast<size_t>(INT_MAX)) {
        error = "image too large";
        return false;
    }

    int width = 0;
    int height = 0;
    int channels = 0;
    if (!stbi_info_from_memory(data, static_cast<int>(size), &width, &height, &channels)) {
        const char* reason = stbi_failure_reason();
        error = reason ? reason : "unknown image format";
        return false;
    }
    if (width > MAX_IMAGE_DIMENSION || height > MAX_IMAGE_DIMENSION) {
        error = "image is " + std::to_string(width) + "x" + std::to_string(height) +
                ", limit is " + std::to_string(MAX_IMAGE_DIMENSION) + "x" + std::to_string(MAX_IMAGE_DIMENSION);
        return false;
    }

    stbi_uc* pixels = stbi_load_from_memory(data, static_cast<int>(size), &width, &height, &channels, STBI_rgb_alpha);
    if (!pixels) {
        const char* reason = stbi_failure_reason();
        error = reason ? reason : "unknown image format";
        return false;
    }

    DecodedImage image;
    image.width = width;
    image.height = height;
    image.channels = 4;
    const size_t byte_count = static_cast<size_t>(width) * static_cast<size_t>(height) * 4;
    image.pixels = PixelBuffer::adopt(pixels, byte_count, stbi_image_free);

    out = std::move(image);
    return true;
}

} // namespace Spraynet::Assets
