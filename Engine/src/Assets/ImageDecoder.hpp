#pragma once

#include <string>
#include <cstdint>
#include <cstddef>
#include <initializer_list>
#include <memory>
#include <vector>

namespace Spraynet::Assets {

// Larger images are rejected before any pixel memory is allocated
constexpr int MAX_IMAGE_DIMENSION = 4096;

// Owned pixel bytes. Decoder output is adopted as-is, never copied.
class PixelBuffer {
public:
    using Release = void (*)(void*);

    PixelBuffer() = default;
    PixelBuffer(std::initializer_list<uint8_t> bytes);

    static PixelBuffer adopt(uint8_t* data, size_t size, Release release);
    static PixelBuffer filled(size_t size, uint8_t value);

    const uint8_t* data() const { return m_data.get(); }
    size_t size() const { return m_size; }
    bool empty() const { return m_size == 0; }
    uint8_t operator[](size_t index) const { return m_data.get()[index]; }

private:
    static void releaseArray(void* data);

    std::unique_ptr<uint8_t, Release> m_data{nullptr, &PixelBuffer::releaseArray};
    size_t m_size = 0;
};

// RGBA8 pixels ready for a texture upload
struct DecodedImage {
    PixelBuffer pixels;
    int width = 0;
    int height = 0;
    int channels = 0;
    bool placeholder = false;

    bool isValid() const { return width > 0 && height > 0 && !pixels.empty(); }
};

// 2x2 white image used for empty input
DecodedImage makePlaceholderImage();

class IImageDecoder {
public:
    virtual ~IImageDecoder() = default;

    // Empty input is not an error: it produces the placeholder.
    // On failure 'out' is left untouched and 'error' describes the problem.
    virtual bool decode(const uint8_t* data, size_t size, DecodedImage& out, std::string& error) = 0;

    bool decode(const std::vector<uint8_t>& bytes, DecodedImage& out, std::string& error) {
        return decode(bytes.data(), bytes.size(), out, error);
    }
};

// png / jpg / jpeg through stb_image, at most MAX_IMAGE_DIMENSION on either side
class StbImageDecoder final : public IImageDecoder {
public:
    bool decode(const uint8_t* data, size_t size, DecodedImage& out, std::string& error) override;
};

} // namespace Spraynet::Assets
