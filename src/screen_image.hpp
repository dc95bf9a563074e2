// =============================================================================
// Tapdeck - Screen Image
// =============================================================================
// Decoded screen capture / needle image. Pixels are stored BGRA, row-major,
// 4 bytes per pixel.
// =============================================================================
#pragma once

#include "result.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace tapdeck {

struct GrayImage {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> data;   // 1 byte per pixel

    bool empty() const { return width <= 0 || height <= 0; }
    uint8_t at(int x, int y) const { return data[(size_t)y * width + x]; }
};

struct ScreenImage {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> bgra;

    bool empty() const { return width <= 0 || height <= 0; }

    // (R, G, B) of pixel (x, y). Caller guarantees bounds.
    std::array<uint8_t, 3> pixelRgb(int x, int y) const {
        const uint8_t* p = &bgra[((size_t)y * width + x) * 4];
        return {p[2], p[1], p[0]};
    }

    GrayImage toGray() const;
};

namespace png {

constexpr size_t kMinCaptureBytes = 100;
constexpr size_t kTrailerSearchWindow = 20;

// Why a buffer was rejected; Ok means the buffer is a complete PNG stream.
enum class Check { Ok, TooSmall, BadSignature, Truncated };

const char* checkStr(Check c);

// Signature + IEND trailer check. Does not decode.
Check validate(const std::vector<uint8_t>& bytes);

}  // namespace png

// Validates then decodes a PNG capture. Throws ConnectionFault on any failure
// so that a partial transport read goes through the reconnect-and-retry path.
ScreenImage decodeCapture(const std::vector<uint8_t>& bytes);

// Decodes an image file from disk (needles). Any format stb_image reads.
Result<ScreenImage> loadImageFile(const std::string& path);

} // namespace tapdeck
