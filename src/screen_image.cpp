// =============================================================================
// Tapdeck - Screen Image decoding (stb_image)
// =============================================================================
#include "screen_image.hpp"
#include "errors.hpp"
#include "tapdeck_log.hpp"

#include "stb_image.h"

#include <algorithm>
#include <cstring>

static constexpr const char* TAG = "image";

namespace tapdeck {

namespace {

constexpr uint8_t kPngSignature[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1a, '\n'};
constexpr uint8_t kPngTrailer[8]   = {'I', 'E', 'N', 'D', 0xae, 'B', 0x60, 0x82};

// RGBA (stb order) -> BGRA, in place
void swapRedBlue(uint8_t* px, size_t count) {
    for (size_t i = 0; i < count; ++i) {
        std::swap(px[i * 4 + 0], px[i * 4 + 2]);
    }
}

ScreenImage fromStb(unsigned char* rgba, int w, int h) {
    ScreenImage img;
    img.width = w;
    img.height = h;
    img.bgra.assign(rgba, rgba + (size_t)w * h * 4);
    stbi_image_free(rgba);
    swapRedBlue(img.bgra.data(), (size_t)w * h);
    return img;
}

} // anonymous namespace

// luma: 0.299R + 0.587G + 0.114B
GrayImage ScreenImage::toGray() const {
    GrayImage g;
    g.width = width;
    g.height = height;
    g.data.resize((size_t)width * height);
    for (size_t i = 0; i < g.data.size(); ++i) {
        const uint8_t* p = &bgra[i * 4];
        int y = (77 * p[2] + 150 * p[1] + 29 * p[0] + 128) >> 8;
        g.data[i] = (uint8_t)std::clamp(y, 0, 255);
    }
    return g;
}

namespace png {

const char* checkStr(Check c) {
    switch (c) {
        case Check::Ok:           return "ok";
        case Check::TooSmall:     return "data incomplete";
        case Check::BadSignature: return "invalid PNG signature";
        case Check::Truncated:    return "PNG data truncated (missing IEND)";
    }
    return "?";
}

Check validate(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < kMinCaptureBytes) return Check::TooSmall;
    if (std::memcmp(bytes.data(), kPngSignature, sizeof(kPngSignature)) != 0) {
        return Check::BadSignature;
    }
    // Trailer at the very end, or within the last few bytes when the
    // transport appends a newline or padding.
    auto tail_begin = bytes.end() - std::min(bytes.size(), kTrailerSearchWindow);
    auto found = std::search(tail_begin, bytes.end(),
                             std::begin(kPngTrailer), std::end(kPngTrailer));
    if (found == bytes.end()) return Check::Truncated;
    return Check::Ok;
}

}  // namespace png

ScreenImage decodeCapture(const std::vector<uint8_t>& bytes) {
    png::Check check = png::validate(bytes);
    if (check != png::Check::Ok) {
        throw ConnectionFault(std::string("Screenshot rejected (") + png::checkStr(check) + ", " +
                              std::to_string(bytes.size()) + " bytes) - will retry");
    }

    int w = 0, h = 0, channels = 0;
    unsigned char* rgba = stbi_load_from_memory(bytes.data(), (int)bytes.size(),
                                                &w, &h, &channels, 4);
    if (!rgba) {
        throw ConnectionFault(std::string("Screenshot rejected (decode failed: ") +
                              stbi_failure_reason() + ") - will retry");
    }
    return fromStb(rgba, w, h);
}

Result<ScreenImage> loadImageFile(const std::string& path) {
    int w = 0, h = 0, channels = 0;
    unsigned char* rgba = stbi_load(path.c_str(), &w, &h, &channels, 4);
    if (!rgba) {
        std::string err = "stbi_load failed: " + path;
        TLOG_ERROR(TAG, "%s (%s)", err.c_str(), stbi_failure_reason());
        return Err<ScreenImage>(err, kErrDecode);
    }
    return Ok(fromStb(rgba, w, h));
}

} // namespace tapdeck
