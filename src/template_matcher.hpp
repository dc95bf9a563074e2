#pragma once
// =============================================================================
// Tapdeck - Template Matcher (CPU, grayscale NCC)
// =============================================================================
// Locates a needle image inside a screen capture with zero-mean normalized
// cross-correlation. Coarse-to-fine: the full search runs on a downsampled
// pyramid level, candidates are refined at full resolution.
// =============================================================================

#include "screen_image.hpp"

#include <optional>
#include <vector>

namespace tapdeck::vision {

// Search rectangle in haystack pixels; w/h <= 0 means the whole image.
struct Region {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;

    bool whole() const { return w <= 0 || h <= 0; }
};

struct MatchResult {
    int x = 0;            // top-left in haystack coordinates
    int y = 0;
    float score = 0.0f;   // NCC, -1..1
    int width = 0;        // needle size
    int height = 0;
    int center_x = 0;
    int center_y = 0;
};

struct MatchConfig {
    int pyramid_levels = 3;        // including full resolution
    int min_level_needle = 12;     // smallest needle side allowed on a coarse level
    float coarse_margin = 0.15f;   // coarse candidates need threshold - margin
    int refine_radius = 3;         // full-res search radius around a candidate
    size_t max_candidates = 256;
};

class TemplateMatcher {
public:
    explicit TemplateMatcher(MatchConfig cfg = MatchConfig()) : cfg_(cfg) {}

    // Best location scoring at least threshold, or nullopt.
    std::optional<MatchResult> findBest(const GrayImage& haystack, const GrayImage& needle,
                                        float threshold = 0.9f, Region region = Region()) const;

    // Every location scoring at least threshold, best first. Matches whose
    // centers lie closer than half the needle diagonal to a better one are
    // dropped.
    std::vector<MatchResult> findAll(const GrayImage& haystack, const GrayImage& needle,
                                     float threshold = 0.9f, Region region = Region()) const;

    // Exact score at one top-left position; 0 when out of bounds.
    static float scoreAt(const GrayImage& haystack, const GrayImage& needle, int x, int y);

    const MatchConfig& config() const { return cfg_; }

private:
    std::vector<MatchResult> candidates(const GrayImage& haystack, const GrayImage& needle,
                                        float threshold, Region region) const;

    MatchConfig cfg_;
};

// Half-resolution 2x2 box downsample.
GrayImage downsample(const GrayImage& img);

} // namespace tapdeck::vision
