#include "template_matcher.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace tapdeck::vision {

namespace {

// Summed-area tables for window mean / variance.
struct Integral {
    int w = 0, h = 0;
    std::vector<uint64_t> sum;
    std::vector<uint64_t> sq;

    explicit Integral(const GrayImage& img) : w(img.width), h(img.height),
        sum((size_t)(w + 1) * (h + 1), 0), sq((size_t)(w + 1) * (h + 1), 0) {
        for (int y = 0; y < h; ++y) {
            uint64_t row_sum = 0, row_sq = 0;
            for (int x = 0; x < w; ++x) {
                uint64_t v = img.at(x, y);
                row_sum += v;
                row_sq += v * v;
                size_t i = (size_t)(y + 1) * (w + 1) + (x + 1);
                sum[i] = sum[i - (w + 1)] + row_sum;
                sq[i] = sq[i - (w + 1)] + row_sq;
            }
        }
    }

    uint64_t rect(const std::vector<uint64_t>& t, int x, int y, int rw, int rh) const {
        size_t stride = (size_t)w + 1;
        return t[(size_t)(y + rh) * stride + (x + rw)] - t[(size_t)y * stride + (x + rw)]
             - t[(size_t)(y + rh) * stride + x] + t[(size_t)y * stride + x];
    }
};

struct NeedleStats {
    int w = 0, h = 0;
    double mean = 0.0;
    double sum_tt = 0.0;            // sum of squared centered values
    std::vector<float> centered;

    explicit NeedleStats(const GrayImage& n) : w(n.width), h(n.height), centered(n.data.size()) {
        double total = 0.0;
        for (uint8_t v : n.data) total += v;
        mean = n.data.empty() ? 0.0 : total / (double)n.data.size();
        for (size_t i = 0; i < n.data.size(); ++i) {
            centered[i] = (float)(n.data[i] - mean);
            sum_tt += (double)centered[i] * centered[i];
        }
    }
};

float ncc(const GrayImage& hay, const Integral& ii, const NeedleStats& ns, int x, int y) {
    const double n = (double)ns.w * ns.h;
    const double s = (double)ii.rect(ii.sum, x, y, ns.w, ns.h);
    const double ss = (double)ii.rect(ii.sq, x, y, ns.w, ns.h);
    const double var_i = ss - s * s / n;

    // Flat needle: only an equally flat window of the same level matches.
    if (ns.sum_tt < 1e-6) {
        if (var_i > 1e-6) return 0.0f;
        return std::fabs(s / n - ns.mean) < 1.0 ? 1.0f : 0.0f;
    }
    if (var_i < 1e-6) return 0.0f;

    double dot = 0.0;
    for (int ty = 0; ty < ns.h; ++ty) {
        const uint8_t* row = &hay.data[(size_t)(y + ty) * hay.width + x];
        const float* trow = &ns.centered[(size_t)ty * ns.w];
        for (int tx = 0; tx < ns.w; ++tx) dot += (double)row[tx] * trow[tx];
    }
    return (float)(dot / std::sqrt(var_i * ns.sum_tt));
}

GrayImage crop(const GrayImage& img, const Region& r) {
    GrayImage out;
    out.width = r.w;
    out.height = r.h;
    out.data.resize((size_t)r.w * r.h);
    for (int y = 0; y < r.h; ++y) {
        std::copy_n(&img.data[(size_t)(r.y + y) * img.width + r.x], r.w,
                    &out.data[(size_t)y * r.w]);
    }
    return out;
}

} // anonymous namespace

GrayImage downsample(const GrayImage& img) {
    GrayImage out;
    out.width = img.width / 2;
    out.height = img.height / 2;
    out.data.resize((size_t)out.width * out.height);
    for (int y = 0; y < out.height; ++y) {
        for (int x = 0; x < out.width; ++x) {
            int s = img.at(2 * x, 2 * y) + img.at(2 * x + 1, 2 * y)
                  + img.at(2 * x, 2 * y + 1) + img.at(2 * x + 1, 2 * y + 1);
            out.data[(size_t)y * out.width + x] = (uint8_t)((s + 2) / 4);
        }
    }
    return out;
}

float TemplateMatcher::scoreAt(const GrayImage& haystack, const GrayImage& needle, int x, int y) {
    if (needle.empty() || haystack.empty()) return 0.0f;
    if (x < 0 || y < 0 || x + needle.width > haystack.width || y + needle.height > haystack.height) {
        return 0.0f;
    }
    Integral ii(haystack);
    NeedleStats ns(needle);
    return ncc(haystack, ii, ns, x, y);
}

std::vector<MatchResult> TemplateMatcher::candidates(const GrayImage& haystack,
                                                     const GrayImage& needle,
                                                     float threshold, Region region) const {
    std::vector<MatchResult> out;
    if (haystack.empty() || needle.empty()) return out;

    Region roi = region.whole() ? Region{0, 0, haystack.width, haystack.height} : region;
    roi.x = std::clamp(roi.x, 0, haystack.width);
    roi.y = std::clamp(roi.y, 0, haystack.height);
    roi.w = std::min(roi.w, haystack.width - roi.x);
    roi.h = std::min(roi.h, haystack.height - roi.y);
    if (roi.w < needle.width || roi.h < needle.height) return out;

    const GrayImage hay = (roi.x == 0 && roi.y == 0 && roi.w == haystack.width &&
                           roi.h == haystack.height) ? haystack : crop(haystack, roi);

    // Pick the coarsest level the needle survives.
    int level = 0;
    while (level + 1 < cfg_.pyramid_levels &&
           (needle.width >> (level + 1)) >= cfg_.min_level_needle &&
           (needle.height >> (level + 1)) >= cfg_.min_level_needle) {
        ++level;
    }

    GrayImage hay_l = hay;
    GrayImage needle_l = needle;
    for (int i = 0; i < level; ++i) {
        hay_l = downsample(hay_l);
        needle_l = downsample(needle_l);
    }

    struct Coarse { int x, y; float score; };
    std::vector<Coarse> coarse;
    {
        Integral ii(hay_l);
        NeedleStats ns(needle_l);
        const float coarse_threshold = level == 0 ? threshold : threshold - cfg_.coarse_margin;
        for (int y = 0; y + ns.h <= hay_l.height; ++y) {
            for (int x = 0; x + ns.w <= hay_l.width; ++x) {
                float s = ncc(hay_l, ii, ns, x, y);
                if (s >= coarse_threshold) coarse.push_back({x, y, s});
            }
        }
    }
    std::sort(coarse.begin(), coarse.end(),
              [](const Coarse& a, const Coarse& b) { return a.score > b.score; });
    if (coarse.size() > cfg_.max_candidates) coarse.resize(cfg_.max_candidates);

    Integral ii(hay);
    NeedleStats ns(needle);
    const int scale = 1 << level;
    const int radius = level == 0 ? 0 : cfg_.refine_radius + scale;

    for (const auto& c : coarse) {
        MatchResult best;
        best.score = -2.0f;
        const int cx = c.x * scale, cy = c.y * scale;
        for (int y = std::max(0, cy - radius); y <= std::min(hay.height - needle.height, cy + radius); ++y) {
            for (int x = std::max(0, cx - radius); x <= std::min(hay.width - needle.width, cx + radius); ++x) {
                float s = ncc(hay, ii, ns, x, y);
                if (s > best.score) {
                    best.score = s;
                    best.x = x;
                    best.y = y;
                }
            }
        }
        if (best.score < threshold) continue;

        best.x += roi.x;
        best.y += roi.y;
        best.width = needle.width;
        best.height = needle.height;
        best.center_x = best.x + needle.width / 2;
        best.center_y = best.y + needle.height / 2;
        out.push_back(best);
    }

    std::sort(out.begin(), out.end(),
              [](const MatchResult& a, const MatchResult& b) { return a.score > b.score; });
    return out;
}

std::optional<MatchResult> TemplateMatcher::findBest(const GrayImage& haystack, const GrayImage& needle,
                                                     float threshold, Region region) const {
    auto all = candidates(haystack, needle, threshold, region);
    if (all.empty()) return std::nullopt;
    return all.front();
}

std::vector<MatchResult> TemplateMatcher::findAll(const GrayImage& haystack, const GrayImage& needle,
                                                  float threshold, Region region) const {
    auto all = candidates(haystack, needle, threshold, region);

    const double min_dist = std::sqrt((double)needle.width * needle.width +
                                      (double)needle.height * needle.height) / 2.0;
    std::vector<MatchResult> kept;
    for (const auto& m : all) {
        bool overlaps = false;
        for (const auto& k : kept) {
            double dx = m.center_x - k.center_x;
            double dy = m.center_y - k.center_y;
            if (std::sqrt(dx * dx + dy * dy) < min_dist) {
                overlaps = true;
                break;
            }
        }
        if (!overlaps) kept.push_back(m);
    }
    return kept;
}

} // namespace tapdeck::vision
