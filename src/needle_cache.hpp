#pragma once
// =============================================================================
// Tapdeck - Needle Cache
// =============================================================================
// Process-wide cache of needle (template) images, one set per folder. A folder
// is scanned once; afterwards the set is shared read-only between bots.
// =============================================================================

#include "screen_image.hpp"

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace tapdeck::vision {

struct Needle {
    std::string name;   // file stem
    std::string path;
    GrayImage gray;
};

using NeedleSet = std::unordered_map<std::string, Needle>;

class NeedleCache {
public:
    static NeedleCache& instance();

    NeedleCache() = default;

    // Loads every .png/.jpg/.jpeg/.bmp in folder on first use. A missing
    // folder yields an empty set (logged). Unreadable files are skipped.
    std::shared_ptr<const NeedleSet> load(const std::string& folder);

    bool contains(const std::string& folder) const;
    size_t folderCount() const;
    void clear();

    static std::string normalize(const std::string& folder);

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<const NeedleSet>> sets_;
};

} // namespace tapdeck::vision
