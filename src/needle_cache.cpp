#include "needle_cache.hpp"
#include "tapdeck_log.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <mutex>

namespace fs = std::filesystem;

static constexpr const char* TAG = "needles";

namespace tapdeck::vision {

namespace {

bool isNeedleFile(const fs::path& p) {
    auto ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".bmp";
}

std::shared_ptr<const NeedleSet> scanFolder(const std::string& folder) {
    auto set = std::make_shared<NeedleSet>();

    std::error_code ec;
    if (!fs::is_directory(folder, ec)) {
        TLOG_WARN(TAG, "Needle folder not found: %s", folder.c_str());
        return set;
    }

    for (const auto& entry : fs::directory_iterator(folder, ec)) {
        if (!entry.is_regular_file()) continue;
        const fs::path& p = entry.path();
        if (!isNeedleFile(p)) continue;

        auto img = loadImageFile(p.string());
        if (!img) {
            TLOG_WARN(TAG, "Skipping %s: %s", p.string().c_str(), img.error().message.c_str());
            continue;
        }
        Needle n;
        n.name = p.stem().string();
        n.path = p.string();
        n.gray = img.value().toGray();
        (*set)[n.name] = std::move(n);
    }
    if (ec) {
        TLOG_WARN(TAG, "Error scanning %s: %s", folder.c_str(), ec.message().c_str());
    }

    TLOG_INFO(TAG, "Loaded %zu needles from %s", set->size(), folder.c_str());
    return set;
}

} // anonymous namespace

NeedleCache& NeedleCache::instance() {
    static NeedleCache cache;
    return cache;
}

std::string NeedleCache::normalize(const std::string& folder) {
    std::error_code ec;
    fs::path p = fs::weakly_canonical(fs::path(folder), ec);
    if (ec) p = fs::path(folder).lexically_normal();
    std::string s = p.string();
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}

std::shared_ptr<const NeedleSet> NeedleCache::load(const std::string& folder) {
    const std::string key = normalize(folder);
    {
        std::shared_lock<std::shared_mutex> read(mutex_);
        auto it = sets_.find(key);
        if (it != sets_.end()) return it->second;
    }

    std::unique_lock<std::shared_mutex> write(mutex_);
    auto it = sets_.find(key);
    if (it != sets_.end()) return it->second;

    auto set = scanFolder(key);
    sets_[key] = set;
    return set;
}

bool NeedleCache::contains(const std::string& folder) const {
    std::shared_lock<std::shared_mutex> read(mutex_);
    return sets_.count(normalize(folder)) > 0;
}

size_t NeedleCache::folderCount() const {
    std::shared_lock<std::shared_mutex> read(mutex_);
    return sets_.size();
}

void NeedleCache::clear() {
    std::unique_lock<std::shared_mutex> write(mutex_);
    sets_.clear();
}

} // namespace tapdeck::vision
