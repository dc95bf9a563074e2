#include "command_lock_registry.hpp"
#include "tapdeck_log.hpp"

namespace tapdeck {

std::timed_mutex& CommandLockRegistry::getLock(const std::string& identity) {
    {
        std::shared_lock<std::shared_mutex> read(mutex_);
        auto it = locks_.find(identity);
        if (it != locks_.end()) return *it->second;
    }

    std::unique_lock<std::shared_mutex> write(mutex_);
    auto it = locks_.find(identity);
    if (it != locks_.end()) return *it->second;

    auto& slot = locks_[identity];
    slot = std::make_unique<std::timed_mutex>();
    TLOG_DEBUG("cmdlock", "Created command lock for %s", identity.c_str());
    return *slot;
}

size_t CommandLockRegistry::size() const {
    std::shared_lock<std::shared_mutex> read(mutex_);
    return locks_.size();
}

} // namespace tapdeck
