#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace apidocs {

class IAssetServer;

/**
 * @brief Latches the mount prefix observed on the first request
 *
 * The prefix is chosen by the embedding application when it registers the
 * route, so it is only known once a request arrives. bind() writes it into
 * the asset server exactly once; concurrent first callers wait for that
 * single write and then all observe the same value.
 */
class PrefixLatch {
public:
    PrefixLatch() = default;
    PrefixLatch(const PrefixLatch&) = delete;
    PrefixLatch& operator=(const PrefixLatch&) = delete;

    /// Returns true only for the call that performed the write.
    bool bind(const std::string& prefix, IAssetServer& assets);

    [[nodiscard]] bool is_bound() const {
        return bound_.load(std::memory_order_acquire);
    }

    /// Latched prefix; empty until bind() has run.
    [[nodiscard]] const std::string& prefix() const;

private:
    std::once_flag once_;
    std::atomic<bool> bound_{false};
    std::string prefix_;
};

} // namespace apidocs
