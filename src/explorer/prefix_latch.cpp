#include "explorer/prefix_latch.hpp"
#include "explorer/asset_server.hpp"
#include "core/utils.hpp"

#include <format>

namespace apidocs {

bool PrefixLatch::bind(const std::string& prefix, IAssetServer& assets) {
    bool performed = false;
    std::call_once(once_, [&] {
        prefix_ = prefix;
        assets.set_prefix(prefix);
        bound_.store(true, std::memory_order_release);
        performed = true;
        utils::log::info(std::format("API explorer mounted at prefix '{}'", prefix));
    });
    return performed;
}

const std::string& PrefixLatch::prefix() const {
    static const std::string kUnbound;
    // prefix_ is written once, before bound_ is released
    return is_bound() ? prefix_ : kUnbound;
}

} // namespace apidocs
