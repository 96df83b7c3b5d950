#include "seedkeeper/cleanup/free_space_probe.hpp"
#include "seedkeeper/core/logger.hpp"
#include "seedkeeper/core/utils.hpp"

namespace seedkeeper::cleanup {

using core::utils::FileUtils;

FreeSpaceProbe::FreeSpaceProbe(std::shared_ptr<client::ClientSession> session,
                               std::filesystem::path fallback_path)
    : session_(std::move(session)), fallback_path_(std::move(fallback_path)) {
}

std::optional<uint64_t> FreeSpaceProbe::probe() {
    std::optional<uint64_t> reported;
    auto result = session_->free_space(reported);
    if (result && reported) {
        return reported;
    }
    
    std::filesystem::path path = fallback_path_;
    if (path.empty()) {
        std::string save_path;
        if (!session_->default_save_path(save_path) || save_path.empty()) {
            LOG_DEBUG("No free space source available");
            return std::nullopt;
        }
        path = FileUtils::expand_home(save_path);
    }
    
    auto local = FileUtils::available_space(path);
    if (!local) {
        LOG_WARN("Cannot query free space on {}", path.string());
    }
    return local;
}

} // namespace seedkeeper::cleanup
