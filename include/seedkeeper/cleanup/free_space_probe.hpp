#pragma once

#include "seedkeeper/client/client_session.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>

namespace seedkeeper::cleanup {

// Free space as reported by the client, falling back to a local filesystem
// query on the configured path or, failing that, the client's save path.
class FreeSpaceProbe {
public:
    FreeSpaceProbe(std::shared_ptr<client::ClientSession> session,
                   std::filesystem::path fallback_path);
    
    std::optional<uint64_t> probe();

private:
    std::shared_ptr<client::ClientSession> session_;
    std::filesystem::path fallback_path_;
};

} // namespace seedkeeper::cleanup
