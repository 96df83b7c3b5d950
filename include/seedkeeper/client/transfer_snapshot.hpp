#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace seedkeeper::client {

enum class TransferState {
    UPLOADING,
    STALLED_UPLOADING,
    FORCED_UPLOADING,
    QUEUED_UPLOADING,
    PAUSED_UPLOADING,
    CHECKING_UPLOADING,
    DOWNLOADING,
    STALLED_DOWNLOADING,
    FORCED_DOWNLOADING,
    FETCHING_METADATA,
    QUEUED_DOWNLOADING,
    PAUSED_DOWNLOADING,
    CHECKING_DOWNLOADING,
    ALLOCATING,
    MOVING,
    ERROR,
    MISSING_FILES,
    UNKNOWN
};

const char* to_string(TransferState state);

// Maps the client's wire names ("stalledUP", "pausedDL", ...) onto TransferState.
TransferState parse_transfer_state(const std::string& name);

struct TransferSnapshot {
    std::string hash;
    std::string name;
    std::string category;
    std::vector<std::string> tags;
    TransferState state = TransferState::UNKNOWN;
    double progress = 0.0;
    
    // bytes/s; empty when the client did not report a sample
    std::optional<uint64_t> upload_rate;
    std::optional<uint64_t> download_rate;
    
    std::string tracker;
    uint64_t total_size = 0;
    uint64_t uploaded = 0;
    uint64_t downloaded = 0;
    
    bool is_complete() const { return progress >= 1.0; }
};

// Queued and paused transfers are WAITING and never touched. Downloading
// states at 100% progress fall through to IGNORED.
enum class TransferClass {
    WAITING,
    UPLOAD,
    DOWNLOAD,
    IGNORED
};

TransferClass classify(const TransferSnapshot& transfer);
const char* to_string(TransferClass transfer_class);

} // namespace seedkeeper::client
