#include "seedkeeper/client/transfer_snapshot.hpp"
#include <unordered_map>

namespace seedkeeper::client {

const char* to_string(TransferState state) {
    switch (state) {
        case TransferState::UPLOADING: return "uploading";
        case TransferState::STALLED_UPLOADING: return "stalledUP";
        case TransferState::FORCED_UPLOADING: return "forcedUP";
        case TransferState::QUEUED_UPLOADING: return "queuedUP";
        case TransferState::PAUSED_UPLOADING: return "pausedUP";
        case TransferState::CHECKING_UPLOADING: return "checkingUP";
        case TransferState::DOWNLOADING: return "downloading";
        case TransferState::STALLED_DOWNLOADING: return "stalledDL";
        case TransferState::FORCED_DOWNLOADING: return "forcedDL";
        case TransferState::FETCHING_METADATA: return "metaDL";
        case TransferState::QUEUED_DOWNLOADING: return "queuedDL";
        case TransferState::PAUSED_DOWNLOADING: return "pausedDL";
        case TransferState::CHECKING_DOWNLOADING: return "checkingDL";
        case TransferState::ALLOCATING: return "allocating";
        case TransferState::MOVING: return "moving";
        case TransferState::ERROR: return "error";
        case TransferState::MISSING_FILES: return "missingFiles";
        case TransferState::UNKNOWN: return "unknown";
    }
    return "unknown";
}

TransferState parse_transfer_state(const std::string& name) {
    static const std::unordered_map<std::string, TransferState> states = {
        {"uploading", TransferState::UPLOADING},
        {"stalledUP", TransferState::STALLED_UPLOADING},
        {"forcedUP", TransferState::FORCED_UPLOADING},
        {"queuedUP", TransferState::QUEUED_UPLOADING},
        {"pausedUP", TransferState::PAUSED_UPLOADING},
        {"stoppedUP", TransferState::PAUSED_UPLOADING},
        {"checkingUP", TransferState::CHECKING_UPLOADING},
        {"downloading", TransferState::DOWNLOADING},
        {"stalledDL", TransferState::STALLED_DOWNLOADING},
        {"forcedDL", TransferState::FORCED_DOWNLOADING},
        {"metaDL", TransferState::FETCHING_METADATA},
        {"forcedMetaDL", TransferState::FETCHING_METADATA},
        {"queuedDL", TransferState::QUEUED_DOWNLOADING},
        {"pausedDL", TransferState::PAUSED_DOWNLOADING},
        {"stoppedDL", TransferState::PAUSED_DOWNLOADING},
        {"checkingDL", TransferState::CHECKING_DOWNLOADING},
        {"checkingResumeData", TransferState::CHECKING_DOWNLOADING},
        {"allocating", TransferState::ALLOCATING},
        {"moving", TransferState::MOVING},
        {"error", TransferState::ERROR},
        {"missingFiles", TransferState::MISSING_FILES},
    };
    
    auto it = states.find(name);
    return it != states.end() ? it->second : TransferState::UNKNOWN;
}

TransferClass classify(const TransferSnapshot& transfer) {
    switch (transfer.state) {
        case TransferState::QUEUED_UPLOADING:
        case TransferState::PAUSED_UPLOADING:
        case TransferState::QUEUED_DOWNLOADING:
        case TransferState::PAUSED_DOWNLOADING:
            return TransferClass::WAITING;
            
        case TransferState::UPLOADING:
        case TransferState::STALLED_UPLOADING:
        case TransferState::FORCED_UPLOADING:
            return TransferClass::UPLOAD;
            
        case TransferState::DOWNLOADING:
        case TransferState::STALLED_DOWNLOADING:
        case TransferState::FORCED_DOWNLOADING:
        case TransferState::FETCHING_METADATA:
            return transfer.is_complete() ? TransferClass::IGNORED : TransferClass::DOWNLOAD;
            
        default:
            return TransferClass::IGNORED;
    }
}

const char* to_string(TransferClass transfer_class) {
    switch (transfer_class) {
        case TransferClass::WAITING: return "waiting";
        case TransferClass::UPLOAD: return "upload";
        case TransferClass::DOWNLOAD: return "download";
        case TransferClass::IGNORED: return "ignored";
    }
    return "ignored";
}

} // namespace seedkeeper::client
