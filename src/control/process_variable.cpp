#include "seedkeeper/control/process_variable.hpp"

namespace seedkeeper::control {

UploadThroughputSource::UploadThroughputSource(std::shared_ptr<client::ClientSession> session)
    : session_(std::move(session)) {
}

std::optional<double> UploadThroughputSource::sample() {
    std::vector<client::TransferSnapshot> transfers;
    last_result_ = session_->list_transfers(transfers);
    if (!last_result_) {
        return std::nullopt;
    }
    
    uint64_t total = 0;
    for (const auto& transfer : transfers) {
        if (client::classify(transfer) == client::TransferClass::UPLOAD && transfer.upload_rate) {
            total += *transfer.upload_rate;
        }
    }
    return static_cast<double>(total) / 1024.0;
}

} // namespace seedkeeper::control
