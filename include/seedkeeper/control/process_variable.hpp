#pragma once

#include "seedkeeper/client/client_session.hpp"
#include <memory>
#include <optional>

namespace seedkeeper::control {

// Source of the signal the rate controller regulates. An empty sample means
// the reading failed and the tick must be abandoned.
class ProcessVariableSource {
public:
    virtual ~ProcessVariableSource() = default;
    
    virtual std::optional<double> sample() = 0;
};

// Aggregate upload throughput of upload-class transfers, in KiB/s.
// Transfers without a rate sample do not contribute.
class UploadThroughputSource : public ProcessVariableSource {
public:
    explicit UploadThroughputSource(std::shared_ptr<client::ClientSession> session);
    
    std::optional<double> sample() override;
    
    const client::ClientResult& last_result() const { return last_result_; }

private:
    std::shared_ptr<client::ClientSession> session_;
    client::ClientResult last_result_;
};

} // namespace seedkeeper::control
