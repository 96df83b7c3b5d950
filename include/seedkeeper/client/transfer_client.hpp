#pragma once

#include "transfer_snapshot.hpp"
#include <stdexcept>
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace seedkeeper::client {

enum class ClientErrorKind {
    TRANSIENT,
    AUTHENTICATION,
    NOT_FOUND
};

class ClientException : public std::runtime_error {
public:
    ClientException(ClientErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}
    
    ClientErrorKind kind() const { return kind_; }

private:
    ClientErrorKind kind_;
};

// Adaptor for the file-sharing client's API. Implementations live outside
// this library and report failures by throwing ClientException.
class TransferClient {
public:
    virtual ~TransferClient() = default;
    
    virtual void login() = 0;
    
    virtual std::vector<TransferSnapshot> list_transfers() = 0;
    
    // Free space as seen by the client's host; empty when the client
    // does not report it.
    virtual std::optional<uint64_t> free_space() = 0;
    virtual std::string default_save_path() = 0;
    
    virtual void set_global_upload_limit(uint64_t bytes_per_second) = 0;
    
    virtual void reannounce(const std::string& hash) = 0;
    virtual void remove(const std::string& hash, bool delete_files) = 0;
};

} // namespace seedkeeper::client
