#pragma once

#include "transfer_client.hpp"
#include "call_budget.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace seedkeeper::client {

enum class ClientError {
    SUCCESS = 0,
    TRANSIENT,
    AUTHENTICATION,
    NOT_FOUND,
    BUDGET_EXHAUSTED
};

const char* to_string(ClientError error);

struct ClientResult {
    ClientError error;
    std::string message;
    
    ClientResult(ClientError err = ClientError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}
    
    bool success() const { return error == ClientError::SUCCESS; }
    operator bool() const { return success(); }
};

// Single authenticated handle shared by every task. Calls may run
// concurrently up to the call budget; re-login is serialized so that only
// one attempt is in flight and other callers wait for its outcome.
class ClientSession {
public:
    ClientSession(std::shared_ptr<TransferClient> client,
                  size_t call_budget,
                  std::chrono::milliseconds call_timeout);
    
    ClientResult login();
    ClientResult reauthenticate();
    
    ClientResult list_transfers(std::vector<TransferSnapshot>& transfers);
    ClientResult free_space(std::optional<uint64_t>& bytes);
    ClientResult default_save_path(std::string& path);
    ClientResult set_upload_limit(uint64_t bytes_per_second);
    ClientResult reannounce(const std::string& hash);
    
    // A transfer that is already gone counts as removed.
    ClientResult remove(const std::string& hash, bool delete_files);
    
    void configure(size_t call_budget, std::chrono::milliseconds call_timeout);
    
    bool authenticated() const { return authenticated_.load(); }
    uint64_t login_attempts() const { return login_attempts_.load(); }
    size_t in_flight() const { return budget_.in_flight(); }

private:
    template<typename Fn>
    ClientResult invoke(const char* operation, Fn&& fn);
    
    ClientResult perform_login();
    
    std::shared_ptr<TransferClient> client_;
    CallBudget budget_;
    std::atomic<int64_t> call_timeout_ms_;
    
    std::mutex login_mutex_;
    std::shared_future<ClientResult> login_in_flight_;
    std::atomic<uint64_t> login_attempts_{0};
    std::atomic<bool> authenticated_{false};
};

} // namespace seedkeeper::client
