#include "seedkeeper/client/client_session.hpp"
#include "seedkeeper/core/logger.hpp"

namespace seedkeeper::client {

const char* to_string(ClientError error) {
    switch (error) {
        case ClientError::SUCCESS: return "success";
        case ClientError::TRANSIENT: return "transient";
        case ClientError::AUTHENTICATION: return "authentication";
        case ClientError::NOT_FOUND: return "not_found";
        case ClientError::BUDGET_EXHAUSTED: return "budget_exhausted";
    }
    return "unknown";
}

ClientSession::ClientSession(std::shared_ptr<TransferClient> client,
                             size_t call_budget,
                             std::chrono::milliseconds call_timeout)
    : client_(std::move(client))
    , budget_(call_budget)
    , call_timeout_ms_(call_timeout.count()) {
}

template<typename Fn>
ClientResult ClientSession::invoke(const char* operation, Fn&& fn) {
    auto permit = budget_.acquire(std::chrono::milliseconds(call_timeout_ms_.load()));
    if (!permit) {
        LOG_WARN("Client call budget exhausted, skipping {}", operation);
        return ClientResult(ClientError::BUDGET_EXHAUSTED,
                            std::string("call budget exhausted for ") + operation);
    }
    
    try {
        fn();
        return ClientResult();
    } catch (const ClientException& e) {
        permit.release();
        
        switch (e.kind()) {
            case ClientErrorKind::NOT_FOUND:
                return ClientResult(ClientError::NOT_FOUND, e.what());
                
            case ClientErrorKind::AUTHENTICATION:
                authenticated_ = false;
                LOG_WARN("{} rejected by client, re-authenticating: {}", operation, e.what());
                reauthenticate();
                return ClientResult(ClientError::AUTHENTICATION, e.what());
                
            case ClientErrorKind::TRANSIENT:
                break;
        }
        LOG_WARN("{} failed: {}", operation, e.what());
        return ClientResult(ClientError::TRANSIENT, e.what());
    } catch (const std::exception& e) {
        LOG_WARN("{} failed: {}", operation, e.what());
        return ClientResult(ClientError::TRANSIENT, e.what());
    }
}

ClientResult ClientSession::login() {
    return reauthenticate();
}

ClientResult ClientSession::reauthenticate() {
    std::promise<ClientResult> promise;
    std::shared_future<ClientResult> attempt;
    bool owner = false;
    
    {
        std::lock_guard<std::mutex> lock(login_mutex_);
        if (login_in_flight_.valid()) {
            attempt = login_in_flight_;
        } else {
            attempt = promise.get_future().share();
            login_in_flight_ = attempt;
            owner = true;
        }
    }
    
    if (!owner) {
        LOG_DEBUG("Login already in flight, waiting for its result");
        return attempt.get();
    }
    
    auto result = perform_login();
    
    {
        std::lock_guard<std::mutex> lock(login_mutex_);
        login_in_flight_ = std::shared_future<ClientResult>();
    }
    promise.set_value(result);
    return result;
}

ClientResult ClientSession::perform_login() {
    auto permit = budget_.acquire(std::chrono::milliseconds(call_timeout_ms_.load()));
    if (!permit) {
        return ClientResult(ClientError::BUDGET_EXHAUSTED, "call budget exhausted for login");
    }
    
    login_attempts_++;
    try {
        client_->login();
        authenticated_ = true;
        LOG_INFO("Logged in to transfer client");
        return ClientResult();
    } catch (const ClientException& e) {
        authenticated_ = false;
        LOG_ERROR("Login failed: {}", e.what());
        auto error = e.kind() == ClientErrorKind::AUTHENTICATION ?
            ClientError::AUTHENTICATION : ClientError::TRANSIENT;
        return ClientResult(error, e.what());
    } catch (const std::exception& e) {
        authenticated_ = false;
        LOG_ERROR("Login failed: {}", e.what());
        return ClientResult(ClientError::TRANSIENT, e.what());
    }
}

ClientResult ClientSession::list_transfers(std::vector<TransferSnapshot>& transfers) {
    return invoke("list_transfers", [&] {
        transfers = client_->list_transfers();
    });
}

ClientResult ClientSession::free_space(std::optional<uint64_t>& bytes) {
    return invoke("free_space", [&] {
        bytes = client_->free_space();
    });
}

ClientResult ClientSession::default_save_path(std::string& path) {
    return invoke("default_save_path", [&] {
        path = client_->default_save_path();
    });
}

ClientResult ClientSession::set_upload_limit(uint64_t bytes_per_second) {
    return invoke("set_upload_limit", [&] {
        client_->set_global_upload_limit(bytes_per_second);
    });
}

ClientResult ClientSession::reannounce(const std::string& hash) {
    return invoke("reannounce", [&] {
        client_->reannounce(hash);
    });
}

ClientResult ClientSession::remove(const std::string& hash, bool delete_files) {
    auto result = invoke("remove", [&] {
        client_->remove(hash, delete_files);
    });
    
    if (result.error == ClientError::NOT_FOUND) {
        LOG_INFO("Transfer {} already absent, treating removal as done", hash);
        return ClientResult();
    }
    return result;
}

void ClientSession::configure(size_t call_budget, std::chrono::milliseconds call_timeout) {
    budget_.set_capacity(call_budget);
    call_timeout_ms_ = call_timeout.count();
}

} // namespace seedkeeper::client
