#include "seedkeeper/client/call_budget.hpp"

namespace seedkeeper::client {

CallBudget::Permit& CallBudget::Permit::operator=(Permit&& other) noexcept {
    if (this != &other) {
        release();
        owner_ = other.owner_;
        other.owner_ = nullptr;
    }
    return *this;
}

void CallBudget::Permit::release() {
    if (owner_) {
        owner_->release_one();
        owner_ = nullptr;
    }
}

CallBudget::CallBudget(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity)
    , in_flight_(0) {
}

CallBudget::Permit CallBudget::acquire(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    
    if (!available_.wait_for(lock, timeout, [this] { return in_flight_ < capacity_; })) {
        return Permit();
    }
    
    ++in_flight_;
    return Permit(this);
}

void CallBudget::set_capacity(size_t capacity) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        capacity_ = capacity == 0 ? 1 : capacity;
    }
    available_.notify_all();
}

size_t CallBudget::capacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capacity_;
}

size_t CallBudget::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

void CallBudget::release_one() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_flight_ > 0) {
            --in_flight_;
        }
    }
    available_.notify_one();
}

} // namespace seedkeeper::client
