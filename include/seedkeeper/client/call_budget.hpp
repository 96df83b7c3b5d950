#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace seedkeeper::client {

// Caps the number of outstanding calls to the client API across all tasks.
class CallBudget {
public:
    class Permit {
    public:
        Permit() = default;
        explicit Permit(CallBudget* owner) : owner_(owner) {}
        ~Permit() { release(); }
        
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;
        Permit(Permit&& other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }
        Permit& operator=(Permit&& other) noexcept;
        
        explicit operator bool() const { return owner_ != nullptr; }
        void release();
        
    private:
        CallBudget* owner_ = nullptr;
    };
    
    explicit CallBudget(size_t capacity);
    
    // Empty permit when no slot frees up within the timeout.
    Permit acquire(std::chrono::milliseconds timeout);
    
    void set_capacity(size_t capacity);
    size_t capacity() const;
    size_t in_flight() const;

private:
    void release_one();
    
    size_t capacity_;
    size_t in_flight_;
    mutable std::mutex mutex_;
    std::condition_variable available_;
};

} // namespace seedkeeper::client
