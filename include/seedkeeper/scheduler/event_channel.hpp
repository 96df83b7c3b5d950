#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <limits>
#include <mutex>
#include <string>
#include <vector>

namespace seedkeeper::scheduler {

enum class EventSeverity {
    INFO,
    WARNING,
    ERROR
};

const char* to_string(EventSeverity severity);

struct Event {
    std::chrono::system_clock::time_point at;
    EventSeverity severity = EventSeverity::INFO;
    std::string source;
    std::string message;
};

// Bounded outbound queue drained by the notification side. Publishing never
// blocks; when full the oldest event is dropped.
class EventChannel {
public:
    explicit EventChannel(size_t capacity = 256);
    
    void publish(Event event);
    void publish(EventSeverity severity, std::string source, std::string message);
    
    bool try_pop(Event& event);
    std::vector<Event> drain(size_t max_events = std::numeric_limits<size_t>::max());
    
    size_t size() const;
    size_t capacity() const { return capacity_; }
    uint64_t dropped() const;

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<Event> events_;
    uint64_t dropped_ = 0;
};

} // namespace seedkeeper::scheduler
