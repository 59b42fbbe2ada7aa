#include "devmem/events/event_queue.hpp"
#include <algorithm>

namespace devmem {

void EventQueue::enqueue(MemoryEvent event, double priority) {
    auto position = std::find_if(items_.begin(), items_.end(), [priority](const Entry& entry) {
        return entry.priority < priority;
    });
    items_.insert(position, Entry{std::move(event), priority});
}

std::optional<MemoryEvent> EventQueue::dequeue() {
    if (items_.empty()) {
        return std::nullopt;
    }
    MemoryEvent event = std::move(items_.front().event);
    items_.pop_front();
    return event;
}

std::optional<double> EventQueue::peek_priority() const {
    if (items_.empty()) {
        return std::nullopt;
    }
    return items_.front().priority;
}

} // namespace devmem
