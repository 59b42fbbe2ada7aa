#ifndef DEVMEM_EVENTS_EVENT_QUEUE_HPP
#define DEVMEM_EVENTS_EVENT_QUEUE_HPP

#include "devmem/events/memory_event.hpp"
#include <deque>
#include <optional>

namespace devmem {

/**
 * @brief Priority-ordered event queue, FIFO among equal priorities
 *
 * A new entry is inserted before the first entry with strictly lower
 * priority. Not synchronized; the owner guards access.
 */
class EventQueue {
public:
    void enqueue(MemoryEvent event, double priority);

    /**
     * @brief Remove and return the highest-priority event
     */
    std::optional<MemoryEvent> dequeue();

    /**
     * @brief Priority of the entry dequeue() would return next
     */
    std::optional<double> peek_priority() const;

    bool empty() const { return items_.empty(); }
    size_t size() const { return items_.size(); }
    void clear() { items_.clear(); }

private:
    struct Entry {
        MemoryEvent event;
        double priority;
    };

    std::deque<Entry> items_;
};

} // namespace devmem

#endif // DEVMEM_EVENTS_EVENT_QUEUE_HPP
