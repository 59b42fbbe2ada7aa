#ifndef DEVMEM_EVENTS_EVENT_STREAM_HPP
#define DEVMEM_EVENTS_EVENT_STREAM_HPP

#include "devmem/events/memory_event.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace devmem {

class EventProcessor;

struct EventStreamOptions {
    std::function<bool(const MemoryEvent&)> filter;            // Empty: accept all
    std::function<MemoryEvent(const MemoryEvent&)> transform;  // Empty: identity
    size_t buffer_size = 0;                                     // 0: emit each event
};

/**
 * @brief Live filtered view over events submitted to an EventProcessor
 *
 * Each submission passes the filter, then the transform. Without buffering
 * the data callback receives every event; with buffer_size N the batch
 * callback receives groups of N, and flush() emits any remainder.
 *
 * A stream must not outlive the processor that created it. Destroying the
 * stream stops delivery.
 */
class EventStream {
public:
    using DataCallback = std::function<void(const MemoryEvent&)>;
    using BatchCallback = std::function<void(const std::vector<MemoryEvent>&)>;

    EventStream(EventProcessor& processor, EventStreamOptions options);
    ~EventStream();

    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;

    void on_data(DataCallback callback);
    void on_batch(BatchCallback callback);

    /**
     * @brief Emit buffered events as one batch; no-op when empty
     */
    void flush();

    size_t buffered() const;

private:
    struct State {
        std::mutex mutex;
        EventStreamOptions options;
        std::vector<MemoryEvent> buffer;
        DataCallback on_data;
        BatchCallback on_batch;

        void handle(const MemoryEvent& event);
    };

    EventProcessor& processor_;
    std::shared_ptr<State> state_;
    size_t subscription_id_ = 0;
};

} // namespace devmem

#endif // DEVMEM_EVENTS_EVENT_STREAM_HPP
