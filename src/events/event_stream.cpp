#include "devmem/events/event_stream.hpp"
#include "devmem/events/event_processor.hpp"

namespace devmem {

EventStream::EventStream(EventProcessor& processor, EventStreamOptions options)
    : processor_(processor), state_(std::make_shared<State>()) {
    state_->options = std::move(options);

    // The observer holds the state, not the stream, so delivery racing with
    // destruction touches live memory.
    std::shared_ptr<State> state = state_;
    ProcessorObserver observer;
    observer.on_event_received = [state](const MemoryEvent& event) {
        state->handle(event);
    };
    subscription_id_ = processor_.subscribe(std::move(observer));
}

EventStream::~EventStream() {
    processor_.unsubscribe(subscription_id_);
}

void EventStream::on_data(DataCallback callback) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->on_data = std::move(callback);
}

void EventStream::on_batch(BatchCallback callback) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->on_batch = std::move(callback);
}

void EventStream::flush() {
    std::vector<MemoryEvent> batch;
    BatchCallback callback;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->buffer.empty()) return;
        batch.swap(state_->buffer);
        callback = state_->on_batch;
    }

    if (callback) {
        callback(batch);
    }
}

size_t EventStream::buffered() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->buffer.size();
}

void EventStream::State::handle(const MemoryEvent& event) {
    std::function<bool(const MemoryEvent&)> filter;
    std::function<MemoryEvent(const MemoryEvent&)> transform;
    {
        std::lock_guard<std::mutex> lock(mutex);
        filter = options.filter;
        transform = options.transform;
    }

    if (filter && !filter(event)) {
        return;
    }
    MemoryEvent item = transform ? transform(event) : event;

    std::vector<MemoryEvent> batch;
    BatchCallback batch_callback;
    DataCallback data_callback;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (options.buffer_size > 0) {
            buffer.push_back(std::move(item));
            if (buffer.size() < options.buffer_size) {
                return;
            }
            batch.swap(buffer);
            batch_callback = on_batch;
        } else {
            data_callback = on_data;
        }
    }

    if (!batch.empty()) {
        if (batch_callback) batch_callback(batch);
    } else if (data_callback) {
        data_callback(item);
    }
}

} // namespace devmem
