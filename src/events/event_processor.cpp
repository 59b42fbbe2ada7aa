#include "devmem/events/event_processor.hpp"
#include <algorithm>
#include <future>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace devmem {

namespace {

// Clears the drain flag when a batch ends, including by exception
struct DrainGuard {
    std::atomic<bool>& flag;
    ~DrainGuard() { flag = false; }
};

double bucket_priority(EventPriority priority) {
    switch (priority) {
        case EventPriority::Critical: return 0.95;
        case EventPriority::High: return 0.75;
        case EventPriority::Medium: return 0.5;
        case EventPriority::Low: return 0.25;
    }
    return 0.5;
}

} // anonymous namespace

// ==========================================
// ProcessorConfig
// ==========================================

json ProcessorConfig::to_json() const {
    json j;
    j["batch_size"] = batch_size;
    j["processing_interval_ms"] = processing_interval_ms;
    j["max_retries"] = max_retries;
    j["critical_threshold"] = critical_threshold;
    j["pattern_window_seconds"] = pattern_window_seconds;
    j["pattern_min_occurrences"] = pattern_min_occurrences;
    j["session_buffer_limit"] = session_buffer_limit;
    j["verbose"] = verbose;
    return j;
}

ProcessorConfig ProcessorConfig::from_json(const json& j) {
    ProcessorConfig config;
    if (j.contains("batch_size")) config.batch_size = j["batch_size"];
    if (j.contains("processing_interval_ms")) config.processing_interval_ms = j["processing_interval_ms"];
    if (j.contains("max_retries")) config.max_retries = j["max_retries"];
    if (j.contains("critical_threshold")) config.critical_threshold = j["critical_threshold"];
    if (j.contains("pattern_window_seconds")) config.pattern_window_seconds = j["pattern_window_seconds"];
    if (j.contains("pattern_min_occurrences")) config.pattern_min_occurrences = j["pattern_min_occurrences"];
    if (j.contains("session_buffer_limit")) config.session_buffer_limit = j["session_buffer_limit"];
    if (j.contains("verbose")) config.verbose = j["verbose"];
    return config;
}

bool ProcessorConfig::validate(std::string& error_message) const {
    if (batch_size < 1) {
        error_message = "batch_size must be at least 1";
        return false;
    }

    if (processing_interval_ms < 1) {
        error_message = "processing_interval_ms must be at least 1";
        return false;
    }

    if (max_retries < 0) {
        error_message = "max_retries must not be negative";
        return false;
    }

    if (critical_threshold <= 0.0 || critical_threshold > 1.0) {
        error_message = "critical_threshold must be in (0, 1]";
        return false;
    }

    if (pattern_window_seconds < 1 || pattern_min_occurrences < 1 || session_buffer_limit < 1) {
        error_message = "Pattern detection window, occurrences and buffer limit must be positive";
        return false;
    }

    return true;
}

json EventStatistics::to_json() const {
    json by_type = json::object();
    for (const auto& [type, count] : events_by_type) {
        by_type[devmem::to_string(type)] = count;
    }

    json j;
    j["total_events"] = total_events;
    j["events_by_type"] = by_type;
    j["average_processing_time_ms"] = average_processing_time_ms;
    j["success_rate"] = success_rate;
    j["queue_size"] = queue_size;
    j["last_processed_time"] = to_epoch_millis(last_processed_time);
    return j;
}

template <typename Fn>
void EventProcessor::notify(Fn&& fn) const {
    std::vector<ProcessorObserver> observers;
    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        observers.reserve(observers_.size());
        for (const auto& [id, observer] : observers_) {
            observers.push_back(observer);
        }
    }

    for (const auto& observer : observers) {
        fn(observer);
    }
}

// ==========================================
// Construction
// ==========================================

EventProcessor::EventProcessor(
    std::shared_ptr<KnowledgeGraph> graph,
    std::shared_ptr<EntityExtractor> extractor,
    std::shared_ptr<MemoryStore> store,
    ProcessorConfig config
) : graph_(std::move(graph)),
    extractor_(std::move(extractor)),
    store_(std::move(store)),
    config_(std::move(config)) {

    if (!graph_ || !extractor_ || !store_) {
        throw std::invalid_argument("EventProcessor requires a graph, an extractor and a memory store");
    }

    std::string error;
    if (!config_.validate(error)) {
        throw std::invalid_argument("Invalid configuration: " + error);
    }

    stats_.last_processed_time = std::chrono::system_clock::now();

    register_handler(std::make_shared<CodeGenerationHandler>(extractor_, graph_));
    register_handler(std::make_shared<BugFixHandler>());
    register_handler(std::make_shared<TeamInteractionHandler>());
    register_handler(std::make_shared<ModeChangeHandler>());
}

EventProcessor::~EventProcessor() {
    stop();
}

// ==========================================
// Submission
// ==========================================

void EventProcessor::submit_event(const MemoryEvent& event) {
    event.validate();

    double priority = compute_priority(event);
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.enqueue(event, priority);
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.total_events++;
        stats_.events_by_type[event.type]++;
    }

    notify([&event](const ProcessorObserver& observer) {
        if (observer.on_event_received) observer.on_event_received(event);
    });

    if (priority >= config_.critical_threshold) {
        process_immediate(event);
    }
}

void EventProcessor::submit_envelope(const json& envelope) {
    submit_event(MemoryEvent::from_json(envelope));
}

void EventProcessor::resubmit(MemoryEvent event) {
    event.retry_count++;
    double priority = compute_priority(event);

    if (config_.verbose) {
        std::cout << "Retrying event " << event.id << " (attempt "
                  << event.retry_count << " of " << config_.max_retries << ")\n";
    }

    std::lock_guard<std::mutex> lock(queue_mutex_);
    queue_.enqueue(std::move(event), priority);
}

double EventProcessor::compute_priority(const MemoryEvent& event) const {
    double priority = bucket_priority(event.metadata.priority);

    auto handler = find_handler(event.type);
    if (handler) {
        priority = std::max(priority, handler->priority());
    }

    if (event.metadata.confidence > 0.8) {
        priority = std::min(1.0, priority * 1.2);
    }

    return priority;
}

// ==========================================
// Handlers and Subscriptions
// ==========================================

void EventProcessor::register_handler(std::shared_ptr<EventHandler> handler) {
    if (!handler) {
        throw std::invalid_argument("Cannot register a null event handler");
    }

    MemoryEventType type = handler->type();
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handlers_[type] = std::move(handler);
    }

    if (config_.verbose) {
        std::cout << "Registered handler for " << to_string(type) << "\n";
    }

    notify([type](const ProcessorObserver& observer) {
        if (observer.on_processor_registered) observer.on_processor_registered(type);
    });
}

bool EventProcessor::has_handler(MemoryEventType type) const {
    return find_handler(type) != nullptr;
}

std::shared_ptr<EventHandler> EventProcessor::find_handler(MemoryEventType type) const {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    auto it = handlers_.find(type);
    return it != handlers_.end() ? it->second : nullptr;
}

std::unique_ptr<EventStream> EventProcessor::create_event_stream(EventStreamOptions options) {
    return std::make_unique<EventStream>(*this, std::move(options));
}

size_t EventProcessor::subscribe(ProcessorObserver observer) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    size_t id = next_observer_id_++;
    observers_[id] = std::move(observer);
    return id;
}

void EventProcessor::unsubscribe(size_t subscription_id) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.erase(subscription_id);
}

// ==========================================
// Processing
// ==========================================

size_t EventProcessor::process_pending_batch() {
    if (processing_.exchange(true)) {
        return 0;
    }
    DrainGuard guard{processing_};

    std::vector<MemoryEvent> batch;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        while (batch.size() < config_.batch_size) {
            auto event = queue_.dequeue();
            if (!event) break;
            batch.push_back(std::move(*event));
        }
    }

    if (batch.empty()) {
        return 0;
    }

    auto start_time = std::chrono::steady_clock::now();

    std::vector<std::future<ProcessingResult>> pending;
    pending.reserve(batch.size());
    for (const auto& event : batch) {
        pending.push_back(std::async(std::launch::async, [this, &event]() {
            return process_event(event);
        }));
    }

    std::vector<ProcessingResult> results;
    results.reserve(batch.size());
    for (auto& future : pending) {
        results.push_back(future.get());
    }

    size_t success_count = 0;
    for (size_t i = 0; i < batch.size(); ++i) {
        const MemoryEvent& event = batch[i];
        const ProcessingResult& result = results[i];

        if (result.success) {
            success_count++;
            apply_result(result);
            notify([&](const ProcessorObserver& observer) {
                if (observer.on_event_processed) observer.on_event_processed(event, result);
            });
            continue;
        }

        std::cerr << "Event " << event.id << " (" << to_string(event.type)
                  << ") failed: " << result.error_message << "\n";
        notify([&](const ProcessorObserver& observer) {
            if (observer.on_event_error) observer.on_event_error(event, result.error_message);
        });

        if (event.retry_count < config_.max_retries) {
            resubmit(event);
        } else {
            std::string message = "Dropped after " + std::to_string(event.retry_count) +
                                  " retries: " + result.error_message;
            std::cerr << "Event " << event.id << " " << message << "\n";
            notify([&](const ProcessorObserver& observer) {
                if (observer.on_event_dropped) observer.on_event_dropped(event, message);
            });
        }
    }

    auto elapsed = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start_time
    ).count();
    update_statistics(batch.size(), success_count, elapsed);

    return batch.size();
}

ProcessingResult EventProcessor::process_event(const MemoryEvent& event) {
    auto handler = find_handler(event.type);

    try {
        if (!handler) {
            return default_process(event);
        }
        return handler->process(event);
    } catch (const std::exception& e) {
        return ProcessingResult::failure(e.what());
    } catch (...) {
        return ProcessingResult::failure("Unknown processor error");
    }
}

ProcessingResult EventProcessor::default_process(const MemoryEvent& event) {
    ProcessingResult result;
    result.success = true;

    if (event.data.is_string()) {
        ExtractionResult extraction = extractor_->extract(event.data.get<std::string>());
        if (!extraction.empty()) {
            graph_->add_to_graph(extraction);
            result.graph_updates.push_back({GraphOperation::AddNode, extraction.to_json()});
        }
    }

    MemoryUpdate interaction;
    interaction.type = MemoryTarget::System1;
    interaction.operation = UpdateOperation::Add;
    interaction.target = "pastInteractions";
    interaction.data = event.to_json();
    interaction.metadata = {{"timestamp", to_epoch_millis(event.timestamp)}};
    result.memory_updates.push_back(std::move(interaction));

    if (event.reasoning) {
        MemoryUpdate trace;
        trace.type = MemoryTarget::System2;
        trace.operation = UpdateOperation::Add;
        trace.target = "reasoningTraces";
        trace.data = *event.reasoning;
        trace.metadata = {{"eventId", event.id}};
        result.memory_updates.push_back(std::move(trace));
    }

    if (detect_pattern(event)) {
        result.learning_triggers.push_back({TriggerType::PatternDetected, event.to_json(), TriggerAction::Adapt});
    }

    return result;
}

bool EventProcessor::detect_pattern(const MemoryEvent& event) {
    const auto window = std::chrono::seconds(config_.pattern_window_seconds);

    std::lock_guard<std::mutex> lock(sessions_mutex_);

    // Sessions whose newest entry fell out of the window are forgotten
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (it->first != event.session_id && !it->second.empty() &&
            event.timestamp - it->second.back().timestamp >= window) {
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }

    auto& entries = sessions_[event.session_id];

    size_t recent_similar = 0;
    for (const auto& entry : entries) {
        if (entry.type == event.type && event.timestamp - entry.timestamp < window) {
            recent_similar++;
        }
    }

    // A detected repetition is not itself recorded
    if (recent_similar >= config_.pattern_min_occurrences) {
        return true;
    }

    entries.push_back({event.type, event.timestamp});
    if (entries.size() > config_.session_buffer_limit) {
        entries.pop_front();
    }
    return false;
}

void EventProcessor::process_immediate(const MemoryEvent& event) {
    if (config_.verbose) {
        std::cout << "Processing critical event " << event.id << " immediately\n";
    }

    ProcessingResult result = process_event(event);

    if (result.success) {
        apply_result(result);
        notify([&](const ProcessorObserver& observer) {
            if (observer.on_critical_processed) observer.on_critical_processed(event, result);
        });
    } else {
        std::cerr << "Critical event " << event.id << " failed: " << result.error_message << "\n";
        notify([&](const ProcessorObserver& observer) {
            if (observer.on_critical_error) observer.on_critical_error(event, result.error_message);
        });
    }
}

void EventProcessor::apply_result(const ProcessingResult& result) {
    for (const auto& update : result.memory_updates) {
        try {
            apply_update(update);
        } catch (const std::exception& e) {
            std::string message = e.what();
            std::cerr << "Memory store rejected update of " << update.target << ": " << message << "\n";
            notify([&](const ProcessorObserver& observer) {
                if (observer.on_update_error) observer.on_update_error(update, message);
            });
        }
    }

    for (const auto& trigger : result.learning_triggers) {
        notify([&trigger](const ProcessorObserver& observer) {
            if (observer.on_learning_trigger) observer.on_learning_trigger(trigger);
        });
    }
}

void EventProcessor::apply_update(const MemoryUpdate& update) {
    switch (update.type) {
        case MemoryTarget::System1:
            store_->update_system1(update);
            break;
        case MemoryTarget::System2:
            store_->update_system2(update);
            break;
        case MemoryTarget::Both:
            store_->update_system1(update);
            store_->update_system2(update);
            break;
    }
}

void EventProcessor::update_statistics(size_t batch_size, size_t success_count, double processing_ms) {
    double batch_success = static_cast<double>(success_count) / static_cast<double>(batch_size);

    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.success_rate = stats_.success_rate * 0.9 + batch_success * 0.1;
    stats_.average_processing_time_ms = stats_.average_processing_time_ms * 0.9 + processing_ms * 0.1;
    stats_.last_processed_time = std::chrono::system_clock::now();
}

EventStatistics EventProcessor::get_statistics() const {
    EventStatistics snapshot;
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        snapshot = stats_;
    }
    snapshot.queue_size = queue_size();
    return snapshot;
}

size_t EventProcessor::queue_size() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

size_t EventProcessor::tracked_sessions() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

// ==========================================
// Timer
// ==========================================

void EventProcessor::start() {
    if (running_.exchange(true)) return;

    timer_thread_ = std::thread([this]() {
        processing_loop();
    });
}

void EventProcessor::stop() {
    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        if (!running_.exchange(false)) return;
    }
    timer_cv_.notify_all();

    if (timer_thread_.joinable()) {
        timer_thread_.join();
    }
}

void EventProcessor::processing_loop() {
    const auto interval = std::chrono::milliseconds(config_.processing_interval_ms);

    while (running_) {
        {
            std::unique_lock<std::mutex> lock(timer_mutex_);
            timer_cv_.wait_for(lock, interval, [this]() { return !running_; });
        }
        if (!running_) break;

        try {
            process_pending_batch();
        } catch (const std::exception& e) {
            std::cerr << "Batch processing failed: " << e.what() << "\n";
        }
    }
}

} // namespace devmem
