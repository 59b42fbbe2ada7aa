#ifndef DEVMEM_EVENTS_EVENT_PROCESSOR_HPP
#define DEVMEM_EVENTS_EVENT_PROCESSOR_HPP

#include "devmem/events/memory_event.hpp"
#include "devmem/events/event_queue.hpp"
#include "devmem/events/event_handlers.hpp"
#include "devmem/events/event_stream.hpp"
#include "devmem/memory/memory_store.hpp"
#include "devmem/extraction/entity_extractor.hpp"
#include "devmem/graph/knowledge_graph.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>

namespace devmem {

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Configuration for the event pipeline
 */
struct ProcessorConfig {
    size_t batch_size = 10;
    int processing_interval_ms = 1000;
    int max_retries = 3;
    double critical_threshold = 0.9;                   // Priority at or above: process immediately

    // Session repetition detection
    int pattern_window_seconds = 60;
    size_t pattern_min_occurrences = 3;
    size_t session_buffer_limit = 100;

    bool verbose = false;

    nlohmann::json to_json() const;

    /**
     * @brief Parse configuration; missing keys keep their defaults
     */
    static ProcessorConfig from_json(const nlohmann::json& j);

    bool validate(std::string& error_message) const;
};

// ============================================================================
// Statistics and Signals
// ============================================================================

struct EventStatistics {
    size_t total_events = 0;
    std::map<MemoryEventType, size_t> events_by_type;
    double average_processing_time_ms = 0.0;           // EWMA over batches
    double success_rate = 1.0;                         // EWMA over batches
    size_t queue_size = 0;
    std::chrono::system_clock::time_point last_processed_time;

    nlohmann::json to_json() const;
};

/**
 * @brief Optional callbacks for pipeline signals
 *
 * Callbacks run outside internal locks on the thread that produced the
 * signal. Unset members are skipped.
 */
struct ProcessorObserver {
    std::function<void(const MemoryEvent&)> on_event_received;
    std::function<void(const MemoryEvent&, const ProcessingResult&)> on_event_processed;
    std::function<void(const MemoryEvent&, const std::string&)> on_event_error;
    std::function<void(const MemoryEvent&, const std::string&)> on_event_dropped;
    std::function<void(const MemoryUpdate&, const std::string&)> on_update_error;
    std::function<void(const LearningTrigger&)> on_learning_trigger;
    std::function<void(const MemoryEvent&, const ProcessingResult&)> on_critical_processed;
    std::function<void(const MemoryEvent&, const std::string&)> on_critical_error;
    std::function<void(MemoryEventType)> on_processor_registered;
};

// ============================================================================
// Event Processor
// ============================================================================

/**
 * @brief Priority-ordered, batched event pipeline feeding the graph and the
 *        memory store
 *
 * submit_event() validates, prioritizes and queues an event. Events at or
 * above the critical threshold are additionally processed right away on the
 * caller's thread; they are still drained with their batch later.
 *
 * Batches are drained by process_pending_batch(), either directly or by the
 * timer thread started with start(). The handlers of one batch run
 * concurrently and are joined before results are applied. A drain that
 * finds another drain in flight returns immediately.
 *
 * Failed events are resubmitted until their retry_count reaches
 * max_retries; the next failure drops them.
 */
class EventProcessor {
public:
    /**
     * @throws std::invalid_argument on a missing collaborator or an invalid
     *         configuration
     */
    EventProcessor(
        std::shared_ptr<KnowledgeGraph> graph,
        std::shared_ptr<EntityExtractor> extractor,
        std::shared_ptr<MemoryStore> store,
        ProcessorConfig config = ProcessorConfig()
    );

    ~EventProcessor();

    EventProcessor(const EventProcessor&) = delete;
    EventProcessor& operator=(const EventProcessor&) = delete;

    /**
     * @brief Queue an event for processing
     * @throws InvalidEventError if the event is structurally invalid
     */
    void submit_event(const MemoryEvent& event);

    /**
     * @brief Parse a JSON envelope and queue it
     * @throws InvalidEventError if the envelope is invalid
     */
    void submit_envelope(const nlohmann::json& envelope);

    /**
     * @brief Install the handler for its event type, replacing any previous one
     */
    void register_handler(std::shared_ptr<EventHandler> handler);

    bool has_handler(MemoryEventType type) const;

    std::unique_ptr<EventStream> create_event_stream(EventStreamOptions options = EventStreamOptions());

    size_t subscribe(ProcessorObserver observer);
    void unsubscribe(size_t subscription_id);

    /**
     * @brief Drain and process up to batch_size queued events
     * @return Number of events processed; 0 when the queue is empty or a
     *         drain is already running
     */
    size_t process_pending_batch();

    /**
     * @brief Start draining every processing_interval_ms on a timer thread
     */
    void start();

    /**
     * @brief Stop the timer thread; queued events stay queued
     */
    void stop();

    bool is_running() const { return running_; }

    EventStatistics get_statistics() const;

    size_t queue_size() const;

    /// Sessions currently tracked for repetition detection (idle ones are evicted)
    size_t tracked_sessions() const;

    /**
     * @brief Queue priority of an event
     *
     * Starts at the metadata bucket (critical 0.95, high 0.75, medium 0.5,
     * low 0.25), is raised to the registered handler's priority, and is
     * multiplied by 1.2 (capped at 1.0) when confidence exceeds 0.8.
     */
    double compute_priority(const MemoryEvent& event) const;

    const ProcessorConfig& config() const { return config_; }

private:
    std::shared_ptr<KnowledgeGraph> graph_;
    std::shared_ptr<EntityExtractor> extractor_;
    std::shared_ptr<MemoryStore> store_;
    ProcessorConfig config_;

    mutable std::mutex queue_mutex_;
    EventQueue queue_;

    mutable std::mutex handlers_mutex_;
    std::map<MemoryEventType, std::shared_ptr<EventHandler>> handlers_;

    mutable std::mutex stats_mutex_;
    EventStatistics stats_;

    struct SessionEntry {
        MemoryEventType type;
        std::chrono::system_clock::time_point timestamp;
    };
    mutable std::mutex sessions_mutex_;
    std::map<std::string, std::deque<SessionEntry>> sessions_;

    mutable std::mutex observers_mutex_;
    std::map<size_t, ProcessorObserver> observers_;
    size_t next_observer_id_ = 1;

    std::atomic<bool> processing_{false};              // Drain guard
    std::atomic<bool> running_{false};
    std::thread timer_thread_;
    std::mutex timer_mutex_;
    std::condition_variable timer_cv_;

    std::shared_ptr<EventHandler> find_handler(MemoryEventType type) const;

    ProcessingResult process_event(const MemoryEvent& event);
    ProcessingResult default_process(const MemoryEvent& event);
    bool detect_pattern(const MemoryEvent& event);

    void process_immediate(const MemoryEvent& event);
    void apply_result(const ProcessingResult& result);
    void apply_update(const MemoryUpdate& update);
    void resubmit(MemoryEvent event);
    void update_statistics(size_t batch_size, size_t success_count, double processing_ms);

    void processing_loop();

    template <typename Fn>
    void notify(Fn&& fn) const;
};

} // namespace devmem

#endif // DEVMEM_EVENTS_EVENT_PROCESSOR_HPP
