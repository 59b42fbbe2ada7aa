#ifndef DEVMEM_EVENTS_MEMORY_EVENT_HPP
#define DEVMEM_EVENTS_MEMORY_EVENT_HPP

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace devmem {

// ============================================================================
// Enumerations
// ============================================================================

enum class MemoryEventType {
    CodeGeneration,
    BugFix,
    QualityImprovement,
    TeamInteraction,
    LearningUpdate,
    PatternRecognition,
    ModeChange
};

enum class EventPriority {
    Low,
    Medium,
    High,
    Critical
};

enum class EventSource {
    UserInput,
    AiGenerated,
    SystemInferred
};

std::string to_string(MemoryEventType type);
std::string to_string(EventPriority priority);
std::string to_string(EventSource source);

// The parsers throw InvalidEventError for unknown names.
MemoryEventType parse_event_type(const std::string& name);
EventPriority parse_event_priority(const std::string& name);
EventSource parse_event_source(const std::string& name);

/**
 * @brief Structural problem with a submitted event; never retried
 */
class InvalidEventError : public std::invalid_argument {
public:
    explicit InvalidEventError(const std::string& message)
        : std::invalid_argument(message) {}
};

// ============================================================================
// Event
// ============================================================================

struct EventMetadata {
    double confidence = 0.5;                           // [0, 1]
    EventSource source = EventSource::SystemInferred;
    EventPriority priority = EventPriority::Medium;
    std::vector<std::string> tags;
    std::string project_id;                            // Empty when absent
    std::string team_id;                               // Empty when absent
};

/**
 * @brief Record of one development activity fed into the event pipeline
 *
 * data and reasoning are free-form JSON so that any producer can submit any
 * event type. retry_count is the only field the pipeline changes.
 *
 * JSON envelope (version 1):
 *   { "version": 1, "id": "...", "type": "bug_fix", "timestamp": <epoch ms>,
 *     "userId": "...", "sessionId": "...", "data": ..., "reasoning": ...,
 *     "metadata": { "confidence": 0.9, "source": "user_input",
 *                   "priority": "high", "tags": [], "projectId": "...",
 *                   "teamId": "..." } }
 */
struct MemoryEvent {
    std::string id;
    MemoryEventType type = MemoryEventType::CodeGeneration;
    std::chrono::system_clock::time_point timestamp;
    std::string user_id;
    std::string session_id;
    nlohmann::json data;
    std::optional<nlohmann::json> reasoning;
    EventMetadata metadata;
    int retry_count = 0;

    /**
     * @brief Check the fields every event must carry
     * @throws InvalidEventError on a missing id or timestamp, or a
     *         confidence outside [0, 1]
     */
    void validate() const;

    nlohmann::json to_json() const;

    /**
     * @throws InvalidEventError on missing required fields, unknown enum
     *         names or an unsupported envelope version
     */
    static MemoryEvent from_json(const nlohmann::json& j);

    static constexpr int kEnvelopeVersion = 1;
};

long long to_epoch_millis(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point from_epoch_millis(long long millis);

} // namespace devmem

#endif // DEVMEM_EVENTS_MEMORY_EVENT_HPP
