#ifndef DEVMEM_EVENTS_EVENT_HANDLERS_HPP
#define DEVMEM_EVENTS_EVENT_HANDLERS_HPP

#include "devmem/events/memory_event.hpp"
#include "devmem/memory/memory_store.hpp"
#include "devmem/extraction/entity_extractor.hpp"
#include "devmem/graph/knowledge_graph.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <nlohmann/json.hpp>

namespace devmem {

// ============================================================================
// Processing Results
// ============================================================================

enum class GraphOperation {
    AddNode,
    AddEdge,
    UpdateNode,
    RemoveNode
};

enum class TriggerType {
    PatternDetected,
    ThresholdReached,
    AnomalyDetected
};

enum class TriggerAction {
    Train,
    Adapt,
    Alert
};

std::string to_string(GraphOperation operation);
std::string to_string(TriggerType type);
std::string to_string(TriggerAction action);

struct GraphUpdate {
    GraphOperation operation = GraphOperation::AddNode;
    nlohmann::json data;

    nlohmann::json to_json() const;
};

/**
 * @brief Request for a downstream learning component
 */
struct LearningTrigger {
    TriggerType type = TriggerType::PatternDetected;
    nlohmann::json data;
    TriggerAction action = TriggerAction::Adapt;

    nlohmann::json to_json() const;
};

/**
 * @brief Outcome every event handler returns
 */
struct ProcessingResult {
    bool success = false;
    std::vector<MemoryUpdate> memory_updates;
    std::vector<GraphUpdate> graph_updates;
    std::vector<LearningTrigger> learning_triggers;
    std::string error_message;                         // Set when success is false

    static ProcessingResult failure(const std::string& message);

    nlohmann::json to_json() const;
};

// ============================================================================
// Handler Interface
// ============================================================================

/**
 * @brief Type-specific event processor
 *
 * priority() is the handler's intrinsic priority; events of its type are
 * queued at least this high. process() may throw; the pipeline converts
 * exceptions into failed results.
 */
class EventHandler {
public:
    virtual ~EventHandler() = default;

    virtual MemoryEventType type() const = 0;
    virtual double priority() const = 0;
    virtual ProcessingResult process(const MemoryEvent& event) = 0;
};

/**
 * @brief Handler backed by a callable, for ad-hoc registrations
 */
class FunctionEventHandler : public EventHandler {
public:
    using ProcessFn = std::function<ProcessingResult(const MemoryEvent&)>;

    FunctionEventHandler(MemoryEventType type, double priority, ProcessFn fn);

    MemoryEventType type() const override { return type_; }
    double priority() const override { return priority_; }
    ProcessingResult process(const MemoryEvent& event) override;

private:
    MemoryEventType type_;
    double priority_;
    ProcessFn fn_;
};

// ============================================================================
// Built-in Handlers
// ============================================================================

/**
 * @brief Extracts entities from generated code and merges them into the graph
 *
 * The code is the event data itself when it is a string, otherwise
 * data["code"] (with an optional data["language"]). Records the code and its
 * entities in system1.codePatterns.
 */
class CodeGenerationHandler : public EventHandler {
public:
    CodeGenerationHandler(
        std::shared_ptr<EntityExtractor> extractor,
        std::shared_ptr<KnowledgeGraph> graph
    );

    MemoryEventType type() const override { return MemoryEventType::CodeGeneration; }
    double priority() const override { return 0.8; }
    ProcessingResult process(const MemoryEvent& event) override;

private:
    std::shared_ptr<EntityExtractor> extractor_;
    std::shared_ptr<KnowledgeGraph> graph_;
};

// Records the fix in both systems' bugPatterns and asks for training.
class BugFixHandler : public EventHandler {
public:
    MemoryEventType type() const override { return MemoryEventType::BugFix; }
    double priority() const override { return 0.9; }
    ProcessingResult process(const MemoryEvent& event) override;
};

class TeamInteractionHandler : public EventHandler {
public:
    MemoryEventType type() const override { return MemoryEventType::TeamInteraction; }
    double priority() const override { return 0.6; }
    ProcessingResult process(const MemoryEvent& event) override;
};

// Replaces system2.currentMode and signals a threshold crossing.
class ModeChangeHandler : public EventHandler {
public:
    MemoryEventType type() const override { return MemoryEventType::ModeChange; }
    double priority() const override { return 0.7; }
    ProcessingResult process(const MemoryEvent& event) override;
};

} // namespace devmem

#endif // DEVMEM_EVENTS_EVENT_HANDLERS_HPP
