#include "devmem/events/event_handlers.hpp"
#include <stdexcept>

using json = nlohmann::json;

namespace devmem {

std::string to_string(GraphOperation operation) {
    switch (operation) {
        case GraphOperation::AddNode: return "add_node";
        case GraphOperation::AddEdge: return "add_edge";
        case GraphOperation::UpdateNode: return "update_node";
        case GraphOperation::RemoveNode: return "remove_node";
    }
    return "add_node";
}

std::string to_string(TriggerType type) {
    switch (type) {
        case TriggerType::PatternDetected: return "pattern_detected";
        case TriggerType::ThresholdReached: return "threshold_reached";
        case TriggerType::AnomalyDetected: return "anomaly_detected";
    }
    return "pattern_detected";
}

std::string to_string(TriggerAction action) {
    switch (action) {
        case TriggerAction::Train: return "train";
        case TriggerAction::Adapt: return "adapt";
        case TriggerAction::Alert: return "alert";
    }
    return "adapt";
}

json GraphUpdate::to_json() const {
    return {
        {"operation", devmem::to_string(operation)},
        {"data", data}
    };
}

json LearningTrigger::to_json() const {
    return {
        {"type", devmem::to_string(type)},
        {"data", data},
        {"action", devmem::to_string(action)}
    };
}

ProcessingResult ProcessingResult::failure(const std::string& message) {
    ProcessingResult result;
    result.success = false;
    result.error_message = message;
    return result;
}

json ProcessingResult::to_json() const {
    json j;
    j["success"] = success;

    j["memory_updates"] = json::array();
    for (const auto& update : memory_updates) {
        j["memory_updates"].push_back(update.to_json());
    }
    j["graph_updates"] = json::array();
    for (const auto& update : graph_updates) {
        j["graph_updates"].push_back(update.to_json());
    }
    j["learning_triggers"] = json::array();
    for (const auto& trigger : learning_triggers) {
        j["learning_triggers"].push_back(trigger.to_json());
    }

    if (!success) {
        j["error"] = error_message;
    }
    return j;
}

// ==========================================
// FunctionEventHandler
// ==========================================

FunctionEventHandler::FunctionEventHandler(MemoryEventType type, double priority, ProcessFn fn)
    : type_(type), priority_(priority), fn_(std::move(fn)) {
    if (!fn_) {
        throw std::invalid_argument("FunctionEventHandler requires a callable");
    }
}

ProcessingResult FunctionEventHandler::process(const MemoryEvent& event) {
    return fn_(event);
}

// ==========================================
// CodeGenerationHandler
// ==========================================

CodeGenerationHandler::CodeGenerationHandler(
    std::shared_ptr<EntityExtractor> extractor,
    std::shared_ptr<KnowledgeGraph> graph
) : extractor_(std::move(extractor)), graph_(std::move(graph)) {
    if (!extractor_ || !graph_) {
        throw std::invalid_argument("CodeGenerationHandler requires an extractor and a graph");
    }
}

ProcessingResult CodeGenerationHandler::process(const MemoryEvent& event) {
    ExtractionContext context;
    context.attributes["event_type"] = to_string(event.type);

    std::string code;
    if (event.data.is_string()) {
        code = event.data.get<std::string>();
    } else if (event.data.is_object() && event.data.contains("code") && event.data["code"].is_string()) {
        code = event.data["code"].get<std::string>();
        if (event.data.contains("language") && event.data["language"].is_string()) {
            context.language = event.data["language"].get<std::string>();
        }
    } else {
        return ProcessingResult::failure("code_generation event carries no source text");
    }

    ExtractionResult extraction = extractor_->extract(code, context);
    graph_->add_to_graph(extraction);

    json entities = json::array();
    for (const auto& entity : extraction.entities) {
        entities.push_back(entity.to_json());
    }

    ProcessingResult result;
    result.success = true;

    MemoryUpdate update;
    update.type = MemoryTarget::System1;
    update.operation = UpdateOperation::Add;
    update.target = "codePatterns";
    update.data = {{"code", code}, {"entities", entities}};
    result.memory_updates.push_back(std::move(update));

    result.graph_updates.push_back({GraphOperation::AddNode, extraction.to_json()});
    return result;
}

// ==========================================
// Data-only handlers
// ==========================================

ProcessingResult BugFixHandler::process(const MemoryEvent& event) {
    ProcessingResult result;
    result.success = true;

    MemoryUpdate update;
    update.type = MemoryTarget::Both;
    update.operation = UpdateOperation::Add;
    update.target = "bugPatterns";
    update.data = event.data;
    result.memory_updates.push_back(std::move(update));

    result.learning_triggers.push_back({TriggerType::PatternDetected, event.data, TriggerAction::Train});
    return result;
}

ProcessingResult TeamInteractionHandler::process(const MemoryEvent& event) {
    ProcessingResult result;
    result.success = true;

    MemoryUpdate update;
    update.type = MemoryTarget::System1;
    update.operation = UpdateOperation::Add;
    update.target = "teamPatterns";
    update.data = event.data;
    result.memory_updates.push_back(std::move(update));
    return result;
}

ProcessingResult ModeChangeHandler::process(const MemoryEvent& event) {
    ProcessingResult result;
    result.success = true;

    MemoryUpdate update;
    update.type = MemoryTarget::System2;
    update.operation = UpdateOperation::Update;
    update.target = "currentMode";
    update.data = event.data;
    result.memory_updates.push_back(std::move(update));

    result.learning_triggers.push_back({TriggerType::ThresholdReached, event.data, TriggerAction::Adapt});
    return result;
}

} // namespace devmem
