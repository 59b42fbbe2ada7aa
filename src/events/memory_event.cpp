#include "devmem/events/memory_event.hpp"
#include <cmath>

using json = nlohmann::json;

namespace devmem {

namespace {

const json& require(const json& j, const char* key, const std::string& where) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        throw InvalidEventError("Invalid event structure: missing " + where + key);
    }
    return *it;
}

std::string optional_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

} // anonymous namespace

// ==========================================
// Enum names
// ==========================================

std::string to_string(MemoryEventType type) {
    switch (type) {
        case MemoryEventType::CodeGeneration: return "code_generation";
        case MemoryEventType::BugFix: return "bug_fix";
        case MemoryEventType::QualityImprovement: return "quality_improvement";
        case MemoryEventType::TeamInteraction: return "team_interaction";
        case MemoryEventType::LearningUpdate: return "learning_update";
        case MemoryEventType::PatternRecognition: return "pattern_recognition";
        case MemoryEventType::ModeChange: return "mode_change";
    }
    return "code_generation";
}

std::string to_string(EventPriority priority) {
    switch (priority) {
        case EventPriority::Low: return "low";
        case EventPriority::Medium: return "medium";
        case EventPriority::High: return "high";
        case EventPriority::Critical: return "critical";
    }
    return "medium";
}

std::string to_string(EventSource source) {
    switch (source) {
        case EventSource::UserInput: return "user_input";
        case EventSource::AiGenerated: return "ai_generated";
        case EventSource::SystemInferred: return "system_inferred";
    }
    return "system_inferred";
}

MemoryEventType parse_event_type(const std::string& name) {
    if (name == "code_generation") return MemoryEventType::CodeGeneration;
    if (name == "bug_fix") return MemoryEventType::BugFix;
    if (name == "quality_improvement") return MemoryEventType::QualityImprovement;
    if (name == "team_interaction") return MemoryEventType::TeamInteraction;
    if (name == "learning_update") return MemoryEventType::LearningUpdate;
    if (name == "pattern_recognition") return MemoryEventType::PatternRecognition;
    if (name == "mode_change") return MemoryEventType::ModeChange;
    throw InvalidEventError("Unknown event type: " + name);
}

EventPriority parse_event_priority(const std::string& name) {
    if (name == "low") return EventPriority::Low;
    if (name == "medium") return EventPriority::Medium;
    if (name == "high") return EventPriority::High;
    if (name == "critical") return EventPriority::Critical;
    throw InvalidEventError("Unknown event priority: " + name);
}

EventSource parse_event_source(const std::string& name) {
    if (name == "user_input") return EventSource::UserInput;
    if (name == "ai_generated") return EventSource::AiGenerated;
    if (name == "system_inferred") return EventSource::SystemInferred;
    throw InvalidEventError("Unknown event source: " + name);
}

long long to_epoch_millis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()
    ).count();
}

std::chrono::system_clock::time_point from_epoch_millis(long long millis) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::milliseconds(millis)
        )
    );
}

// ==========================================
// MemoryEvent
// ==========================================

void MemoryEvent::validate() const {
    if (id.empty()) {
        throw InvalidEventError("Invalid event structure: missing id");
    }
    if (timestamp.time_since_epoch().count() == 0) {
        throw InvalidEventError("Invalid event structure: missing timestamp");
    }
    if (!std::isfinite(metadata.confidence) ||
        metadata.confidence < 0.0 || metadata.confidence > 1.0) {
        throw InvalidEventError("Invalid event metadata: confidence must be in [0, 1]");
    }
}

json MemoryEvent::to_json() const {
    json j;
    j["version"] = kEnvelopeVersion;
    j["id"] = id;
    j["type"] = devmem::to_string(type);
    j["timestamp"] = to_epoch_millis(timestamp);
    j["userId"] = user_id;
    j["sessionId"] = session_id;
    j["data"] = data;
    if (reasoning) {
        j["reasoning"] = *reasoning;
    }

    json meta;
    meta["confidence"] = metadata.confidence;
    meta["source"] = devmem::to_string(metadata.source);
    meta["priority"] = devmem::to_string(metadata.priority);
    meta["tags"] = metadata.tags;
    if (!metadata.project_id.empty()) {
        meta["projectId"] = metadata.project_id;
    }
    if (!metadata.team_id.empty()) {
        meta["teamId"] = metadata.team_id;
    }
    j["metadata"] = meta;

    j["retryCount"] = retry_count;
    return j;
}

MemoryEvent MemoryEvent::from_json(const json& j) {
    if (!j.is_object()) {
        throw InvalidEventError("Invalid event structure: expected a JSON object");
    }

    int version = j.value("version", kEnvelopeVersion);
    if (version != kEnvelopeVersion) {
        throw InvalidEventError("Unsupported event envelope version: " + std::to_string(version));
    }

    MemoryEvent event;
    try {
        event.id = require(j, "id", "").get<std::string>();
        event.type = parse_event_type(require(j, "type", "").get<std::string>());
        event.timestamp = from_epoch_millis(require(j, "timestamp", "").get<long long>());
        event.user_id = optional_string(j, "userId");
        event.session_id = optional_string(j, "sessionId");
        event.data = j.value("data", json());

        auto reasoning = j.find("reasoning");
        if (reasoning != j.end() && !reasoning->is_null()) {
            event.reasoning = *reasoning;
        }

        const json& meta = require(j, "metadata", "");
        if (!meta.is_object()) {
            throw InvalidEventError("Invalid event metadata");
        }
        event.metadata.confidence = require(meta, "confidence", "metadata.").get<double>();
        event.metadata.source = parse_event_source(require(meta, "source", "metadata.").get<std::string>());
        event.metadata.priority = parse_event_priority(require(meta, "priority", "metadata.").get<std::string>());
        event.metadata.tags = require(meta, "tags", "metadata.").get<std::vector<std::string>>();
        event.metadata.project_id = optional_string(meta, "projectId");
        event.metadata.team_id = optional_string(meta, "teamId");

        event.retry_count = j.value("retryCount", 0);
    } catch (const json::exception& e) {
        throw InvalidEventError(std::string("Invalid event structure: ") + e.what());
    }

    event.validate();
    return event;
}

} // namespace devmem
