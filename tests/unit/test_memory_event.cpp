#include <gtest/gtest.h>
#include "devmem/events/memory_event.hpp"

using namespace devmem;
using json = nlohmann::json;

class MemoryEventTest : public ::testing::Test {
protected:
    json envelope;

    void SetUp() override {
        envelope = {
            {"version", 1},
            {"id", "evt-42"},
            {"type", "bug_fix"},
            {"timestamp", 1700000000123LL},
            {"userId", "dev-1"},
            {"sessionId", "session-9"},
            {"data", {{"bug", "off by one"}, {"file", "pager.ts"}}},
            {"reasoning", {{"steps", json::array({"reproduce", "fix bound"})}}},
            {"metadata", {
                {"confidence", 0.85},
                {"source", "ai_generated"},
                {"priority", "high"},
                {"tags", json::array({"pagination", "bug"})},
                {"projectId", "web"}
            }}
        };
    }
};

// ==========================================
// Envelope Tests
// ==========================================

TEST_F(MemoryEventTest, ParseEnvelope) {
    auto event = MemoryEvent::from_json(envelope);

    EXPECT_EQ(event.id, "evt-42");
    EXPECT_EQ(event.type, MemoryEventType::BugFix);
    EXPECT_EQ(to_epoch_millis(event.timestamp), 1700000000123LL);
    EXPECT_EQ(event.user_id, "dev-1");
    EXPECT_EQ(event.session_id, "session-9");
    EXPECT_EQ(event.data["bug"], "off by one");
    ASSERT_TRUE(event.reasoning.has_value());
    EXPECT_EQ((*event.reasoning)["steps"].size(), 2);

    EXPECT_DOUBLE_EQ(event.metadata.confidence, 0.85);
    EXPECT_EQ(event.metadata.source, EventSource::AiGenerated);
    EXPECT_EQ(event.metadata.priority, EventPriority::High);
    EXPECT_EQ(event.metadata.tags, (std::vector<std::string>{"pagination", "bug"}));
    EXPECT_EQ(event.metadata.project_id, "web");
    EXPECT_TRUE(event.metadata.team_id.empty());
    EXPECT_EQ(event.retry_count, 0);
}

TEST_F(MemoryEventTest, SerializeParsedEvent) {
    auto event = MemoryEvent::from_json(envelope);
    auto j = event.to_json();

    EXPECT_EQ(j["version"], 1);
    EXPECT_EQ(j["type"], "bug_fix");
    EXPECT_EQ(j["timestamp"], 1700000000123LL);
    EXPECT_EQ(j["metadata"]["source"], "ai_generated");
    EXPECT_EQ(j["metadata"]["projectId"], "web");
    EXPECT_FALSE(j["metadata"].contains("teamId"));

    auto reparsed = MemoryEvent::from_json(j);
    EXPECT_EQ(reparsed.id, event.id);
    EXPECT_EQ(reparsed.data, event.data);
    EXPECT_EQ(reparsed.timestamp, event.timestamp);
}

TEST_F(MemoryEventTest, StringDataAndNoReasoning) {
    envelope["data"] = "function parse() {}";
    envelope.erase("reasoning");
    envelope.erase("version");

    auto event = MemoryEvent::from_json(envelope);
    EXPECT_TRUE(event.data.is_string());
    EXPECT_FALSE(event.reasoning.has_value());
    EXPECT_FALSE(event.to_json().contains("reasoning"));
}

// ==========================================
// Validation Tests
// ==========================================

TEST_F(MemoryEventTest, MissingRequiredFields) {
    for (const char* key : {"id", "type", "timestamp", "metadata"}) {
        json broken = envelope;
        broken.erase(std::string(key));
        EXPECT_THROW(MemoryEvent::from_json(broken), InvalidEventError) << key;
    }

    for (const char* key : {"confidence", "source", "priority", "tags"}) {
        json broken = envelope;
        broken["metadata"].erase(std::string(key));
        EXPECT_THROW(MemoryEvent::from_json(broken), InvalidEventError) << key;
    }
}

TEST_F(MemoryEventTest, UnknownEnumNames) {
    json bad_type = envelope;
    bad_type["type"] = "deployment";
    EXPECT_THROW(MemoryEvent::from_json(bad_type), InvalidEventError);

    json bad_priority = envelope;
    bad_priority["metadata"]["priority"] = "urgent";
    EXPECT_THROW(MemoryEvent::from_json(bad_priority), InvalidEventError);

    json bad_source = envelope;
    bad_source["metadata"]["source"] = "rumour";
    EXPECT_THROW(MemoryEvent::from_json(bad_source), InvalidEventError);
}

TEST_F(MemoryEventTest, WrongTypesAndVersion) {
    json wrong = envelope;
    wrong["timestamp"] = "yesterday";
    EXPECT_THROW(MemoryEvent::from_json(wrong), InvalidEventError);

    json future = envelope;
    future["version"] = 2;
    EXPECT_THROW(MemoryEvent::from_json(future), InvalidEventError);

    EXPECT_THROW(MemoryEvent::from_json(json::array()), InvalidEventError);
}

TEST(MemoryEventValidateTest, StructuralChecks) {
    MemoryEvent event;
    event.id = "e1";
    event.timestamp = std::chrono::system_clock::now();
    EXPECT_NO_THROW(event.validate());

    MemoryEvent no_id = event;
    no_id.id.clear();
    EXPECT_THROW(no_id.validate(), InvalidEventError);

    MemoryEvent no_time = event;
    no_time.timestamp = {};
    EXPECT_THROW(no_time.validate(), InvalidEventError);

    MemoryEvent bad_confidence = event;
    bad_confidence.metadata.confidence = 1.5;
    EXPECT_THROW(bad_confidence.validate(), InvalidEventError);
}

TEST(MemoryEventEnumTest, Names) {
    EXPECT_EQ(to_string(MemoryEventType::QualityImprovement), "quality_improvement");
    EXPECT_EQ(parse_event_type("pattern_recognition"), MemoryEventType::PatternRecognition);
    EXPECT_EQ(to_string(EventPriority::Critical), "critical");
    EXPECT_EQ(parse_event_source("user_input"), EventSource::UserInput);

    // InvalidEventError is a std::invalid_argument
    EXPECT_THROW(parse_event_priority("none"), std::invalid_argument);
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
