#include <gtest/gtest.h>
#include "devmem/memory/memory_store.hpp"
#include <stdexcept>

using namespace devmem;
using json = nlohmann::json;

namespace {

MemoryUpdate make_update(
    MemoryTarget type,
    UpdateOperation operation,
    const std::string& target,
    json data
) {
    MemoryUpdate update;
    update.type = type;
    update.operation = operation;
    update.target = target;
    update.data = std::move(data);
    return update;
}

} // anonymous namespace

class MemoryStoreTest : public ::testing::Test {
protected:
    InMemoryMemoryStore store;
};

TEST_F(MemoryStoreTest, AddAppends) {
    store.update_system1(make_update(MemoryTarget::System1, UpdateOperation::Add, "codePatterns", "a"));
    store.update_system1(make_update(MemoryTarget::System1, UpdateOperation::Add, "codePatterns", "b"));

    auto patterns = store.query(MemoryTarget::System1, "codePatterns");
    ASSERT_TRUE(patterns.is_array());
    EXPECT_EQ(patterns, json::array({"a", "b"}));
    EXPECT_TRUE(store.query(MemoryTarget::System2, "codePatterns").is_null());
    EXPECT_EQ(store.update_count(), 2);
}

TEST_F(MemoryStoreTest, UpdateReplaces) {
    store.update_system2(make_update(MemoryTarget::System2, UpdateOperation::Update, "currentMode", {{"mode", "review"}}));
    store.update_system2(make_update(MemoryTarget::System2, UpdateOperation::Update, "currentMode", {{"mode", "debug"}}));

    EXPECT_EQ(store.query(MemoryTarget::System2, "currentMode")["mode"], "debug");
}

TEST_F(MemoryStoreTest, AddAfterUpdateWraps) {
    store.update_system1(make_update(MemoryTarget::System1, UpdateOperation::Update, "teamPatterns", "solo"));
    store.update_system1(make_update(MemoryTarget::System1, UpdateOperation::Add, "teamPatterns", "pair"));

    EXPECT_EQ(store.query(MemoryTarget::System1, "teamPatterns"), json::array({"solo", "pair"}));
}

TEST_F(MemoryStoreTest, RemoveElementsOrCollection) {
    for (const char* value : {"x", "y", "x"}) {
        store.update_system1(make_update(MemoryTarget::System1, UpdateOperation::Add, "items", value));
    }

    store.update_system1(make_update(MemoryTarget::System1, UpdateOperation::Remove, "items", "x"));
    EXPECT_EQ(store.query(MemoryTarget::System1, "items"), json::array({"y"}));

    store.update_system1(make_update(MemoryTarget::System1, UpdateOperation::Remove, "items", nullptr));
    EXPECT_TRUE(store.query(MemoryTarget::System1, "items").is_null());

    // Removing from a missing collection is a no-op
    EXPECT_NO_THROW(store.update_system1(
        make_update(MemoryTarget::System1, UpdateOperation::Remove, "items", nullptr)));
}

TEST_F(MemoryStoreTest, RejectsEmptyTarget) {
    EXPECT_THROW(
        store.update_system1(make_update(MemoryTarget::System1, UpdateOperation::Add, "", 1)),
        std::invalid_argument
    );
    EXPECT_EQ(store.update_count(), 0);
}

TEST_F(MemoryStoreTest, BothQuery) {
    store.update_system1(make_update(MemoryTarget::Both, UpdateOperation::Add, "bugPatterns", "npe"));
    store.update_system2(make_update(MemoryTarget::Both, UpdateOperation::Add, "bugPatterns", "npe"));

    auto both = store.query(MemoryTarget::Both, "bugPatterns");
    EXPECT_EQ(both["system1"], json::array({"npe"}));
    EXPECT_EQ(both["system2"], json::array({"npe"}));
}

TEST(MemoryUpdateTest, ToJson) {
    MemoryUpdate update = make_update(MemoryTarget::Both, UpdateOperation::Remove, "bugPatterns", 7);
    auto j = update.to_json();
    EXPECT_EQ(j["type"], "both");
    EXPECT_EQ(j["operation"], "remove");
    EXPECT_EQ(j["target"], "bugPatterns");
    EXPECT_FALSE(j.contains("metadata"));

    update.metadata = {{"eventId", "e1"}};
    EXPECT_EQ(update.to_json()["metadata"]["eventId"], "e1");
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
