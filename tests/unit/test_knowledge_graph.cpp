#include <gtest/gtest.h>
#include "devmem/graph/knowledge_graph.hpp"
#include <cmath>
#include <cstdio>
#include <fstream>
#include <stdexcept>

using namespace devmem;

namespace {

// Returns fixed vectors for known texts; unknown text is an error.
class TableEmbeddingProvider : public EmbeddingProvider {
public:
    std::map<std::string, std::vector<float>> table;
    int calls = 0;

    std::vector<float> embed(const std::string& text) override {
        calls++;
        auto it = table.find(text);
        if (it == table.end()) {
            throw std::runtime_error("no embedding for " + text);
        }
        return it->second;
    }
    size_t dimension() const override { return 3; }
    std::string name() const override { return "table"; }
};

Entity make_entity(
    const std::string& id,
    const std::string& text,
    EntityType type,
    std::vector<float> embedding = {}
) {
    Entity entity;
    entity.id = id;
    entity.text = text;
    entity.type = type;
    entity.embedding = std::move(embedding);
    return entity;
}

Relationship make_relationship(
    const std::string& id,
    const std::string& source,
    const std::string& target,
    RelationshipType type = RelationshipType::Uses,
    bool bidirectional = false,
    double confidence = 0.9
) {
    Relationship rel;
    rel.id = id;
    rel.source_entity_id = source;
    rel.target_entity_id = target;
    rel.type = type;
    rel.bidirectional = bidirectional;
    rel.confidence = confidence;
    return rel;
}

std::vector<std::string> names(const std::vector<KnowledgeNode>& nodes) {
    std::vector<std::string> result;
    for (const auto& node : nodes) result.push_back(node.name);
    return result;
}

} // anonymous namespace

class KnowledgeGraphTest : public ::testing::Test {
protected:
    std::shared_ptr<TableEmbeddingProvider> embeddings = std::make_shared<TableEmbeddingProvider>();
    KnowledgeGraph graph{embeddings};

    void SetUp() override {
        embeddings->table["x axis"] = {1.0f, 0.0f, 0.0f};
        embeddings->table["y axis"] = {0.0f, 1.0f, 0.0f};
    }

    // A -> B -> C, directed
    void add_chain() {
        ExtractionResult extraction;
        extraction.entities = {
            make_entity("A", "alpha", EntityType::Function, {1.0f, 0.0f, 0.0f}),
            make_entity("B", "beta", EntityType::Function, {0.0f, 1.0f, 0.0f}),
            make_entity("C", "gamma", EntityType::Class, {0.0f, 0.0f, 1.0f})
        };
        extraction.relationships = {
            make_relationship("r1", "A", "B"),
            make_relationship("r2", "B", "C", RelationshipType::DependsOn)
        };
        extraction.confidence = 0.8;
        graph.add_to_graph(extraction);
    }
};

// ==========================================
// Merge Tests
// ==========================================

TEST_F(KnowledgeGraphTest, DisjointMergesAccumulate) {
    add_chain();

    ExtractionResult second;
    second.entities = {
        make_entity("D", "delta", EntityType::Concept),
        make_entity("E", "epsilon", EntityType::Concept)
    };
    second.relationships = {make_relationship("r3", "D", "E")};
    auto summary = graph.add_to_graph(second);

    EXPECT_EQ(summary.nodes_added, 2);
    EXPECT_EQ(summary.edges_added, 1);
    EXPECT_EQ(summary.total_nodes, 5);
    EXPECT_EQ(summary.total_edges, 3);

    auto stats = graph.get_statistics();
    EXPECT_EQ(stats.total_nodes, 5);
    EXPECT_EQ(stats.total_edges, 3);
}

TEST_F(KnowledgeGraphTest, NodeFieldsFromExtraction) {
    add_chain();

    auto node = graph.get_node("C");
    ASSERT_TRUE(node.has_value());
    EXPECT_EQ(node->type, "class");
    EXPECT_EQ(node->name, "gamma");
    EXPECT_EQ(node->content, "gamma");
    EXPECT_DOUBLE_EQ(node->confidence, 0.8);
    EXPECT_DOUBLE_EQ(node->metadata.quality, 0.8);
    EXPECT_EQ(node->metadata.complexity, "low");
    EXPECT_EQ(node->access_count, 2);  // 1 on merge, 1 for this read
}

TEST_F(KnowledgeGraphTest, EdgeWeightIsConfidence) {
    add_chain();
    auto json = graph.to_json();
    ASSERT_EQ(json["edges"].size(), 2);
    EXPECT_DOUBLE_EQ(json["edges"][0]["weight"].get<double>(), 0.9);
    EXPECT_DOUBLE_EQ(json["edges"][0]["confidence"].get<double>(), 0.9);
}

TEST_F(KnowledgeGraphTest, UpsertRestartsAccessHistory) {
    add_chain();
    graph.get_node("A");
    graph.get_node("A");

    ExtractionResult again;
    again.entities = {make_entity("A", "alpha_renamed", EntityType::Function, {1.0f, 0.0f, 0.0f})};
    again.confidence = 0.6;
    auto summary = graph.add_to_graph(again);

    EXPECT_EQ(summary.total_nodes, 3);
    auto node = graph.get_node("A");
    ASSERT_TRUE(node.has_value());
    EXPECT_EQ(node->name, "alpha_renamed");
    EXPECT_DOUBLE_EQ(node->confidence, 0.6);
    // Reset to 1 by the merge, then touched once by get_node
    EXPECT_EQ(node->access_count, 2);
}

TEST_F(KnowledgeGraphTest, DanglingRelationshipRejected) {
    add_chain();

    ExtractionResult extraction;
    extraction.entities = {make_entity("D", "delta", EntityType::Concept)};
    extraction.relationships = {
        make_relationship("ok_existing", "D", "A"),
        make_relationship("dangling", "D", "missing")
    };
    auto summary = graph.add_to_graph(extraction);

    EXPECT_EQ(summary.edges_added, 1);
    EXPECT_EQ(summary.edges_rejected, 1);
    EXPECT_TRUE(graph.has_edge("ok_existing"));
    EXPECT_FALSE(graph.has_edge("dangling"));
    EXPECT_EQ(graph.num_edges(), 3);
}

TEST(KnowledgeGraphTypeTest, EntityTypeTable) {
    EXPECT_EQ(KnowledgeGraph::map_entity_type(make_entity("1", "f", EntityType::Function)), "function");
    EXPECT_EQ(KnowledgeGraph::map_entity_type(make_entity("2", "c", EntityType::Class)), "class");
    EXPECT_EQ(KnowledgeGraph::map_entity_type(make_entity("3", "v", EntityType::Variable)), "pattern");
    EXPECT_EQ(KnowledgeGraph::map_entity_type(make_entity("4", "c", EntityType::Concept)), "concept");
    EXPECT_EQ(KnowledgeGraph::map_entity_type(make_entity("5", "b", EntityType::BusinessLogic)), "concept");
    EXPECT_EQ(KnowledgeGraph::map_entity_type(make_entity("6", "p", EntityType::Preference)), "pattern");
    EXPECT_EQ(KnowledgeGraph::map_entity_type(make_entity("7", "t", EntityType::TeamPattern)), "pattern");

    Entity module = make_entity("8", "./db", EntityType::Concept);
    module.attributes["kind"] = "module";
    EXPECT_EQ(KnowledgeGraph::map_entity_type(module), "module");
}

TEST(KnowledgeGraphTypeTest, Complexity) {
    EXPECT_EQ(KnowledgeGraph::assess_complexity("short"), "low");
    EXPECT_EQ(KnowledgeGraph::assess_complexity(std::string(20, 'x')), "medium");
    EXPECT_EQ(KnowledgeGraph::assess_complexity(std::string(49, 'x')), "medium");
    EXPECT_EQ(KnowledgeGraph::assess_complexity(std::string(50, 'x')), "high");
}

// ==========================================
// Search Tests
// ==========================================

TEST_F(KnowledgeGraphTest, ExactEmbeddingRanksFirst) {
    add_chain();

    SearchOptions options;
    options.query = "x axis";
    options.min_similarity = 0.99;
    auto results = graph.search(options);

    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].node.id, "A");
    EXPECT_NEAR(results[0].similarity, 1.0, 1e-6);
}

TEST_F(KnowledgeGraphTest, SearchOrderingAndTieBreak) {
    ExtractionResult extraction;
    extraction.entities = {
        make_entity("n2", "second", EntityType::Function, {1.0f, 0.0f, 0.0f}),
        make_entity("n1", "first", EntityType::Function, {1.0f, 0.0f, 0.0f}),
        make_entity("n3", "partial", EntityType::Function, {1.0f, 1.0f, 0.0f}),
        make_entity("n4", "other", EntityType::Function, {0.0f, 1.0f, 0.0f})
    };
    graph.add_to_graph(extraction);

    SearchOptions options;
    options.query = "x axis";
    options.min_similarity = 0.5;
    auto results = graph.search(options);

    ASSERT_EQ(results.size(), 3);
    EXPECT_EQ(results[0].node.id, "n1");
    EXPECT_EQ(results[1].node.id, "n2");
    EXPECT_EQ(results[2].node.id, "n3");
    EXPECT_NEAR(results[2].similarity, std::sqrt(0.5), 1e-6);

    options.top_k = 1;
    auto top = graph.search(options);
    ASSERT_EQ(top.size(), 1);
    EXPECT_EQ(top[0].node.id, "n1");
}

TEST_F(KnowledgeGraphTest, SearchSkipsUnembeddedNodes) {
    ExtractionResult extraction;
    extraction.entities = {
        make_entity("plain", "plain", EntityType::Concept),
        make_entity("vec", "vec", EntityType::Concept, {1.0f, 0.0f, 0.0f})
    };
    graph.add_to_graph(extraction);

    SearchOptions options;
    options.query = "x axis";
    options.min_similarity = 0.0;
    auto results = graph.search(options);
    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].node.id, "vec");
}

TEST_F(KnowledgeGraphTest, SearchFilters) {
    add_chain();

    SearchOptions options;
    options.query = "x axis";
    options.min_similarity = 0.0;

    options.filters = {{"type", FilterOperator::Eq, "class"}};
    auto results = graph.search(options);
    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].node.id, "C");

    options.filters = {{"type", FilterOperator::Neq, "class"}};
    EXPECT_EQ(graph.search(options).size(), 2);

    options.filters = {{"name", FilterOperator::Contains, "amm"}};
    results = graph.search(options);
    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].node.name, "gamma");

    options.filters = {{"id", FilterOperator::In, nlohmann::json::array({"A", "B"})}};
    EXPECT_EQ(graph.search(options).size(), 2);

    options.filters = {{"confidence", FilterOperator::Gt, 0.5}};
    EXPECT_EQ(graph.search(options).size(), 3);

    options.filters = {{"confidence", FilterOperator::Lt, 0.5}};
    EXPECT_TRUE(graph.search(options).empty());

    // Ordering across types never matches
    options.filters = {{"name", FilterOperator::Gt, 3}};
    EXPECT_TRUE(graph.search(options).empty());

    options.filters = {{"missing_field", FilterOperator::Eq, "x"}};
    EXPECT_TRUE(graph.search(options).empty());

    options.filters = {{"missing_field", FilterOperator::Contains, "ul"}};
    EXPECT_TRUE(graph.search(options).empty());
}

TEST_F(KnowledgeGraphTest, SearchAttachesRelationships) {
    add_chain();

    SearchOptions options;
    options.query = "y axis";
    options.min_similarity = 0.9;
    options.include_relationships = true;
    auto results = graph.search(options);

    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].node.id, "B");
    EXPECT_EQ(results[0].relationships.size(), 2);
}

TEST_F(KnowledgeGraphTest, SearchTouchesReturnedNodes) {
    add_chain();

    SearchOptions options;
    options.query = "x axis";
    options.min_similarity = 0.99;
    auto results = graph.search(options);
    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].node.access_count, 2);

    auto export_nodes = graph.export_for_visualization().nodes;
    for (const auto& node : export_nodes) {
        double expected = std::log((node.id == "A" ? 2.0 : 1.0) + 1.0) * 10.0;
        EXPECT_NEAR(node.size, expected, 1e-9);
    }
}

TEST_F(KnowledgeGraphTest, SearchPropagatesEmbeddingFailure) {
    add_chain();
    SearchOptions options;
    options.query = "unknown text";
    EXPECT_THROW(graph.search(options), std::runtime_error);
}

TEST_F(KnowledgeGraphTest, EmptyGraphSearchDoesNotEmbed) {
    SearchOptions options;
    options.query = "unknown text";
    EXPECT_TRUE(graph.search(options).empty());
    EXPECT_EQ(embeddings->calls, 0);
}

// ==========================================
// Path Tests
// ==========================================

TEST_F(KnowledgeGraphTest, DirectedPath) {
    add_chain();

    auto path = graph.find_path("A", "C");
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(names(*path), (std::vector<std::string>{"alpha", "beta", "gamma"}));

    EXPECT_FALSE(graph.find_path("C", "A").has_value());
}

TEST_F(KnowledgeGraphTest, BidirectionalReverseTraversal) {
    ExtractionResult extraction;
    extraction.entities = {
        make_entity("P", "p", EntityType::Function),
        make_entity("Q", "q", EntityType::Function),
        make_entity("R", "r", EntityType::Function)
    };
    extraction.relationships = {
        make_relationship("e1", "P", "Q", RelationshipType::SimilarTo, true),
        make_relationship("e2", "Q", "R")
    };
    graph.add_to_graph(extraction);

    auto forward = graph.find_path("P", "R");
    ASSERT_TRUE(forward.has_value());
    EXPECT_EQ(forward->size(), 3);

    auto back = graph.find_path("Q", "P");
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(names(*back), (std::vector<std::string>{"q", "p"}));

    EXPECT_FALSE(graph.find_path("R", "P").has_value());
}

TEST_F(KnowledgeGraphTest, ShortestPathWins) {
    add_chain();

    ExtractionResult shortcut;
    shortcut.relationships = {make_relationship("r0", "A", "C")};
    graph.add_to_graph(shortcut);

    auto path = graph.find_path("A", "C");
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->size(), 2);
}

TEST_F(KnowledgeGraphTest, SelfAndUnknownPaths) {
    add_chain();

    auto self = graph.find_path("B", "B");
    ASSERT_TRUE(self.has_value());
    EXPECT_EQ(names(*self), (std::vector<std::string>{"beta"}));

    EXPECT_FALSE(graph.find_path("A", "nowhere").has_value());
    EXPECT_FALSE(graph.find_path("nowhere", "A").has_value());
}

// ==========================================
// Statistics and Cluster Tests
// ==========================================

TEST_F(KnowledgeGraphTest, Statistics) {
    add_chain();
    auto stats = graph.get_statistics();

    EXPECT_EQ(stats.node_types["function"], 2);
    EXPECT_EQ(stats.node_types["class"], 1);
    EXPECT_EQ(stats.edge_types["uses"], 1);
    EXPECT_EQ(stats.edge_types["depends_on"], 1);
    EXPECT_NEAR(stats.average_degree, 4.0 / 3.0, 1e-9);
    EXPECT_NEAR(stats.density, 2.0 / 3.0, 1e-9);
}

TEST_F(KnowledgeGraphTest, EmptyGraphMetrics) {
    auto stats = graph.get_statistics();
    EXPECT_EQ(stats.total_nodes, 0);
    EXPECT_DOUBLE_EQ(stats.average_degree, 0.0);
    EXPECT_DOUBLE_EQ(stats.density, 0.0);

    auto exported = graph.export_for_visualization();
    EXPECT_TRUE(exported.nodes.empty());
    EXPECT_TRUE(exported.clusters.empty());
    EXPECT_FALSE(graph.find_path("A", "B").has_value());
}

TEST_F(KnowledgeGraphTest, SingleNodeDensityIsZero) {
    ExtractionResult extraction;
    extraction.entities = {make_entity("solo", "solo", EntityType::Concept)};
    graph.add_to_graph(extraction);
    EXPECT_DOUBLE_EQ(graph.get_statistics().density, 0.0);
}

TEST_F(KnowledgeGraphTest, Clusters) {
    ExtractionResult extraction;
    extraction.entities = {
        make_entity("a", "seed", EntityType::Function, {1.0f, 0.0f, 0.0f}),
        make_entity("b", "near", EntityType::Function, {0.9f, 0.1f, 0.0f}),
        make_entity("c", "far", EntityType::Function, {0.0f, 1.0f, 0.0f}),
        make_entity("d", "bare", EntityType::Concept)
    };
    auto summary = graph.add_to_graph(extraction);
    EXPECT_EQ(summary.total_clusters, 3);

    auto clusters = graph.clusters();
    ASSERT_EQ(clusters.size(), 3);

    EXPECT_EQ(clusters[0].id, "cluster_0");
    EXPECT_EQ(clusters[0].name, "Cluster_seed");
    EXPECT_EQ(clusters[0].node_ids, (std::vector<std::string>{"a", "b"}));
    ASSERT_EQ(clusters[0].centroid.size(), 3);
    EXPECT_NEAR(clusters[0].centroid[0], 0.95, 1e-6);
    EXPECT_NEAR(clusters[0].centroid[1], 0.05, 1e-6);
    EXPECT_GT(clusters[0].coherence, 0.9);
    EXPECT_LE(clusters[0].coherence, 1.0 + 1e-9);

    EXPECT_EQ(clusters[1].node_ids, (std::vector<std::string>{"c"}));
    EXPECT_DOUBLE_EQ(clusters[1].coherence, 1.0);

    EXPECT_EQ(clusters[2].node_ids, (std::vector<std::string>{"d"}));
    EXPECT_TRUE(clusters[2].centroid.empty());
}

// ==========================================
// Export and Listener Tests
// ==========================================

TEST_F(KnowledgeGraphTest, ExportDoesNotMutate) {
    add_chain();
    auto before = graph.to_json();

    auto exported = graph.export_for_visualization();
    ASSERT_EQ(exported.nodes.size(), 3);
    ASSERT_EQ(exported.edges.size(), 2);

    EXPECT_EQ(graph.to_json(), before);
}

TEST_F(KnowledgeGraphTest, ExportColors) {
    add_chain();
    auto exported = graph.export_for_visualization();

    for (const auto& node : exported.nodes) {
        if (node.type == "function") EXPECT_EQ(node.color, "#4CAF50");
        if (node.type == "class") EXPECT_EQ(node.color, "#2196F3");
    }
    for (const auto& edge : exported.edges) {
        if (edge.type == "uses") EXPECT_EQ(edge.color, "#FF9800");
        if (edge.type == "depends_on") EXPECT_EQ(edge.color, "#F44336");
    }
}

TEST_F(KnowledgeGraphTest, ExportToJsonFile) {
    add_chain();
    std::string path = "test_knowledge_graph_export.json";
    graph.export_to_json(path);

    std::ifstream file(path);
    ASSERT_TRUE(file.is_open());
    nlohmann::json j;
    file >> j;
    EXPECT_EQ(j["nodes"].size(), 3);
    EXPECT_TRUE(j["nodes"][0].contains("embedding"));
    EXPECT_EQ(j["statistics"]["total_edges"], 2);
    file.close();
    std::remove(path.c_str());

    EXPECT_THROW(graph.export_to_json("/nonexistent_dir/graph.json"), std::runtime_error);
}

TEST_F(KnowledgeGraphTest, UpdateListeners) {
    std::vector<GraphUpdateSummary> seen;
    size_t id = graph.add_update_listener([&seen](const GraphUpdateSummary& summary) {
        seen.push_back(summary);
    });

    add_chain();
    ASSERT_EQ(seen.size(), 1);
    EXPECT_EQ(seen[0].nodes_added, 3);
    EXPECT_EQ(seen[0].total_edges, 2);

    graph.remove_update_listener(id);
    add_chain();
    EXPECT_EQ(seen.size(), 1);
}

TEST_F(KnowledgeGraphTest, ClearRemovesEverything) {
    add_chain();
    graph.clear();
    EXPECT_EQ(graph.num_nodes(), 0);
    EXPECT_EQ(graph.num_edges(), 0);
    EXPECT_TRUE(graph.clusters().empty());
    EXPECT_FALSE(graph.has_node("A"));
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
