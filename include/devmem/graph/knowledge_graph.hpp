#ifndef DEVMEM_GRAPH_KNOWLEDGE_GRAPH_HPP
#define DEVMEM_GRAPH_KNOWLEDGE_GRAPH_HPP

#include "devmem/embedding/embedding_provider.hpp"
#include "devmem/extraction/entity_extractor.hpp"
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <functional>
#include <chrono>
#include <nlohmann/json.hpp>

namespace devmem {

/**
 * @brief Quality and relevance annotations of a graph node
 */
struct NodeMetadata {
    std::string complexity = "low";                    // "low", "medium" or "high"
    double quality = 0.0;                              // [0, 1]
    double relevance = 1.0;                            // [0, 1]
};

/**
 * @brief A vertex of the knowledge graph, derived from extracted entities
 *
 * type is one of "function", "class", "module", "concept", "pattern".
 */
struct KnowledgeNode {
    std::string id;
    std::string type;
    std::string name;
    std::string content;
    std::vector<float> embedding;
    double confidence = 0.0;
    std::chrono::system_clock::time_point last_accessed;
    size_t access_count = 0;
    NodeMetadata metadata;
    std::map<std::string, std::string> properties;     // Entity attributes

    nlohmann::json to_json(bool include_embedding = false) const;
};

/**
 * @brief A typed directed edge; weight mirrors the relationship confidence
 */
struct ConceptEdge {
    std::string id;
    std::string source_id;
    std::string target_id;
    RelationshipType type = RelationshipType::Uses;
    double weight = 0.0;
    double confidence = 0.0;
    bool bidirectional = false;                        // Traversable target -> source

    nlohmann::json to_json() const;
};

/**
 * @brief Group of nodes whose embeddings lie close to a seed node
 */
struct ConceptCluster {
    std::string id;
    std::string name;
    std::vector<std::string> node_ids;
    std::vector<float> centroid;                       // Mean of member embeddings
    double coherence = 1.0;                            // Mean member similarity to centroid

    nlohmann::json to_json() const;
};

// ==========================================
// Search
// ==========================================

enum class FilterOperator {
    Eq,
    Neq,
    Gt,
    Lt,
    Contains,
    In
};

/**
 * @brief Parse "eq", "neq", "gt", "lt", "contains" or "in"
 * @throws std::invalid_argument for an unknown operator
 */
FilterOperator parse_filter_operator(const std::string& name);

/**
 * @brief Constraint on a node field
 *
 * Fields: id, type, name, content, confidence, access_count, complexity,
 * quality, relevance, or any property key. Unknown fields read as null.
 */
struct SearchFilter {
    std::string field;
    FilterOperator op = FilterOperator::Eq;
    nlohmann::json value;
};

struct SearchOptions {
    std::string query;
    size_t top_k = 10;
    double min_similarity = 0.5;
    std::vector<SearchFilter> filters;
    bool include_relationships = false;
};

struct SearchResult {
    KnowledgeNode node;
    double similarity = 0.0;
    std::vector<ConceptEdge> relationships;            // Filled when requested

    nlohmann::json to_json() const;
};

// ==========================================
// Statistics and Export
// ==========================================

struct GraphStatistics {
    size_t total_nodes = 0;
    size_t total_edges = 0;
    size_t total_clusters = 0;
    std::map<std::string, size_t> node_types;
    std::map<std::string, size_t> edge_types;
    double average_degree = 0.0;
    double density = 0.0;

    nlohmann::json to_json() const;
};

struct VisualNode {
    std::string id;
    std::string label;
    std::string type;
    double size = 0.0;
    std::string color;
};

struct VisualEdge {
    std::string id;
    std::string source;
    std::string target;
    std::string type;
    double weight = 0.0;
    std::string color;
};

/**
 * @brief Read-only projection of the graph for rendering layers
 */
struct GraphExport {
    std::vector<VisualNode> nodes;
    std::vector<VisualEdge> edges;
    std::vector<ConceptCluster> clusters;

    nlohmann::json to_json() const;
};

/**
 * @brief Payload of the graphUpdated notification
 */
struct GraphUpdateSummary {
    size_t nodes_added = 0;
    size_t edges_added = 0;
    size_t edges_rejected = 0;                         // Dangling endpoints
    size_t total_nodes = 0;
    size_t total_edges = 0;
    size_t total_clusters = 0;

    nlohmann::json to_json() const;
};

using GraphUpdateListener = std::function<void(const GraphUpdateSummary&)>;

// ==========================================
// Knowledge Graph
// ==========================================

/**
 * @brief Semantic knowledge graph of code entities and their relationships
 *
 * Nodes, edges and clusters are owned here and change only through
 * add_to_graph() and clear(). All public methods are safe to call from
 * several threads; mutation is serialized by an internal mutex.
 */
class KnowledgeGraph {
public:
    explicit KnowledgeGraph(std::shared_ptr<EmbeddingProvider> embeddings);

    /**
     * @brief Merge an extraction into the graph
     *
     * Upserts one node per entity and one edge per relationship, then
     * recomputes all clusters and notifies update listeners. Relationships
     * whose endpoints are neither in the extraction nor in the graph are
     * rejected.
     */
    GraphUpdateSummary add_to_graph(const ExtractionResult& extraction);

    /**
     * @brief Rank embedded nodes by cosine similarity to the query text
     *
     * Results are sorted by descending similarity, ties by ascending node
     * id. Returned nodes have their access statistics updated.
     *
     * @throws std::runtime_error if the query cannot be embedded
     */
    std::vector<SearchResult> search(const SearchOptions& options);

    /**
     * @brief Shortest path by edge count between two nodes
     *
     * Edges are followed source -> target, and target -> source only when
     * bidirectional. Among equal-length paths the one found first by BFS in
     * edge-id order wins.
     *
     * @return Ordered node list, or std::nullopt when unreachable
     */
    std::optional<std::vector<KnowledgeNode>> find_path(
        const std::string& source_id,
        const std::string& target_id
    ) const;

    GraphStatistics get_statistics() const;

    GraphExport export_for_visualization() const;

    /**
     * @brief Fetch a node and record the access
     */
    std::optional<KnowledgeNode> get_node(const std::string& node_id);

    bool has_node(const std::string& node_id) const;
    bool has_edge(const std::string& edge_id) const;
    size_t num_nodes() const;
    size_t num_edges() const;
    std::vector<ConceptCluster> clusters() const;

    /**
     * @brief Remove all nodes, edges and clusters
     */
    void clear();

    /**
     * @brief Full dump including embeddings and statistics
     */
    nlohmann::json to_json() const;

    void export_to_json(const std::string& filename) const;

    size_t add_update_listener(GraphUpdateListener listener);
    void remove_update_listener(size_t listener_id);

    /**
     * @brief Node type for an entity (fixed table)
     */
    static std::string map_entity_type(const Entity& entity);

    static std::string assess_complexity(const std::string& text);

    static constexpr double kClusteringThreshold = 0.7;

private:
    std::shared_ptr<EmbeddingProvider> embeddings_;

    mutable std::mutex mutex_;
    std::map<std::string, KnowledgeNode> nodes_;       // node_id -> node
    std::map<std::string, ConceptEdge> edges_;         // edge_id -> edge
    std::vector<ConceptCluster> clusters_;

    std::mutex listeners_mutex_;
    std::map<size_t, GraphUpdateListener> listeners_;
    size_t next_listener_id_ = 1;

    // The helpers below expect mutex_ to be held.
    void update_clusters();
    GraphStatistics compute_statistics() const;
    std::vector<ConceptEdge> edges_touching(const std::string& node_id) const;

    void notify_listeners(const GraphUpdateSummary& summary);

    static bool passes_filters(const KnowledgeNode& node, const std::vector<SearchFilter>& filters);
    static nlohmann::json node_field(const KnowledgeNode& node, const std::string& field);
};

} // namespace devmem

#endif // DEVMEM_GRAPH_KNOWLEDGE_GRAPH_HPP
