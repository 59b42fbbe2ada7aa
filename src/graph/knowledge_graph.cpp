#include "devmem/graph/knowledge_graph.hpp"
#include <algorithm>
#include <iostream>
#include <queue>
#include <set>
#include <stdexcept>

using json = nlohmann::json;

namespace devmem {

namespace {

long long to_epoch_millis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()
    ).count();
}

bool json_array_contains(const json& array, const json& value) {
    return std::find(array.begin(), array.end(), value) != array.end();
}

} // anonymous namespace

// ==========================================
// Node / Edge / Cluster serialization
// ==========================================

json KnowledgeNode::to_json(bool include_embedding) const {
    json j;
    j["id"] = id;
    j["type"] = type;
    j["name"] = name;
    j["content"] = content;
    j["confidence"] = confidence;
    j["last_accessed"] = to_epoch_millis(last_accessed);
    j["access_count"] = access_count;
    j["metadata"] = {
        {"complexity", metadata.complexity},
        {"quality", metadata.quality},
        {"relevance", metadata.relevance}
    };
    j["properties"] = properties;
    if (include_embedding && !embedding.empty()) {
        j["embedding"] = embedding;
    }
    return j;
}

json ConceptEdge::to_json() const {
    json j;
    j["id"] = id;
    j["source_id"] = source_id;
    j["target_id"] = target_id;
    j["type"] = to_string(type);
    j["weight"] = weight;
    j["confidence"] = confidence;
    j["bidirectional"] = bidirectional;
    return j;
}

json ConceptCluster::to_json() const {
    json j;
    j["id"] = id;
    j["name"] = name;
    j["node_ids"] = node_ids;
    j["centroid"] = centroid;
    j["coherence"] = coherence;
    return j;
}

json SearchResult::to_json() const {
    json j;
    j["node"] = node.to_json();
    j["similarity"] = similarity;
    if (!relationships.empty()) {
        json rels = json::array();
        for (const auto& edge : relationships) {
            rels.push_back(edge.to_json());
        }
        j["relationships"] = rels;
    }
    return j;
}

json GraphUpdateSummary::to_json() const {
    return {
        {"nodes_added", nodes_added},
        {"edges_added", edges_added},
        {"edges_rejected", edges_rejected},
        {"total_nodes", total_nodes},
        {"total_edges", total_edges},
        {"total_clusters", total_clusters}
    };
}

FilterOperator parse_filter_operator(const std::string& name) {
    if (name == "eq") return FilterOperator::Eq;
    if (name == "neq") return FilterOperator::Neq;
    if (name == "gt") return FilterOperator::Gt;
    if (name == "lt") return FilterOperator::Lt;
    if (name == "contains") return FilterOperator::Contains;
    if (name == "in") return FilterOperator::In;
    throw std::invalid_argument("Unknown filter operator: " + name);
}

// ==========================================
// KnowledgeGraph
// ==========================================

KnowledgeGraph::KnowledgeGraph(std::shared_ptr<EmbeddingProvider> embeddings)
    : embeddings_(std::move(embeddings)) {
    if (!embeddings_) {
        throw std::invalid_argument("KnowledgeGraph requires an embedding provider");
    }
}

std::string KnowledgeGraph::map_entity_type(const Entity& entity) {
    switch (entity.type) {
        case EntityType::Function: return "function";
        case EntityType::Class: return "class";
        case EntityType::Variable: return "pattern";
        case EntityType::Concept: {
            auto it = entity.attributes.find("kind");
            if (it != entity.attributes.end() && it->second == "module") {
                return "module";
            }
            return "concept";
        }
        case EntityType::BusinessLogic: return "concept";
        case EntityType::Preference: return "pattern";
        case EntityType::TeamPattern: return "pattern";
    }
    return "concept";
}

std::string KnowledgeGraph::assess_complexity(const std::string& text) {
    if (text.size() < 20) return "low";
    if (text.size() < 50) return "medium";
    return "high";
}

GraphUpdateSummary KnowledgeGraph::add_to_graph(const ExtractionResult& extraction) {
    GraphUpdateSummary summary;
    auto now = std::chrono::system_clock::now();

    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::set<std::string> batch_ids;
        for (const auto& entity : extraction.entities) {
            batch_ids.insert(entity.id);

            KnowledgeNode node;
            node.id = entity.id;
            node.type = map_entity_type(entity);
            node.name = entity.text;
            node.content = entity.text;
            node.embedding = entity.embedding;
            node.confidence = extraction.confidence;
            node.last_accessed = now;
            node.access_count = 1;
            node.metadata.complexity = assess_complexity(entity.text);
            node.metadata.quality = extraction.confidence;
            node.metadata.relevance = 1.0;
            node.properties = entity.attributes;

            // Re-extraction replaces the node and restarts its access history
            nodes_[node.id] = std::move(node);
            summary.nodes_added++;
        }

        for (const auto& rel : extraction.relationships) {
            bool source_known = batch_ids.count(rel.source_entity_id) > 0 ||
                                nodes_.count(rel.source_entity_id) > 0;
            bool target_known = batch_ids.count(rel.target_entity_id) > 0 ||
                                nodes_.count(rel.target_entity_id) > 0;

            if (!source_known || !target_known) {
                summary.edges_rejected++;
                std::cerr << "Rejected relationship " << rel.id
                          << ": endpoint not in batch or graph\n";
                continue;
            }

            ConceptEdge edge;
            edge.id = rel.id;
            edge.source_id = rel.source_entity_id;
            edge.target_id = rel.target_entity_id;
            edge.type = rel.type;
            edge.weight = rel.confidence;
            edge.confidence = rel.confidence;
            edge.bidirectional = rel.bidirectional;

            edges_[edge.id] = edge;
            summary.edges_added++;
        }

        update_clusters();

        summary.total_nodes = nodes_.size();
        summary.total_edges = edges_.size();
        summary.total_clusters = clusters_.size();
    }

    notify_listeners(summary);
    return summary;
}

std::vector<SearchResult> KnowledgeGraph::search(const SearchOptions& options) {
    if (options.top_k == 0 || num_nodes() == 0) {
        return {};
    }

    // Embedding may be slow or remote; do it before taking the lock.
    std::vector<float> query_embedding = embeddings_->embed(options.query);

    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<SearchResult> results;
    for (const auto& [node_id, node] : nodes_) {
        if (node.embedding.empty()) continue;

        double similarity = cosine_similarity(query_embedding, node.embedding);
        if (similarity < options.min_similarity) continue;

        if (!options.filters.empty() && !passes_filters(node, options.filters)) {
            continue;
        }

        SearchResult result;
        result.node = node;
        result.similarity = similarity;
        results.push_back(std::move(result));
    }

    std::sort(results.begin(), results.end(), [](const SearchResult& a, const SearchResult& b) {
        if (a.similarity != b.similarity) {
            return a.similarity > b.similarity;
        }
        return a.node.id < b.node.id;
    });

    if (results.size() > options.top_k) {
        results.resize(options.top_k);
    }

    auto now = std::chrono::system_clock::now();
    for (auto& result : results) {
        auto& stored = nodes_.at(result.node.id);
        stored.access_count++;
        stored.last_accessed = now;
        result.node.access_count = stored.access_count;
        result.node.last_accessed = now;

        if (options.include_relationships) {
            result.relationships = edges_touching(result.node.id);
        }
    }

    return results;
}

std::optional<std::vector<KnowledgeNode>> KnowledgeGraph::find_path(
    const std::string& source_id,
    const std::string& target_id
) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (nodes_.count(source_id) == 0 || nodes_.count(target_id) == 0) {
        return std::nullopt;
    }

    if (source_id == target_id) {
        return std::vector<KnowledgeNode>{nodes_.at(source_id)};
    }

    std::map<std::string, std::vector<std::string>> adjacency;
    for (const auto& [edge_id, edge] : edges_) {
        adjacency[edge.source_id].push_back(edge.target_id);
        if (edge.bidirectional) {
            adjacency[edge.target_id].push_back(edge.source_id);
        }
    }

    std::queue<std::string> frontier;
    std::map<std::string, std::string> parent;
    std::set<std::string> visited;

    frontier.push(source_id);
    visited.insert(source_id);

    bool found = false;
    while (!frontier.empty() && !found) {
        std::string current = frontier.front();
        frontier.pop();

        auto adj = adjacency.find(current);
        if (adj == adjacency.end()) continue;

        for (const auto& next : adj->second) {
            if (visited.count(next) > 0) continue;

            visited.insert(next);
            parent[next] = current;
            if (next == target_id) {
                found = true;
                break;
            }
            frontier.push(next);
        }
    }

    if (!found) {
        return std::nullopt;
    }

    std::vector<KnowledgeNode> path;
    std::string current = target_id;
    while (true) {
        path.push_back(nodes_.at(current));
        if (current == source_id) break;
        current = parent.at(current);
    }
    std::reverse(path.begin(), path.end());

    return path;
}

std::optional<KnowledgeNode> KnowledgeGraph::get_node(const std::string& node_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = nodes_.find(node_id);
    if (it == nodes_.end()) {
        return std::nullopt;
    }
    it->second.access_count++;
    it->second.last_accessed = std::chrono::system_clock::now();
    return it->second;
}

bool KnowledgeGraph::has_node(const std::string& node_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nodes_.find(node_id) != nodes_.end();
}

bool KnowledgeGraph::has_edge(const std::string& edge_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return edges_.find(edge_id) != edges_.end();
}

size_t KnowledgeGraph::num_nodes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nodes_.size();
}

size_t KnowledgeGraph::num_edges() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return edges_.size();
}

std::vector<ConceptCluster> KnowledgeGraph::clusters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clusters_;
}

void KnowledgeGraph::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    nodes_.clear();
    edges_.clear();
    clusters_.clear();
}

size_t KnowledgeGraph::add_update_listener(GraphUpdateListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    size_t id = next_listener_id_++;
    listeners_[id] = std::move(listener);
    return id;
}

void KnowledgeGraph::remove_update_listener(size_t listener_id) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.erase(listener_id);
}

void KnowledgeGraph::notify_listeners(const GraphUpdateSummary& summary) {
    std::vector<GraphUpdateListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        for (const auto& [id, listener] : listeners_) {
            listeners.push_back(listener);
        }
    }

    for (const auto& listener : listeners) {
        if (listener) {
            listener(summary);
        }
    }
}

// ==========================================
// Internal Helpers
// ==========================================

void KnowledgeGraph::update_clusters() {
    std::vector<ConceptCluster> clusters;
    std::set<std::string> assigned;

    for (const auto& [seed_id, seed] : nodes_) {
        if (assigned.count(seed_id) > 0) continue;

        ConceptCluster cluster;
        cluster.id = "cluster_" + std::to_string(clusters.size());
        cluster.name = "Cluster_" + seed.name;
        cluster.node_ids.push_back(seed_id);
        assigned.insert(seed_id);

        if (!seed.embedding.empty()) {
            for (const auto& [other_id, other] : nodes_) {
                if (assigned.count(other_id) > 0) continue;
                if (cosine_similarity(seed.embedding, other.embedding) >= kClusteringThreshold) {
                    cluster.node_ids.push_back(other_id);
                    assigned.insert(other_id);
                }
            }
        }

        // Centroid over members that carry an embedding of the seed's size
        std::vector<float> centroid(seed.embedding.size(), 0.0f);
        size_t embedded = 0;
        for (const auto& member_id : cluster.node_ids) {
            const auto& member = nodes_.at(member_id);
            if (member.embedding.empty() || member.embedding.size() != centroid.size()) continue;
            for (size_t i = 0; i < centroid.size(); ++i) {
                centroid[i] += member.embedding[i];
            }
            embedded++;
        }
        if (embedded > 0) {
            for (auto& value : centroid) {
                value /= static_cast<float>(embedded);
            }
        }
        cluster.centroid = centroid;

        if (cluster.node_ids.size() > 1 && embedded > 0) {
            double total = 0.0;
            for (const auto& member_id : cluster.node_ids) {
                total += cosine_similarity(nodes_.at(member_id).embedding, centroid);
            }
            cluster.coherence = total / static_cast<double>(cluster.node_ids.size());
        } else {
            cluster.coherence = 1.0;
        }

        clusters.push_back(std::move(cluster));
    }

    clusters_ = std::move(clusters);
}

std::vector<ConceptEdge> KnowledgeGraph::edges_touching(const std::string& node_id) const {
    std::vector<ConceptEdge> result;
    for (const auto& [edge_id, edge] : edges_) {
        if (edge.source_id == node_id || edge.target_id == node_id) {
            result.push_back(edge);
        }
    }
    return result;
}

json KnowledgeGraph::node_field(const KnowledgeNode& node, const std::string& field) {
    if (field == "id") return node.id;
    if (field == "type") return node.type;
    if (field == "name") return node.name;
    if (field == "content") return node.content;
    if (field == "confidence") return node.confidence;
    if (field == "access_count" || field == "accessCount") return node.access_count;
    if (field == "complexity") return node.metadata.complexity;
    if (field == "quality") return node.metadata.quality;
    if (field == "relevance") return node.metadata.relevance;

    auto it = node.properties.find(field);
    if (it != node.properties.end()) {
        return it->second;
    }
    return nullptr;
}

bool KnowledgeGraph::passes_filters(const KnowledgeNode& node, const std::vector<SearchFilter>& filters) {
    for (const auto& filter : filters) {
        json value = node_field(node, filter.field);

        switch (filter.op) {
            case FilterOperator::Eq:
                if (value != filter.value) return false;
                break;
            case FilterOperator::Neq:
                if (value == filter.value) return false;
                break;
            case FilterOperator::Gt:
            case FilterOperator::Lt: {
                bool comparable =
                    (value.is_number() && filter.value.is_number()) ||
                    (value.is_string() && filter.value.is_string());
                if (!comparable) return false;
                bool greater = filter.op == FilterOperator::Gt;
                if (greater && !(value > filter.value)) return false;
                if (!greater && !(value < filter.value)) return false;
                break;
            }
            case FilterOperator::Contains: {
                if (value.is_null()) return false;
                if (value.is_array()) {
                    if (!json_array_contains(value, filter.value)) return false;
                    break;
                }
                std::string haystack = value.is_string() ? value.get<std::string>() : value.dump();
                std::string needle = filter.value.is_string()
                    ? filter.value.get<std::string>()
                    : filter.value.dump();
                if (haystack.find(needle) == std::string::npos) return false;
                break;
            }
            case FilterOperator::In:
                if (!filter.value.is_array() || !json_array_contains(filter.value, value)) {
                    return false;
                }
                break;
        }
    }

    return true;
}

} // namespace devmem
