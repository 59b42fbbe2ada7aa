#include "devmem/graph/knowledge_graph.hpp"
#include <cmath>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace devmem {

namespace {

std::string node_color(const std::string& type) {
    static const std::map<std::string, std::string> colors = {
        {"function", "#4CAF50"},
        {"class", "#2196F3"},
        {"module", "#FF9800"},
        {"concept", "#9C27B0"},
        {"pattern", "#00BCD4"}
    };
    auto it = colors.find(type);
    return it != colors.end() ? it->second : "#757575";
}

std::string edge_color(RelationshipType type) {
    switch (type) {
        case RelationshipType::Implements: return "#4CAF50";
        case RelationshipType::Extends: return "#2196F3";
        case RelationshipType::Uses: return "#FF9800";
        case RelationshipType::DependsOn: return "#F44336";
        case RelationshipType::SimilarTo: return "#9C27B0";
        default: return "#9E9E9E";
    }
}

} // anonymous namespace

json GraphStatistics::to_json() const {
    json j;
    j["total_nodes"] = total_nodes;
    j["total_edges"] = total_edges;
    j["total_clusters"] = total_clusters;
    j["node_types"] = node_types;
    j["edge_types"] = edge_types;
    j["average_degree"] = average_degree;
    j["density"] = density;
    return j;
}

json GraphExport::to_json() const {
    json j;

    j["nodes"] = json::array();
    for (const auto& node : nodes) {
        j["nodes"].push_back({
            {"id", node.id},
            {"label", node.label},
            {"type", node.type},
            {"size", node.size},
            {"color", node.color}
        });
    }

    j["edges"] = json::array();
    for (const auto& edge : edges) {
        j["edges"].push_back({
            {"id", edge.id},
            {"source", edge.source},
            {"target", edge.target},
            {"type", edge.type},
            {"weight", edge.weight},
            {"color", edge.color}
        });
    }

    j["clusters"] = json::array();
    for (const auto& cluster : clusters) {
        j["clusters"].push_back(cluster.to_json());
    }

    return j;
}

// ==========================================
// Statistics
// ==========================================

GraphStatistics KnowledgeGraph::get_statistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return compute_statistics();
}

GraphStatistics KnowledgeGraph::compute_statistics() const {
    GraphStatistics stats;
    stats.total_nodes = nodes_.size();
    stats.total_edges = edges_.size();
    stats.total_clusters = clusters_.size();

    for (const auto& [id, node] : nodes_) {
        stats.node_types[node.type]++;
    }

    std::map<std::string, size_t> degree;
    for (const auto& [id, edge] : edges_) {
        stats.edge_types[to_string(edge.type)]++;
        degree[edge.source_id]++;
        if (edge.target_id != edge.source_id) {
            degree[edge.target_id]++;
        }
    }

    if (!nodes_.empty()) {
        size_t total_degree = 0;
        for (const auto& [id, d] : degree) {
            total_degree += d;
        }
        stats.average_degree = static_cast<double>(total_degree) / static_cast<double>(nodes_.size());
    }

    if (nodes_.size() >= 2) {
        double n = static_cast<double>(nodes_.size());
        stats.density = static_cast<double>(edges_.size()) / (n * (n - 1.0) / 2.0);
    }

    return stats;
}

// ==========================================
// Export
// ==========================================

GraphExport KnowledgeGraph::export_for_visualization() const {
    std::lock_guard<std::mutex> lock(mutex_);

    GraphExport result;
    for (const auto& [id, node] : nodes_) {
        VisualNode visual;
        visual.id = node.id;
        visual.label = node.name;
        visual.type = node.type;
        visual.size = std::log(static_cast<double>(node.access_count) + 1.0) * 10.0;
        visual.color = node_color(node.type);
        result.nodes.push_back(std::move(visual));
    }

    for (const auto& [id, edge] : edges_) {
        VisualEdge visual;
        visual.id = edge.id;
        visual.source = edge.source_id;
        visual.target = edge.target_id;
        visual.type = to_string(edge.type);
        visual.weight = edge.weight;
        visual.color = edge_color(edge.type);
        result.edges.push_back(std::move(visual));
    }

    result.clusters = clusters_;
    return result;
}

json KnowledgeGraph::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);

    json j;
    j["nodes"] = json::array();
    for (const auto& [id, node] : nodes_) {
        j["nodes"].push_back(node.to_json(true));
    }

    j["edges"] = json::array();
    for (const auto& [id, edge] : edges_) {
        j["edges"].push_back(edge.to_json());
    }

    j["clusters"] = json::array();
    for (const auto& cluster : clusters_) {
        j["clusters"].push_back(cluster.to_json());
    }

    j["statistics"] = compute_statistics().to_json();
    return j;
}

void KnowledgeGraph::export_to_json(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }

    file << to_json().dump(2);
    file.close();
}

} // namespace devmem
