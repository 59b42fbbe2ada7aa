#include "devmem/extraction/entity_extractor.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <regex>
#include <stdexcept>

using json = nlohmann::json;

namespace devmem {

namespace {

const std::regex& js_declaration_pattern() {
    static const std::regex pattern(
        R"((?:function|const|let|var)\s+(\w+)\s*=?\s*(?:\([^)]*\)|async))");
    return pattern;
}

const std::regex& js_class_pattern() {
    static const std::regex pattern(R"(class\s+(\w+)(?:\s+extends\s+(\w+))?)");
    return pattern;
}

const std::regex& js_import_pattern() {
    static const std::regex pattern(
        R"(import\s+(?:\{[^}]+\}|\w+)\s+from\s+['"]([^'"]+)['"])");
    return pattern;
}

const std::regex& py_def_pattern() {
    static const std::regex pattern(R"((?:async\s+)?def\s+(\w+)\s*\()");
    return pattern;
}

const std::regex& py_class_pattern() {
    static const std::regex pattern(R"(class\s+(\w+)\s*(?:\(\s*([\w.]*)[^)]*\))?\s*:)");
    return pattern;
}

const std::regex& py_import_pattern() {
    static const std::regex pattern(
        R"((?:^|\n)[ \t]*(?:from[ \t]+([\w.]+)[ \t]+import|import[ \t]+([\w.]+)))");
    return pattern;
}

Entity make_entity(
    const std::string& text,
    EntityType type,
    size_t start,
    size_t end,
    const std::string& source
) {
    Entity entity;
    entity.id = EntityExtractor::generate_id("entity");
    entity.text = text;
    entity.type = type;
    entity.position.start = start;
    entity.position.end = end;
    entity.attributes["source"] = source;
    return entity;
}

} // anonymous namespace

// ============================================================================
// Enum names
// ============================================================================

std::string to_string(EntityType type) {
    switch (type) {
        case EntityType::Function: return "function";
        case EntityType::Class: return "class";
        case EntityType::Variable: return "variable";
        case EntityType::Concept: return "concept";
        case EntityType::BusinessLogic: return "business_logic";
        case EntityType::Preference: return "preference";
        case EntityType::TeamPattern: return "team_pattern";
    }
    return "concept";
}

std::string to_string(RelationshipType type) {
    switch (type) {
        case RelationshipType::Implements: return "implements";
        case RelationshipType::Extends: return "extends";
        case RelationshipType::Uses: return "uses";
        case RelationshipType::DependsOn: return "depends_on";
        case RelationshipType::SimilarTo: return "similar_to";
        case RelationshipType::Contradicts: return "contradicts";
        case RelationshipType::Improves: return "improves";
        case RelationshipType::Replaces: return "replaces";
    }
    return "uses";
}

RelationshipType parse_relationship_type(const std::string& name) {
    static const std::map<std::string, RelationshipType> names = {
        {"implements", RelationshipType::Implements},
        {"extends", RelationshipType::Extends},
        {"uses", RelationshipType::Uses},
        {"depends_on", RelationshipType::DependsOn},
        {"similar_to", RelationshipType::SimilarTo},
        {"contradicts", RelationshipType::Contradicts},
        {"improves", RelationshipType::Improves},
        {"replaces", RelationshipType::Replaces}
    };

    auto it = names.find(name);
    if (it == names.end()) {
        throw std::invalid_argument("Unknown relationship type: " + name);
    }
    return it->second;
}

// ============================================================================
// Entity / Relationship / ExtractionResult
// ============================================================================

json Entity::to_json() const {
    json j;
    j["id"] = id;
    j["text"] = text;
    j["type"] = to_string(type);
    j["position"] = {{"start", position.start}, {"end", position.end}};
    j["attributes"] = attributes;
    return j;
}

json Relationship::to_json() const {
    json j;
    j["id"] = id;
    j["source_entity_id"] = source_entity_id;
    j["target_entity_id"] = target_entity_id;
    j["type"] = to_string(type);
    j["confidence"] = confidence;
    j["bidirectional"] = bidirectional;
    if (!metadata.is_null()) {
        j["metadata"] = metadata;
    }
    return j;
}

const Entity* ExtractionResult::find_entity_by_text(const std::string& text) const {
    for (const auto& entity : entities) {
        if (entity.text == text) {
            return &entity;
        }
    }
    return nullptr;
}

const Entity* ExtractionResult::find_entity(const std::string& id) const {
    for (const auto& entity : entities) {
        if (entity.id == id) {
            return &entity;
        }
    }
    return nullptr;
}

json ExtractionResult::to_json() const {
    json j;
    json entities_json = json::array();
    for (const auto& entity : entities) {
        entities_json.push_back(entity.to_json());
    }
    json relationships_json = json::array();
    for (const auto& rel : relationships) {
        relationships_json.push_back(rel.to_json());
    }
    j["entities"] = entities_json;
    j["relationships"] = relationships_json;
    j["confidence"] = confidence;
    return j;
}

// ============================================================================
// EntityExtractor
// ============================================================================

EntityExtractor::EntityExtractor(std::shared_ptr<EmbeddingProvider> embeddings)
    : embeddings_(std::move(embeddings)) {
    if (!embeddings_) {
        throw std::invalid_argument("EntityExtractor requires an embedding provider");
    }
}

std::string EntityExtractor::generate_id(const std::string& prefix) {
    static std::atomic<uint64_t> counter{0};
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
    return prefix + "_" + std::to_string(millis) + "_" + std::to_string(counter++);
}

ExtractionResult EntityExtractor::extract(
    const std::string& text,
    const ExtractionContext& context
) const {
    ExtractionResult result;
    std::vector<ClassMatch> classes;

    try {
        if (context.language == "python") {
            extract_python(text, result.entities, classes);
        } else {
            extract_javascript(text, result.entities, classes);
        }
    } catch (const std::regex_error& e) {
        // Pathological input can exhaust the regex engine; keep what matched.
        if (verbose_) {
            std::cerr << "Pattern extraction stopped early: " << e.what() << "\n";
        }
    }

    if (result.entities.empty()) {
        return result;
    }

    link_class_parents(result.entities, classes, result.relationships);

    for (auto& entity : result.entities) {
        for (const auto& [key, value] : context.attributes) {
            entity.attributes.emplace(key, value);
        }
    }

    embed_entities(result.entities);
    link_similar_entities(result.entities, result.relationships);

    result.confidence = calculate_confidence(result.entities, result.relationships);
    return result;
}

void EntityExtractor::extract_javascript(
    const std::string& text,
    std::vector<Entity>& entities,
    std::vector<ClassMatch>& classes
) const {
    std::sregex_iterator end;

    for (std::sregex_iterator it(text.begin(), text.end(), js_declaration_pattern()); it != end; ++it) {
        const auto& match = *it;
        size_t start = static_cast<size_t>(match.position(0));
        entities.push_back(make_entity(
            match.str(1), EntityType::Function,
            start, start + static_cast<size_t>(match.length(0)),
            "pattern_extraction"
        ));
    }

    for (std::sregex_iterator it(text.begin(), text.end(), js_class_pattern()); it != end; ++it) {
        const auto& match = *it;
        size_t start = static_cast<size_t>(match.position(0));
        entities.push_back(make_entity(
            match.str(1), EntityType::Class,
            start, start + static_cast<size_t>(match.length(0)),
            "pattern_extraction"
        ));
        if (match[2].matched) {
            classes.push_back({entities.size() - 1, match.str(2)});
        }
    }

    for (std::sregex_iterator it(text.begin(), text.end(), js_import_pattern()); it != end; ++it) {
        const auto& match = *it;
        size_t start = static_cast<size_t>(match.position(0));
        Entity module = make_entity(
            match.str(1), EntityType::Concept,
            start, start + static_cast<size_t>(match.length(0)),
            "import"
        );
        module.attributes["kind"] = "module";
        entities.push_back(std::move(module));
    }
}

void EntityExtractor::extract_python(
    const std::string& text,
    std::vector<Entity>& entities,
    std::vector<ClassMatch>& classes
) const {
    std::sregex_iterator end;

    for (std::sregex_iterator it(text.begin(), text.end(), py_def_pattern()); it != end; ++it) {
        const auto& match = *it;
        size_t start = static_cast<size_t>(match.position(0));
        entities.push_back(make_entity(
            match.str(1), EntityType::Function,
            start, start + static_cast<size_t>(match.length(0)),
            "pattern_extraction"
        ));
    }

    for (std::sregex_iterator it(text.begin(), text.end(), py_class_pattern()); it != end; ++it) {
        const auto& match = *it;
        size_t start = static_cast<size_t>(match.position(0));
        entities.push_back(make_entity(
            match.str(1), EntityType::Class,
            start, start + static_cast<size_t>(match.length(0)),
            "pattern_extraction"
        ));
        std::string parent = match[2].matched ? match.str(2) : "";
        if (!parent.empty() && parent != "object") {
            classes.push_back({entities.size() - 1, parent});
        }
    }

    for (std::sregex_iterator it(text.begin(), text.end(), py_import_pattern()); it != end; ++it) {
        const auto& match = *it;
        std::string whole = match.str(0);
        size_t skip = whole.find_first_not_of(" \t\n");
        size_t start = static_cast<size_t>(match.position(0)) + skip;
        size_t finish = static_cast<size_t>(match.position(0) + match.length(0));

        Entity module = make_entity(
            match[1].matched ? match.str(1) : match.str(2), EntityType::Concept,
            start, finish,
            "import"
        );
        module.attributes["kind"] = "module";
        entities.push_back(std::move(module));
    }
}

void EntityExtractor::link_class_parents(
    std::vector<Entity>& entities,
    const std::vector<ClassMatch>& classes,
    std::vector<Relationship>& relationships
) const {
    for (const auto& cls : classes) {
        // Prefer a matched class, then any entity with that name.
        auto parent_it = std::find_if(entities.begin(), entities.end(), [&](const Entity& e) {
            return e.text == cls.parent && e.type == EntityType::Class;
        });
        if (parent_it == entities.end()) {
            parent_it = std::find_if(entities.begin(), entities.end(), [&](const Entity& e) {
                return e.text == cls.parent;
            });
        }

        std::string parent_id;
        if (parent_it != entities.end()) {
            parent_id = parent_it->id;
        } else {
            Entity placeholder = make_entity(cls.parent, EntityType::Class, 0, 0, "inferred");
            parent_id = placeholder.id;
            entities.push_back(std::move(placeholder));
        }

        Relationship rel;
        rel.id = generate_id("rel");
        rel.source_entity_id = entities[cls.entity_index].id;
        rel.target_entity_id = parent_id;
        rel.type = RelationshipType::Extends;
        rel.confidence = kExtendsConfidence;
        rel.bidirectional = false;
        relationships.push_back(std::move(rel));
    }
}

void EntityExtractor::embed_entities(std::vector<Entity>& entities) const {
    for (auto& entity : entities) {
        try {
            entity.embedding = embeddings_->embed(entity.text);
        } catch (const std::exception& e) {
            entity.embedding.clear();
            if (verbose_) {
                std::cerr << "Embedding failed for entity '" << entity.text
                          << "': " << e.what() << "\n";
            }
        }
    }
}

void EntityExtractor::link_similar_entities(
    const std::vector<Entity>& entities,
    std::vector<Relationship>& relationships
) const {
    for (size_t i = 0; i < entities.size(); ++i) {
        for (size_t j = i + 1; j < entities.size(); ++j) {
            if (entities[i].type != entities[j].type) continue;
            if (entities[i].embedding.empty() || entities[j].embedding.empty()) continue;

            double similarity = cosine_similarity(entities[i].embedding, entities[j].embedding);
            if (similarity <= similarity_threshold_) continue;

            similarity = std::min(1.0, similarity);

            Relationship rel;
            rel.id = generate_id("rel");
            rel.source_entity_id = entities[i].id;
            rel.target_entity_id = entities[j].id;
            rel.type = RelationshipType::SimilarTo;
            rel.confidence = similarity;
            rel.bidirectional = true;
            rel.metadata = {{"similarity", similarity}};
            relationships.push_back(std::move(rel));
        }
    }
}

double EntityExtractor::calculate_confidence(
    const std::vector<Entity>& entities,
    const std::vector<Relationship>& relationships
) {
    if (entities.empty()) {
        return 0.0;
    }

    double avg_relationship_confidence = 0.5;
    if (!relationships.empty()) {
        double sum = 0.0;
        for (const auto& rel : relationships) {
            sum += rel.confidence;
        }
        avg_relationship_confidence = sum / static_cast<double>(relationships.size());
    }

    return std::min(
        0.95,
        0.5 + static_cast<double>(entities.size()) * 0.05 + avg_relationship_confidence * 0.3
    );
}

} // namespace devmem
