#ifndef DEVMEM_EXTRACTION_ENTITY_EXTRACTOR_HPP
#define DEVMEM_EXTRACTION_ENTITY_EXTRACTOR_HPP

#include "devmem/embedding/embedding_provider.hpp"
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>

namespace devmem {

// ============================================================================
// Data Structures
// ============================================================================

enum class EntityType {
    Function,
    Class,
    Variable,
    Concept,
    BusinessLogic,
    Preference,
    TeamPattern
};

enum class RelationshipType {
    Implements,
    Extends,
    Uses,
    DependsOn,
    SimilarTo,
    Contradicts,
    Improves,
    Replaces
};

std::string to_string(EntityType type);
std::string to_string(RelationshipType type);

/**
 * @brief Parse a relationship type name ("extends", "similar_to", ...)
 * @throws std::invalid_argument for an unknown name
 */
RelationshipType parse_relationship_type(const std::string& name);

/**
 * @brief Byte offsets of a match inside the extracted text
 */
struct TextSpan {
    size_t start = 0;
    size_t end = 0;
};

/**
 * @brief A code construct or concept mentioned in one extraction call
 */
struct Entity {
    std::string id;
    std::string text;
    EntityType type = EntityType::Concept;
    TextSpan position;
    std::map<std::string, std::string> attributes;
    std::vector<float> embedding;                      ///< Empty when unavailable

    nlohmann::json to_json() const;
};

/**
 * @brief A typed directed link between two entities
 */
struct Relationship {
    std::string id;
    std::string source_entity_id;
    std::string target_entity_id;
    RelationshipType type = RelationshipType::Uses;
    double confidence = 1.0;                           ///< [0, 1]
    bool bidirectional = false;
    nlohmann::json metadata;                           ///< Null when absent

    nlohmann::json to_json() const;
};

/**
 * @brief Output of a single extraction call
 */
struct ExtractionResult {
    std::vector<Entity> entities;
    std::vector<Relationship> relationships;
    double confidence = 0.0;

    bool empty() const { return entities.empty(); }

    /**
     * @brief Find an entity of this result by its text
     */
    const Entity* find_entity_by_text(const std::string& text) const;

    const Entity* find_entity(const std::string& id) const;

    nlohmann::json to_json() const;
};

/**
 * @brief Hints for an extraction call
 *
 * language selects the lexical pattern set ("javascript", which also covers
 * TypeScript, or "python"). attributes are copied onto every entity.
 */
struct ExtractionContext {
    std::string language = "javascript";
    std::map<std::string, std::string> attributes;
};

// ============================================================================
// Entity Extractor
// ============================================================================

/**
 * @brief Lexical entity and relationship extraction for source code
 *
 * Independent pattern passes find declarations, class hierarchies and
 * imports. Each entity is embedded; same-typed entities whose embeddings are
 * closer than the similarity threshold are linked with similar_to.
 *
 * extract() never throws: unparseable text yields an empty result and an
 * embedding failure leaves entities without vectors.
 */
class EntityExtractor {
public:
    explicit EntityExtractor(std::shared_ptr<EmbeddingProvider> embeddings);

    ExtractionResult extract(
        const std::string& text,
        const ExtractionContext& context = ExtractionContext()
    ) const;

    /**
     * @brief Batch confidence: min(0.95, 0.5 + 0.05*|E| + 0.3*avg(rel conf))
     *
     * The relationship average is 0.5 when there are no relationships;
     * the result is 0 when there are no entities.
     */
    static double calculate_confidence(
        const std::vector<Entity>& entities,
        const std::vector<Relationship>& relationships
    );

    /**
     * @brief Generate a process-unique identifier with the given prefix
     */
    static std::string generate_id(const std::string& prefix);

    void set_similarity_threshold(double threshold) { similarity_threshold_ = threshold; }
    double similarity_threshold() const { return similarity_threshold_; }

    void set_verbose(bool verbose) { verbose_ = verbose; }

    static constexpr double kExtendsConfidence = 0.95;

private:
    std::shared_ptr<EmbeddingProvider> embeddings_;
    double similarity_threshold_ = 0.8;
    bool verbose_ = false;

    struct ClassMatch {
        size_t entity_index;
        std::string parent;
    };

    void extract_javascript(
        const std::string& text,
        std::vector<Entity>& entities,
        std::vector<ClassMatch>& classes
    ) const;

    void extract_python(
        const std::string& text,
        std::vector<Entity>& entities,
        std::vector<ClassMatch>& classes
    ) const;

    void link_class_parents(
        std::vector<Entity>& entities,
        const std::vector<ClassMatch>& classes,
        std::vector<Relationship>& relationships
    ) const;

    void embed_entities(std::vector<Entity>& entities) const;

    void link_similar_entities(
        const std::vector<Entity>& entities,
        std::vector<Relationship>& relationships
    ) const;
};

} // namespace devmem

#endif // DEVMEM_EXTRACTION_ENTITY_EXTRACTOR_HPP
