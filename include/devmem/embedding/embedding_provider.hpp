#ifndef DEVMEM_EMBEDDING_EMBEDDING_PROVIDER_HPP
#define DEVMEM_EMBEDDING_EMBEDDING_PROVIDER_HPP

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace devmem {

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Configuration for an embedding provider
 */
struct EmbeddingConfig {
    std::string provider = "hashing";       ///< "hashing" or "openai"
    size_t dimension = 384;                 ///< Vector size (hashing provider)
    std::string api_key;                    ///< API key (openai provider)
    std::string model = "text-embedding-3-small";
    std::string api_base_url = "https://api.openai.com/v1";
    int timeout_seconds = 60;               ///< Request timeout
    int max_retries = 3;                    ///< Retry attempts on failure
    bool cache_enabled = true;              ///< Wrap provider in an exact-text cache
    bool verbose = false;                   ///< Verbose logging

    nlohmann::json to_json() const;
    static EmbeddingConfig from_json(const nlohmann::json& j);

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;
};

// ============================================================================
// Embedding Provider Interface
// ============================================================================

/**
 * @brief Abstract text-to-vector producer
 *
 * Any deterministic producer works: equal text must give equal vectors and
 * every vector must have dimension() entries.
 */
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    /**
     * @brief Embed a text
     * @throws std::runtime_error when the vector cannot be produced
     */
    virtual std::vector<float> embed(const std::string& text) = 0;

    virtual size_t dimension() const = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Local, dependency-free embedding based on feature hashing
 *
 * Identifiers are split on camelCase and snake_case boundaries and
 * lower-cased. Each token contributes a full-weight bucket and its
 * boundary-marked character trigrams contribute half-weight buckets.
 * The result is L2-normalized.
 */
class HashingEmbeddingProvider : public EmbeddingProvider {
public:
    explicit HashingEmbeddingProvider(size_t dimension = 384);

    std::vector<float> embed(const std::string& text) override;
    size_t dimension() const override { return dimension_; }
    std::string name() const override { return "hashing"; }

    /**
     * @brief Split text into lower-cased identifier tokens
     */
    static std::vector<std::string> tokenize(const std::string& text);

private:
    size_t dimension_;

    void add_feature(std::vector<float>& vec, const std::string& feature, float weight) const;
};

/**
 * @brief Remote embedding model behind an OpenAI-compatible /embeddings endpoint
 */
class OpenAIEmbeddingProvider : public EmbeddingProvider {
public:
    explicit OpenAIEmbeddingProvider(const EmbeddingConfig& config);

    std::vector<float> embed(const std::string& text) override;
    size_t dimension() const override;
    std::string name() const override { return "openai"; }

private:
    EmbeddingConfig config_;
    mutable std::mutex dimension_mutex_;
    size_t observed_dimension_ = 0;

    std::string build_payload(const std::string& text) const;
    std::vector<float> parse_response(const std::string& response_json) const;
};

/**
 * @brief Decorator caching vectors by exact text
 */
class CachedEmbeddingProvider : public EmbeddingProvider {
public:
    explicit CachedEmbeddingProvider(std::shared_ptr<EmbeddingProvider> inner);

    std::vector<float> embed(const std::string& text) override;
    size_t dimension() const override { return inner_->dimension(); }
    std::string name() const override { return "cached:" + inner_->name(); }

    size_t cache_size() const;
    size_t cache_hits() const;
    void clear_cache();

private:
    std::shared_ptr<EmbeddingProvider> inner_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<float>> cache_;
    size_t hits_ = 0;
};

// ============================================================================
// Factory
// ============================================================================

class EmbeddingProviderFactory {
public:
    /**
     * @brief Create provider from configuration
     * @throws std::invalid_argument on an invalid configuration
     */
    static std::shared_ptr<EmbeddingProvider> create(const EmbeddingConfig& config);

    /**
     * @brief Create provider from environment variables
     *
     * Looks for:
     * - DEVMEM_EMBEDDING_PROVIDER (hashing/openai)
     * - DEVMEM_OPENAI_API_KEY or OPENAI_API_KEY
     * - DEVMEM_EMBEDDING_MODEL (optional)
     */
    static std::shared_ptr<EmbeddingProvider> create_from_env();
};

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * @brief Cosine similarity; 0 for empty, mismatched or zero vectors
 */
double cosine_similarity(const std::vector<float>& vec1, const std::vector<float>& vec2);

} // namespace devmem

#endif // DEVMEM_EMBEDDING_EMBEDDING_PROVIDER_HPP
