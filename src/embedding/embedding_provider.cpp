#include "devmem/embedding/embedding_provider.hpp"
#include <curl/curl.h>
#include <iostream>
#include <chrono>
#include <thread>
#include <cmath>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>

using json = nlohmann::json;

namespace devmem {

namespace {

// CURL write callback
size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

std::string http_post(
    const std::string& url,
    const std::string& json_payload,
    const std::vector<std::string>& headers,
    int timeout_seconds
) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw std::runtime_error("Failed to initialize CURL");
    }

    std::string response;
    struct curl_slist* header_list = nullptr;

    for (const auto& header : headers) {
        header_list = curl_slist_append(header_list, header.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, json_payload.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);

    if (header_list) {
        curl_slist_free_all(header_list);
    }

    if (res != CURLE_OK) {
        std::string error = curl_easy_strerror(res);
        curl_easy_cleanup(curl);
        throw std::runtime_error("CURL request failed: " + error);
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_cleanup(curl);

    if (http_code < 200 || http_code >= 300) {
        throw std::runtime_error(
            "HTTP request failed with code " + std::to_string(http_code) +
            ": " + response
        );
    }

    return response;
}

// 64-bit FNV-1a, stable across platforms and runs
uint64_t fnv1a(const std::string& text) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

} // anonymous namespace

// ============================================================================
// EmbeddingConfig
// ============================================================================

json EmbeddingConfig::to_json() const {
    json j;
    j["provider"] = provider;
    j["dimension"] = dimension;
    j["api_key"] = api_key.empty() ? "" : "***REDACTED***";
    j["model"] = model;
    j["api_base_url"] = api_base_url;
    j["timeout_seconds"] = timeout_seconds;
    j["max_retries"] = max_retries;
    j["cache_enabled"] = cache_enabled;
    j["verbose"] = verbose;
    return j;
}

EmbeddingConfig EmbeddingConfig::from_json(const json& j) {
    EmbeddingConfig config;
    if (j.contains("provider")) config.provider = j["provider"];
    if (j.contains("dimension")) config.dimension = j["dimension"];
    if (j.contains("api_key")) config.api_key = j["api_key"];
    if (j.contains("model")) config.model = j["model"];
    if (j.contains("api_base_url")) config.api_base_url = j["api_base_url"];
    if (j.contains("timeout_seconds")) config.timeout_seconds = j["timeout_seconds"];
    if (j.contains("max_retries")) config.max_retries = j["max_retries"];
    if (j.contains("cache_enabled")) config.cache_enabled = j["cache_enabled"];
    if (j.contains("verbose")) config.verbose = j["verbose"];
    return config;
}

bool EmbeddingConfig::validate(std::string& error_message) const {
    if (provider != "hashing" && provider != "openai") {
        error_message = "Embedding provider must be 'hashing' or 'openai'";
        return false;
    }

    if (provider == "hashing" && dimension < 8) {
        error_message = "Hashing embedding dimension must be at least 8";
        return false;
    }

    if (provider == "openai" && (api_key.empty() || api_key == "***REDACTED***")) {
        error_message = "OpenAI embedding provider requires an API key";
        return false;
    }

    if (max_retries < 1) {
        error_message = "Embedding max_retries must be at least 1";
        return false;
    }

    return true;
}

// ============================================================================
// HashingEmbeddingProvider
// ============================================================================

HashingEmbeddingProvider::HashingEmbeddingProvider(size_t dimension)
    : dimension_(dimension) {
    if (dimension_ == 0) {
        throw std::invalid_argument("Embedding dimension must be positive");
    }
}

std::vector<std::string> HashingEmbeddingProvider::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;

    auto flush = [&]() {
        if (!current.empty()) {
            tokens.push_back(current);
            current.clear();
        }
    };

    for (size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (!std::isalnum(c)) {
            flush();
            continue;
        }

        if (std::isupper(c) && !current.empty()) {
            unsigned char prev = static_cast<unsigned char>(text[i - 1]);
            bool next_is_lower = i + 1 < text.size() &&
                std::islower(static_cast<unsigned char>(text[i + 1]));
            // "getUser" -> get|User, "HTTPServer" -> HTTP|Server
            if (std::islower(prev) || std::isdigit(prev) ||
                (std::isupper(prev) && next_is_lower)) {
                flush();
            }
        }

        current += static_cast<char>(std::tolower(c));
    }
    flush();

    return tokens;
}

void HashingEmbeddingProvider::add_feature(
    std::vector<float>& vec,
    const std::string& feature,
    float weight
) const {
    uint64_t hash = fnv1a(feature);
    size_t bucket = static_cast<size_t>(hash % dimension_);
    float sign = ((hash >> 40) & 1ULL) ? -1.0f : 1.0f;
    vec[bucket] += sign * weight;
}

std::vector<float> HashingEmbeddingProvider::embed(const std::string& text) {
    std::vector<float> vec(dimension_, 0.0f);

    for (const auto& token : tokenize(text)) {
        add_feature(vec, "tok:" + token, 1.0f);

        std::string padded = "#" + token + "#";
        for (size_t i = 0; i + 3 <= padded.size(); ++i) {
            add_feature(vec, "tri:" + padded.substr(i, 3), 0.5f);
        }
    }

    double norm = 0.0;
    for (float v : vec) {
        norm += static_cast<double>(v) * v;
    }
    if (norm > 0.0) {
        float inv = static_cast<float>(1.0 / std::sqrt(norm));
        for (auto& v : vec) {
            v *= inv;
        }
    }

    return vec;
}

// ============================================================================
// OpenAIEmbeddingProvider
// ============================================================================

OpenAIEmbeddingProvider::OpenAIEmbeddingProvider(const EmbeddingConfig& config)
    : config_(config) {
}

size_t OpenAIEmbeddingProvider::dimension() const {
    std::lock_guard<std::mutex> lock(dimension_mutex_);
    return observed_dimension_;
}

std::string OpenAIEmbeddingProvider::build_payload(const std::string& text) const {
    json j;
    j["model"] = config_.model;
    j["input"] = text;
    return j.dump();
}

std::vector<float> OpenAIEmbeddingProvider::parse_response(const std::string& response_json) const {
    json j = json::parse(response_json);

    if (j.contains("error")) {
        throw std::runtime_error("Embedding API error: " + j["error"].value("message", std::string("unknown")));
    }

    if (!j.contains("data") || j["data"].empty() || !j["data"][0].contains("embedding")) {
        throw std::runtime_error("Embedding API response carries no embedding");
    }

    return j["data"][0]["embedding"].get<std::vector<float>>();
}

std::vector<float> OpenAIEmbeddingProvider::embed(const std::string& text) {
    std::vector<std::string> headers = {
        "Content-Type: application/json",
        "Authorization: Bearer " + config_.api_key
    };

    int attempts = 0;
    while (true) {
        try {
            if (config_.verbose) {
                std::cout << "Embedding request to " << config_.model << std::endl;
            }

            std::string response = http_post(
                config_.api_base_url + "/embeddings",
                build_payload(text),
                headers,
                config_.timeout_seconds
            );
            std::vector<float> vec = parse_response(response);

            std::lock_guard<std::mutex> lock(dimension_mutex_);
            observed_dimension_ = vec.size();
            return vec;
        } catch (const std::exception& e) {
            attempts++;
            if (attempts >= config_.max_retries) {
                throw std::runtime_error(
                    "Embedding failed after " + std::to_string(attempts) +
                    " attempts: " + e.what()
                );
            }

            if (config_.verbose) {
                std::cerr << "Embedding attempt " << attempts << " failed: "
                          << e.what() << ". Retrying..." << std::endl;
            }

            // Exponential backoff
            std::this_thread::sleep_for(
                std::chrono::seconds(static_cast<int>(std::pow(2, attempts - 1)))
            );
        }
    }
}

// ============================================================================
// CachedEmbeddingProvider
// ============================================================================

CachedEmbeddingProvider::CachedEmbeddingProvider(std::shared_ptr<EmbeddingProvider> inner)
    : inner_(std::move(inner)) {
    if (!inner_) {
        throw std::invalid_argument("CachedEmbeddingProvider requires a provider");
    }
}

std::vector<float> CachedEmbeddingProvider::embed(const std::string& text) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(text);
        if (it != cache_.end()) {
            hits_++;
            return it->second;
        }
    }

    // Computed outside the lock; a concurrent miss on the same text
    // produces the same vector.
    std::vector<float> vec = inner_->embed(text);

    std::lock_guard<std::mutex> lock(mutex_);
    cache_.emplace(text, vec);
    return vec;
}

size_t CachedEmbeddingProvider::cache_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

size_t CachedEmbeddingProvider::cache_hits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

void CachedEmbeddingProvider::clear_cache() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
    hits_ = 0;
}

// ============================================================================
// EmbeddingProviderFactory
// ============================================================================

std::shared_ptr<EmbeddingProvider> EmbeddingProviderFactory::create(const EmbeddingConfig& config) {
    std::string error;
    if (!config.validate(error)) {
        throw std::invalid_argument("Invalid configuration: " + error);
    }

    std::shared_ptr<EmbeddingProvider> provider;
    if (config.provider == "openai") {
        provider = std::make_shared<OpenAIEmbeddingProvider>(config);
    } else {
        provider = std::make_shared<HashingEmbeddingProvider>(config.dimension);
    }

    if (config.cache_enabled) {
        provider = std::make_shared<CachedEmbeddingProvider>(provider);
    }

    return provider;
}

std::shared_ptr<EmbeddingProvider> EmbeddingProviderFactory::create_from_env() {
    EmbeddingConfig config;

    const char* provider = std::getenv("DEVMEM_EMBEDDING_PROVIDER");
    if (provider) config.provider = provider;

    const char* api_key = std::getenv("DEVMEM_OPENAI_API_KEY");
    if (!api_key) api_key = std::getenv("OPENAI_API_KEY");
    if (api_key) config.api_key = api_key;

    const char* model = std::getenv("DEVMEM_EMBEDDING_MODEL");
    if (model) config.model = model;

    return create(config);
}

// ============================================================================
// Utility Functions
// ============================================================================

double cosine_similarity(const std::vector<float>& vec1, const std::vector<float>& vec2) {
    if (vec1.size() != vec2.size() || vec1.empty()) {
        return 0.0;
    }

    double dot_product = 0.0;
    double norm1 = 0.0;
    double norm2 = 0.0;

    for (size_t i = 0; i < vec1.size(); ++i) {
        dot_product += static_cast<double>(vec1[i]) * vec2[i];
        norm1 += static_cast<double>(vec1[i]) * vec1[i];
        norm2 += static_cast<double>(vec2[i]) * vec2[i];
    }

    if (norm1 == 0.0 || norm2 == 0.0) {
        return 0.0;
    }

    return dot_product / (std::sqrt(norm1) * std::sqrt(norm2));
}

} // namespace devmem
