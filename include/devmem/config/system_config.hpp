#ifndef DEVMEM_CONFIG_SYSTEM_CONFIG_HPP
#define DEVMEM_CONFIG_SYSTEM_CONFIG_HPP

#include "devmem/embedding/embedding_provider.hpp"
#include "devmem/events/event_processor.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace devmem {

/**
 * @brief Top-level configuration: embedding provider plus event pipeline
 *
 * File format:
 *   { "embedding": { ...EmbeddingConfig... },
 *     "processor": { ...ProcessorConfig... } }
 */
struct SystemConfig {
    EmbeddingConfig embedding;
    ProcessorConfig processor;

    nlohmann::json to_json() const;
    static SystemConfig from_json(const nlohmann::json& j);

    /**
     * @brief Load configuration from a JSON file
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    static SystemConfig from_json_file(const std::string& path);

    /**
     * @brief Save configuration to a JSON file; API keys are redacted
     * @throws std::runtime_error if the file cannot be written
     */
    void to_json_file(const std::string& path) const;

    /**
     * @brief Defaults overridden by DEVMEM_* variables and OPENAI_API_KEY
     * @throws std::invalid_argument on a malformed numeric variable
     */
    static SystemConfig from_environment();

    bool validate(std::string& error_message) const;
};

/**
 * @brief Load configuration with fallback strategy
 *
 * Tries, in order: config_path (when given), devmem.json in the working
 * directory, then the environment.
 */
SystemConfig load_config_with_fallback(const std::string& config_path = "");

} // namespace devmem

#endif // DEVMEM_CONFIG_SYSTEM_CONFIG_HPP
