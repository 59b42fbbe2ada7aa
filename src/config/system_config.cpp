#include "devmem/config/system_config.hpp"
#include <sys/stat.h>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <vector>

using json = nlohmann::json;

namespace devmem {

namespace {

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

template <typename T, typename Parse>
void read_env(const char* name, T& target, Parse parse) {
    const char* value = env(name);
    if (!value) return;
    try {
        target = static_cast<T>(parse(std::string(value)));
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string("Invalid value for ") + name + ": " + value);
    }
}

bool parse_flag(const std::string& value) {
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

} // anonymous namespace

json SystemConfig::to_json() const {
    json j;
    j["embedding"] = embedding.to_json();
    j["processor"] = processor.to_json();
    return j;
}

SystemConfig SystemConfig::from_json(const json& j) {
    SystemConfig config;
    if (j.contains("embedding")) config.embedding = EmbeddingConfig::from_json(j["embedding"]);
    if (j.contains("processor")) config.processor = ProcessorConfig::from_json(j["processor"]);
    return config;
}

SystemConfig SystemConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    try {
        json j;
        file >> j;
        return from_json(j);
    } catch (const json::exception& e) {
        throw std::runtime_error("Failed to parse config file " + path + ": " + e.what());
    }
}

void SystemConfig::to_json_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    file << to_json().dump(2);
}

SystemConfig SystemConfig::from_environment() {
    SystemConfig config;

    // Embedding configuration from environment
    const char* provider = env("DEVMEM_EMBEDDING_PROVIDER");
    if (provider) config.embedding.provider = provider;

    const char* api_key = env("DEVMEM_OPENAI_API_KEY");
    if (!api_key) api_key = env("OPENAI_API_KEY");
    if (api_key) config.embedding.api_key = api_key;

    const char* model = env("DEVMEM_EMBEDDING_MODEL");
    if (model) config.embedding.model = model;

    // Pipeline configuration
    read_env("DEVMEM_BATCH_SIZE", config.processor.batch_size,
             [](const std::string& v) {
                 long parsed = std::stol(v);
                 if (parsed < 0) throw std::out_of_range(v);
                 return static_cast<size_t>(parsed);
             });
    read_env("DEVMEM_PROCESSING_INTERVAL_MS", config.processor.processing_interval_ms,
             [](const std::string& v) { return std::stoi(v); });
    read_env("DEVMEM_MAX_RETRIES", config.processor.max_retries,
             [](const std::string& v) { return std::stoi(v); });
    read_env("DEVMEM_CRITICAL_THRESHOLD", config.processor.critical_threshold,
             [](const std::string& v) { return std::stod(v); });

    const char* verbose = env("DEVMEM_VERBOSE");
    if (verbose) {
        config.processor.verbose = parse_flag(verbose);
        config.embedding.verbose = config.processor.verbose;
    }

    return config;
}

bool SystemConfig::validate(std::string& error_message) const {
    if (!embedding.validate(error_message)) {
        return false;
    }
    return processor.validate(error_message);
}

SystemConfig load_config_with_fallback(const std::string& config_path) {
    std::vector<std::string> paths_to_try;

    if (!config_path.empty()) {
        paths_to_try.push_back(config_path);
    }
    paths_to_try.push_back("devmem.json");

    for (const auto& path : paths_to_try) {
        struct stat st;
        if (stat(path.c_str(), &st) != 0) continue;

        try {
            return SystemConfig::from_json_file(path);
        } catch (const std::runtime_error& e) {
            std::cerr << "Skipping config " << path << ": " << e.what() << "\n";
        }
    }

    // Fallback to environment
    return SystemConfig::from_environment();
}

} // namespace devmem
