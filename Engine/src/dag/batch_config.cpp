#include <dag/batch_config.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <thread>

namespace Dagstore {

size_t default_parallel_commits() {
    return std::max<size_t>(2, static_cast<size_t>(std::thread::hardware_concurrency()) * 2);
}

BatchConfig BatchConfig::from_json(const nlohmann::json& json) {
    BatchConfig config;
    if (json.contains("max_bytes")) {
        config.max_bytes = json["max_bytes"].get<size_t>();
    }
    if (json.contains("max_blocks")) {
        config.max_blocks = json["max_blocks"].get<size_t>();
    }
    if (json.contains("max_parallel")) {
        config.max_parallel = json["max_parallel"].get<size_t>();
    }
    return config;
}

BatchConfig load_batch_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open batch config: " + path);
    }
    auto json = nlohmann::json::parse(file);
    return BatchConfig::from_json(json);
}

} // namespace Dagstore
