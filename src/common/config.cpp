#include "config.hpp"
#include "../registry/index_id.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace idreg {

namespace {
// Out-of-range values keep the current setting instead of wrapping
template<typename T>
void read_bounded(const nlohmann::json& section, const char* key, int64_t min, int64_t max, T& target) {
    if (!section.contains(key)) {
        return;
    }
    int64_t value = section[key].get<int64_t>();
    if (value < min || value > max) {
        spdlog::warn("Config value {}={} outside [{}, {}], keeping {}", key, value, min, max, target);
        return;
    }
    target = static_cast<T>(value);
}
}

Config Config::load_from_file(const std::string& path) {
    Config config = default_config();

    std::ifstream file(path);
    if (!file.is_open()) {
        return config; // Defaults when there is no config file
    }

    try {
        nlohmann::json j;
        file >> j;

        if (j.contains("storage")) {
            auto& storage = j["storage"];
            if (storage.contains("index_root")) config.storage.index_root = storage["index_root"].get<std::string>();
            if (storage.contains("enum_file")) config.storage.enum_file = storage["enum_file"].get<std::string>();
        }

        if (j.contains("registry")) {
            auto& registry = j["registry"];
            read_bounded(registry, "max_ids", 1, MAX_IDS, config.registry.max_ids);
        }

        if (j.contains("control")) {
            auto& control = j["control"];
            read_bounded(control, "http_port", 0, 65535, config.control.http_port);
            if (control.contains("token")) config.control.token = control["token"].get<std::string>();
            read_bounded(control, "io_threads", 1, 256, config.control.io_threads);
        }

        if (j.contains("logging")) {
            auto& logging = j["logging"];
            if (logging.contains("level")) config.logging.level = logging["level"].get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Ignoring config file {}: {}", path, e.what());
        return default_config();
    }

    return config;
}

Config Config::default_config() {
    return Config{};
}

} // namespace idreg
