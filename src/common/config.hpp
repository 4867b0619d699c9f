#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace idreg {

struct StorageConfig {
    std::string index_root = "./index";
    std::string enum_file = "indices.enum";

    std::filesystem::path enum_path() const {
        return std::filesystem::path(index_root) / enum_file;
    }
};

struct RegistryConfig {
    uint16_t max_ids = 32767;
};

struct ControlConfig {
    uint16_t http_port = 8080;
    std::string token = "devtoken";
    uint32_t io_threads = 2;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    StorageConfig storage;
    RegistryConfig registry;
    ControlConfig control;
    LoggingConfig logging;

    static Config load_from_file(const std::string& path);
    static Config default_config();
};

} // namespace idreg
