#include "enum_store.hpp"
#include "../common/metrics.hpp"
#include "../common/names.hpp"
#include "../registry/errors.hpp"
#include "../registry/index_id.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <iterator>
#include <unordered_set>

namespace idreg {

EnumStore::EnumStore(std::filesystem::path path) : path_(std::move(path)) {
}

std::vector<std::string> EnumStore::load() {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        spdlog::info("No id store at {}, starting empty", path_.string());
        reset_after_failed_load("");
        return {};
    }

    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        reset_after_failed_load("cannot open file");
        return {};
    }

    std::string contents{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    // filebuf reports a failed read as end of file, so compare with the size on disk
    auto expected_size = std::filesystem::file_size(path_, ec);
    if (file.bad() || ec || expected_size != contents.size()) {
        reset_after_failed_load("read error");
        return {};
    }

    auto names = parse(contents);
    if (!names) {
        reset_after_failed_load("malformed contents");
        return {};
    }

    spdlog::info("Loaded {} ids from {}", names->size(), path_.string());
    return std::move(*names);
}

std::optional<std::vector<std::string>> EnumStore::parse(const std::string& contents) const {
    if (!is_valid_utf8(contents)) {
        return std::nullopt;
    }

    std::vector<std::string> names;
    std::unordered_set<std::string> seen;
    size_t reserved = 0;  // lines up to the last non-blank one

    size_t start = 0;
    while (start < contents.size()) {
        size_t end = contents.find('\n', start);
        if (end == std::string::npos) {
            end = contents.size();
        }

        std::string_view line(contents.data() + start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        start = end + 1;

        // A line that holds no usable name still reserves its id
        if (!is_valid_name(line) || !seen.insert(std::string(line)).second) {
            spdlog::warn("Id store {}: line {} is not a usable name, keeping id {} reserved",
                         path_.string(), names.size() + 1, names.size() + 1);
            names.emplace_back();
        } else {
            names.emplace_back(line);
        }
        if (!line.empty()) {
            reserved = names.size();
        }
    }

    // Blank lines at the end of the file do not reserve anything
    names.resize(reserved);
    if (names.size() > MAX_IDS) {
        return std::nullopt;
    }
    return names;
}

void EnumStore::reset_after_failed_load(const std::string& reason) {
    if (!reason.empty()) {
        spdlog::warn("Id store {} is unusable ({}), resetting to empty", path_.string(), reason);
        MetricsCollector::instance().increment_counter("registry_store_recoveries_total");
    }

    try {
        rewrite({});
    } catch (const PersistenceFailure& e) {
        // The next allocation rewrites again and reports the failure to its caller
        spdlog::error("Failed to reset id store: {}", e.what());
    }
}

void EnumStore::rewrite(const std::vector<std::string>& names) {
    ScopedTimer timer("registry_store_rewrite_ns");

    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw PersistenceFailure("Cannot create directory for " + path_.string() + ": " + ec.message());
        }
    }

    std::filesystem::path tmp_path = path_;
    tmp_path += ".tmp";

    {
        std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw PersistenceFailure("Cannot open " + tmp_path.string() + " for writing");
        }

        for (const auto& name : names) {
            file << name << '\n';
        }
        file.flush();
        if (file.fail()) {
            file.close();
            std::filesystem::remove(tmp_path, ec);
            throw PersistenceFailure("Failed to write " + tmp_path.string());
        }
    }

    std::filesystem::rename(tmp_path, path_, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        throw PersistenceFailure("Cannot replace " + path_.string() + ": " + ec.message());
    }

    MetricsCollector::instance().increment_counter("registry_store_rewrites_total");
}

} // namespace idreg
