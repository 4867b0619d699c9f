#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace idreg {

// Flat file of names, one per line. Line N (1-based) holds the name with id N.
// Not thread-safe: the owning registry serializes access.
class EnumStore {
public:
    explicit EnumStore(std::filesystem::path path);

    // Never throws. A line without a usable name (blank, duplicate) comes back
    // as an empty string so its id stays reserved; CRLF endings and trailing
    // blank lines are accepted. A missing, unreadable or non-UTF-8 file is
    // reset to empty on disk and an empty list is returned.
    std::vector<std::string> load();

    // Full replacement of the file through a temporary and a rename.
    // Throws PersistenceFailure if the new contents could not be committed.
    void rewrite(const std::vector<std::string>& names);

    const std::filesystem::path& path() const { return path_; }

private:
    std::optional<std::vector<std::string>> parse(const std::string& contents) const;
    void reset_after_failed_load(const std::string& reason);

    std::filesystem::path path_;
};

} // namespace idreg
