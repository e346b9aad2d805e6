#pragma once

#include <filesystem>
#include <map>
#include <string>

namespace zipline::transfer {

// Per-session bookkeeping that redirects a folder prefix on the wire to
// the directory actually created under the save root, so that nothing
// already on disk is overwritten.
class PathMapper {
public:
    explicit PathMapper(std::filesystem::path root);

    // Creates the directory for folder element wire_name and returns it.
    // A folder seen before in this session maps to the same directory.
    std::filesystem::path map_folder(const std::string& wire_name);

    // Picks an unused name for file element wire_name and creates it empty
    // with an exclusive open, so nothing that exists is ever truncated.
    // Parent directories are created as needed.
    std::filesystem::path map_file(const std::string& wire_name);

    const std::filesystem::path& root() const { return root_; }
    const std::map<std::string, std::filesystem::path>& folders() const { return folders_; }

private:
    // Target for wire_name through its longest mapped ancestor, or directly
    // under the root when none is mapped.
    std::filesystem::path resolve(const std::string& wire_name) const;

    std::filesystem::path root_;
    std::map<std::string, std::filesystem::path> folders_;
};

// "name (n)" with the smallest n >= 1 that does not exist.
std::filesystem::path unique_directory(const std::filesystem::path& desired);

// "stem (n).ext" with the smallest n >= 1 that does not exist.
std::filesystem::path unique_file(const std::filesystem::path& desired);

} // namespace zipline::transfer
