#include "transfer/path_mapper.hpp"
#include "errors.hpp"
#include "protocol/wire.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace zipline::transfer {

namespace {

bool exists_no_throw(const fs::path& p) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(p, ec)) && !ec;
}

void ensure_directory(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throw IOError("Could not create directory " + dir.string() + ": " + ec.message());
}

// Creates an empty file at path unless something is already there.
bool create_exclusive(const fs::path& path) {
#ifdef _WIN32
    std::FILE* file = _wfopen(path.c_str(), L"wbx");
#else
    std::FILE* file = std::fopen(path.c_str(), "wbx");
#endif
    if (file) {
        std::fclose(file);
        return true;
    }
    if (errno == EEXIST) return false;
    throw IOError("Could not create " + path.string() + ": " + std::strerror(errno));
}

} // namespace

fs::path unique_directory(const fs::path& desired) {
    if (!exists_no_throw(desired)) return desired;
    const std::string base = desired.filename().u8string();
    for (int n = 1;; ++n) {
        fs::path candidate = desired.parent_path() / fs::u8path(base + " (" + std::to_string(n) + ")");
        if (!exists_no_throw(candidate)) return candidate;
    }
}

fs::path unique_file(const fs::path& desired) {
    if (!exists_no_throw(desired)) return desired;
    const std::string stem = desired.stem().u8string();
    const std::string ext = desired.extension().u8string();
    for (int n = 1;; ++n) {
        fs::path candidate = desired.parent_path() /
                             fs::u8path(stem + " (" + std::to_string(n) + ")" + ext);
        if (!exists_no_throw(candidate)) return candidate;
    }
}

PathMapper::PathMapper(fs::path root) : root_(std::move(root)) {}

fs::path PathMapper::resolve(const std::string& wire_name) const {
    // Validates every segment; throws ProtocolError on traversal attempts.
    fs::path relative = protocol::from_wire_name(wire_name);

    std::string prefix = wire_name;
    for (auto slash = prefix.rfind('/'); slash != std::string::npos; slash = prefix.rfind('/')) {
        prefix.resize(slash);
        auto it = folders_.find(prefix);
        if (it != folders_.end()) {
            return it->second / protocol::from_wire_name(wire_name.substr(slash + 1));
        }
    }
    return root_ / relative;
}

fs::path PathMapper::map_folder(const std::string& wire_name) {
    auto known = folders_.find(wire_name);
    if (known != folders_.end()) {
        ensure_directory(known->second);
        return known->second;
    }

    fs::path target = unique_directory(resolve(wire_name));
    ensure_directory(target);
    folders_.emplace(wire_name, target);
    return target;
}

fs::path PathMapper::map_file(const std::string& wire_name) {
    fs::path desired = resolve(wire_name);
    if (desired.has_parent_path()) ensure_directory(desired.parent_path());
    while (true) {
        fs::path target = unique_file(desired);
        if (create_exclusive(target)) return target;
        spdlog::debug("{} appeared while picking a name, trying the next one", target.string());
    }
}

} // namespace zipline::transfer
