#include "transfer/source_walker.hpp"
#include "errors.hpp"
#include "protocol/wire.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace zipline::transfer {

namespace {

void add_file(WalkResult& result, const fs::path& path, const std::string& name) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) throw IOError("Could not stat " + path.string() + ": " + ec.message());

    models::TransferItem item;
    item.type = models::ItemType::FILE;
    item.name = name;
    item.size = static_cast<int64_t>(size);
    item.path = fs::absolute(path).u8string();
    result.items.push_back(std::move(item));
    result.total_size += static_cast<int64_t>(size);
    result.total_files += 1;
}

void add_folder(WalkResult& result, const fs::path& path, const std::string& name) {
    models::TransferItem folder;
    folder.type = models::ItemType::FOLDER;
    folder.name = name;
    folder.size = protocol::kFolderSize;
    folder.path = fs::absolute(path).u8string();
    result.items.push_back(std::move(folder));
    result.total_files += 1;

    std::error_code ec;
    std::vector<fs::path> children;
    for (fs::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
        children.push_back(it->path());
    }
    if (ec) throw IOError("Could not list " + path.string() + ": " + ec.message());
    std::sort(children.begin(), children.end());

    for (const auto& child : children) {
        std::string child_name = name + "/" + child.filename().u8string();
        // Links below a source are not followed; a link back up the tree
        // would otherwise be walked until the OS gives up.
        auto status = fs::symlink_status(child, ec);
        if (ec) {
            spdlog::warn("Skipping {}: {}", child.string(), ec.message());
            continue;
        }
        if (fs::is_symlink(status)) {
            spdlog::debug("Skipping symbolic link {}", child.string());
        } else if (fs::is_directory(status)) {
            add_folder(result, child, child_name);
        } else if (fs::is_regular_file(status)) {
            add_file(result, child, child_name);
        } else {
            spdlog::debug("Skipping special file {}", child.string());
        }
    }
}

} // namespace

WalkResult walk_sources(const std::vector<fs::path>& sources) {
    if (sources.empty()) throw ConfigError("Nothing to send: no source paths given");

    WalkResult result;
    for (const auto& source : sources) {
        fs::path normal = source.lexically_normal();
        if (!normal.has_filename() && normal.has_parent_path()) normal = normal.parent_path();

        std::error_code ec;
        auto status = fs::status(normal, ec);
        if (ec || !fs::exists(status)) {
            throw IOError("No such file or directory: " + source.string());
        }

        fs::path absolute = fs::absolute(normal).lexically_normal();
        if (!absolute.has_filename() && absolute.has_parent_path()) absolute = absolute.parent_path();
        std::string name = absolute.filename().u8string();
        if (name.empty()) throw ConfigError("Cannot send a file system root: " + source.string());

        if (fs::is_directory(status)) {
            add_folder(result, normal, name);
        } else if (fs::is_regular_file(status)) {
            add_file(result, normal, name);
        } else {
            throw IOError("Not a regular file or directory: " + source.string());
        }
    }
    return result;
}

models::TransferItem make_text_item(const std::string& text) {
    models::TransferItem item;
    item.type = models::ItemType::TEXT;
    item.name = protocol::kTextElementName;
    item.size = static_cast<int64_t>(text.size());
    item.text_content = text;
    return item;
}

void accumulate_totals(const std::vector<models::TransferItem>& items, int64_t& total_size,
                       int64_t& total_files) {
    total_size = 0;
    total_files = 0;
    for (const auto& item : items) {
        if (item.type != models::ItemType::FOLDER) total_size += item.size;
        total_files += 1;
    }
}

} // namespace zipline::transfer
