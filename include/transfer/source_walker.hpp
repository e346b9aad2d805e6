#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "models/transfer_session.hpp"

namespace zipline::transfer {

struct WalkResult {
    std::vector<models::TransferItem> items;
    int64_t total_size = 0;     // file bytes only
    int64_t total_files = 0;    // files and folders
};

// Expands sources into transfer items in wire order. A directory yields a
// folder item followed by its children, sorted by name; names are relative
// with '/' separators, the first segment being the source's base name.
// Throws ConfigError for an empty source list and IOError for a missing source.
WalkResult walk_sources(const std::vector<std::filesystem::path>& sources);

// A text snippet; its size is the UTF-8 byte length.
models::TransferItem make_text_item(const std::string& text);

// Recomputes totals for an arbitrary item list.
void accumulate_totals(const std::vector<models::TransferItem>& items, int64_t& total_size,
                       int64_t& total_files);

} // namespace zipline::transfer
