#pragma once

#include "entry.hpp"
#include "errors.hpp"

#include <cstddef>
#include <filesystem>

namespace quickswitch {

struct ListOptions {
    bool show_hidden{true};
    std::size_t max_entries{10000};
};

struct ListResult {
    EntrySet entries;
    bool truncated{false};
};

// Reads the direct children of `path`. Symlinks are reported as their own kind and
// never listed through. Children that cannot be inspected are skipped; a failure to
// open or iterate the directory itself fails the whole call.
bool list_directory(const std::filesystem::path &path, const ListOptions &options,
                    ListResult &result, Error &error);

Entry make_entry(const std::filesystem::directory_entry &dirent);

}
