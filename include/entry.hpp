#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace quickswitch {

enum class EntryKind {
    Directory,
    File,
    Symlink,
    Other
};

struct Entry {
    std::string name;
    std::filesystem::path path;
    EntryKind kind{EntryKind::Other};
    std::uintmax_t size{0};
    std::filesystem::file_time_type modified{};
    bool target_is_directory{false};

    bool is_directory() const { return kind == EntryKind::Directory; }

    // True for directories and for symlinks that resolve to one.
    bool is_navigable() const {
        return kind == EntryKind::Directory || (kind == EntryKind::Symlink && target_is_directory);
    }
};

using EntrySet = std::vector<Entry>;

// Navigable entries (directories and links to them) first, then everything else; case-insensitive name inside each group.
bool entry_order(const Entry &a, const Entry &b);

void sort_entries(EntrySet &entries);

}
