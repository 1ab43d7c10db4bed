#pragma once

#include "errors.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace quickswitch {

enum class HistorySort {
    Recent,
    Frequency,
    Alphabetical
};

HistorySort parse_history_sort(const std::string &value, HistorySort fallback);
const char *history_sort_name(HistorySort sort);

struct HistoryEntry {
    std::filesystem::path path;
    std::uint32_t visits{1};
    std::int64_t last_visited{0};
};

// Most-recently-visited-first list of directories, capped and free of duplicates.
// The on-disk record is one tab-separated line per entry:
//   <last visit, unix seconds>\t<visit count>\t<absolute path>
// Backslash, newline, tab and carriage return in the path are written as \\, \n,
// \t and \r.
// A line holding only an absolute path is accepted as an entry with one visit.
class HistoryStore {
public:
    static constexpr std::size_t kDefaultMaxEntries = 100;

    explicit HistoryStore(std::filesystem::path file, std::size_t max_entries = kDefaultMaxEntries);

    // A missing file is an empty history. An unreadable or corrupt file also leaves
    // the history empty but returns false so the caller can report it.
    bool load(Error &error);
    bool save(Error &error) const;

    // Moves `path` to the front (or inserts it there), trims to the cap, then saves.
    // The in-memory list is updated even when saving fails.
    bool record(const std::filesystem::path &path, Error &error);

    const std::vector<HistoryEntry> &list() const { return entries_; }
    std::vector<HistoryEntry> display_order(HistorySort sort) const;

    std::size_t max_entries() const { return max_entries_; }
    const std::filesystem::path &file() const { return file_; }

private:
    bool parse_line(const std::string &line, HistoryEntry &entry) const;

    std::filesystem::path file_;
    std::size_t max_entries_;
    std::vector<HistoryEntry> entries_;
};

}
