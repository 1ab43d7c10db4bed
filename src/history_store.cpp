#include "history_store.hpp"
#include "text_format.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace quickswitch {

namespace {

std::int64_t now_unix_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// Paths are stored one per line, so separators inside a path are written as
// backslash escapes.
std::string escape_path(const std::string &path) {
    std::string escaped;
    escaped.reserve(path.size());
    for (char c : path) {
        switch (c) {
            case '\\': escaped += "\\\\"; break;
            case '\n': escaped += "\\n"; break;
            case '\t': escaped += "\\t"; break;
            case '\r': escaped += "\\r"; break;
            default:   escaped.push_back(c); break;
        }
    }
    return escaped;
}

bool unescape_path(const std::string &field, std::string &path) {
    path.clear();
    for (std::size_t i = 0; i < field.size(); ++i) {
        if (field[i] != '\\') {
            path.push_back(field[i]);
            continue;
        }
        if (++i == field.size()) {
            return false;
        }
        switch (field[i]) {
            case '\\': path.push_back('\\'); break;
            case 'n':  path.push_back('\n'); break;
            case 't':  path.push_back('\t'); break;
            case 'r':  path.push_back('\r'); break;
            default:   return false;
        }
    }
    return true;
}

}

HistorySort parse_history_sort(const std::string &value, HistorySort fallback) {
    const std::string lowered = to_lower_ascii(value);
    if (lowered == "recent") return HistorySort::Recent;
    if (lowered == "frequency") return HistorySort::Frequency;
    if (lowered == "alphabetical") return HistorySort::Alphabetical;
    return fallback;
}

const char *history_sort_name(HistorySort sort) {
    switch (sort) {
        case HistorySort::Recent:       return "recent";
        case HistorySort::Frequency:    return "frequency";
        case HistorySort::Alphabetical: return "alphabetical";
    }
    return "recent";
}

HistoryStore::HistoryStore(std::filesystem::path file, std::size_t max_entries)
    : file_(std::move(file)), max_entries_(std::max<std::size_t>(1, max_entries)) {}

bool HistoryStore::parse_line(const std::string &line, HistoryEntry &entry) const {
    const auto first_tab = line.find('\t');
    if (first_tab == std::string::npos) {
        std::filesystem::path path(line);
        if (!path.is_absolute()) {
            return false;
        }
        entry = HistoryEntry{path, 1, 0};
        return true;
    }

    const auto second_tab = line.find('\t', first_tab + 1);
    if (second_tab == std::string::npos) {
        return false;
    }

    try {
        std::size_t consumed = 0;
        const std::string time_field = line.substr(0, first_tab);
        const long long last_visited = std::stoll(time_field, &consumed);
        if (consumed != time_field.size()) {
            return false;
        }
        const std::string count_field = line.substr(first_tab + 1, second_tab - first_tab - 1);
        const unsigned long visits = std::stoul(count_field, &consumed);
        if (consumed != count_field.size() || visits == 0) {
            return false;
        }
        std::string raw_path;
        if (!unescape_path(line.substr(second_tab + 1), raw_path)) {
            return false;
        }
        std::filesystem::path path(raw_path);
        if (!path.is_absolute()) {
            return false;
        }
        entry = HistoryEntry{path, static_cast<std::uint32_t>(visits), last_visited};
        return true;
    } catch (const std::invalid_argument &) {
        return false;
    } catch (const std::out_of_range &) {
        return false;
    }
}

bool HistoryStore::load(Error &error) {
    entries_.clear();
    if (file_.empty()) {
        return true;
    }

    std::error_code ec;
    if (!std::filesystem::exists(file_, ec)) {
        spdlog::info("No history file at {}, starting empty", file_.string());
        return true;
    }

    std::ifstream file(file_, std::ios::binary);
    if (!file) {
        error = Error{ErrorKind::PersistenceFailure, "Unable to read history file " + file_.string()};
        spdlog::warn("{}", error.message);
        return false;
    }

    std::vector<HistoryEntry> loaded;
    std::size_t skipped = 0;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        if (line.find('\0') != std::string::npos) {
            error = Error{ErrorKind::PersistenceFailure, "History file is corrupt: " + file_.string()};
            spdlog::warn("{}", error.message);
            return false;
        }
        HistoryEntry entry;
        if (!parse_line(line, entry)) {
            ++skipped;
            continue;
        }
        const bool duplicate = std::any_of(loaded.begin(), loaded.end(),
                                           [&](const HistoryEntry &e) { return e.path == entry.path; });
        if (!duplicate) {
            loaded.push_back(std::move(entry));
        }
    }

    if (file.bad()) {
        error = Error{ErrorKind::PersistenceFailure, "Error reading history file " + file_.string()};
        spdlog::warn("{}", error.message);
        return false;
    }

    if (loaded.size() > max_entries_) {
        loaded.resize(max_entries_);
    }
    entries_ = std::move(loaded);
    spdlog::info("Loaded {} history entries from {} ({} malformed lines skipped)", entries_.size(),
                 file_.string(), skipped);
    return true;
}

bool HistoryStore::save(Error &error) const {
    if (file_.empty()) {
        return true;
    }

    std::error_code ec;
    if (file_.has_parent_path()) {
        std::filesystem::create_directories(file_.parent_path(), ec);
        if (ec) {
            error = make_error(ec, "Unable to create " + file_.parent_path().string());
            error.kind = ErrorKind::PersistenceFailure;
            return false;
        }
    }

    std::filesystem::path temp = file_;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            error = Error{ErrorKind::PersistenceFailure, "Unable to write history file " + temp.string()};
            return false;
        }
        for (const auto &entry : entries_) {
            out << entry.last_visited << '\t' << entry.visits << '\t'
                << escape_path(entry.path.string()) << '\n';
        }
        out.flush();
        if (!out) {
            error = Error{ErrorKind::PersistenceFailure, "Error writing history file " + temp.string()};
            return false;
        }
    }

    std::filesystem::rename(temp, file_, ec);
    if (ec) {
        error = make_error(ec, "Unable to replace " + file_.string());
        error.kind = ErrorKind::PersistenceFailure;
        std::filesystem::remove(temp, ec);
        return false;
    }
    spdlog::debug("Saved {} history entries to {}", entries_.size(), file_.string());
    return true;
}

bool HistoryStore::record(const std::filesystem::path &path, Error &error) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const HistoryEntry &entry) { return entry.path == path; });

    HistoryEntry entry{path, 1, now_unix_seconds()};
    if (it != entries_.end()) {
        entry.visits = it->visits + 1;
        entries_.erase(it);
    }
    entries_.insert(entries_.begin(), std::move(entry));

    if (entries_.size() > max_entries_) {
        entries_.resize(max_entries_);
    }
    spdlog::info("Recorded {} in history ({} entries)", path.string(), entries_.size());
    return save(error);
}

std::vector<HistoryEntry> HistoryStore::display_order(HistorySort sort) const {
    std::vector<HistoryEntry> ordered = entries_;
    switch (sort) {
        case HistorySort::Recent:
            break;
        case HistorySort::Frequency:
            std::stable_sort(ordered.begin(), ordered.end(), [](const HistoryEntry &a, const HistoryEntry &b) {
                return a.visits > b.visits;
            });
            break;
        case HistorySort::Alphabetical:
            std::stable_sort(ordered.begin(), ordered.end(), [](const HistoryEntry &a, const HistoryEntry &b) {
                return to_lower_ascii(a.path.filename().string()) < to_lower_ascii(b.path.filename().string());
            });
            break;
    }
    return ordered;
}

}
