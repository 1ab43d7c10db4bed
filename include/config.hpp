#pragma once

#include "history_store.hpp"
#include "preview.hpp"

#include <cstddef>
#include <filesystem>
#include <string>

namespace quickswitch {

class Config {
public:
    Config() = default;

    void load();
    bool load_from(const std::filesystem::path &path);
    bool save_to(const std::filesystem::path &path) const;

    std::size_t history_max_entries() const { return history_max_entries_; }
    HistorySort history_sort() const { return history_sort_; }
    std::size_t preview_lines() const { return preview_lines_; }
    std::size_t directory_preview_limit() const { return directory_preview_limit_; }
    bool show_hidden() const { return show_hidden_; }
    bool image_preview() const { return image_preview_; }

    PreviewOptions preview_options() const;

    static std::filesystem::path config_path();
    // $_QUICKSWITCH_DATA_DIR, then $XDG_DATA_HOME/quickswitch, then
    // ~/.local/share/quickswitch, then the temp directory.
    static std::filesystem::path data_dir();
    static std::filesystem::path history_path();

private:
    void parse_line(const std::string &line);

    std::size_t history_max_entries_{HistoryStore::kDefaultMaxEntries};
    HistorySort history_sort_{HistorySort::Recent};
    std::size_t preview_lines_{100};
    std::size_t directory_preview_limit_{100};
    bool show_hidden_{true};
    bool image_preview_{true};
};

}
