#include "config.hpp"
#include "text_format.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <stdexcept>

namespace quickswitch {

namespace {

std::filesystem::path env_path(const char *name) {
    const char *value = std::getenv(name);
    if (value == nullptr || std::strlen(value) == 0) {
        return {};
    }
    return value;
}

std::size_t parse_count(const std::string &key, const std::string &value, std::size_t fallback,
                        std::size_t low, std::size_t high) {
    try {
        std::size_t consumed = 0;
        const unsigned long long parsed = std::stoull(value, &consumed);
        if (consumed != value.size()) {
            spdlog::warn("Ignoring config {}={}: trailing characters", key, value);
            return fallback;
        }
        return std::clamp<std::size_t>(static_cast<std::size_t>(parsed), low, high);
    } catch (const std::invalid_argument &) {
        spdlog::warn("Ignoring config {}={}: not a number", key, value);
    } catch (const std::out_of_range &) {
        spdlog::warn("Ignoring config {}={}: out of range", key, value);
    }
    return fallback;
}

bool parse_bool(const std::string &value, bool fallback) {
    const std::string lowered = to_lower_ascii(value);
    if (lowered == "true" || lowered == "yes" || lowered == "on" || lowered == "1") return true;
    if (lowered == "false" || lowered == "no" || lowered == "off" || lowered == "0") return false;
    return fallback;
}

}

std::filesystem::path Config::config_path() {
    std::filesystem::path config_dir = env_path("XDG_CONFIG_HOME");
    if (config_dir.empty()) {
        const std::filesystem::path home = env_path("HOME");
        if (home.empty()) {
            return "config.ini";
        }
        config_dir = home / ".config";
    }
    return config_dir / "quickswitch" / "config.ini";
}

std::filesystem::path Config::data_dir() {
    std::filesystem::path dir = env_path("_QUICKSWITCH_DATA_DIR");
    if (dir.empty()) {
        const std::filesystem::path xdg_data = env_path("XDG_DATA_HOME");
        const std::filesystem::path home = env_path("HOME");
        if (!xdg_data.empty()) {
            dir = xdg_data / "quickswitch";
        } else if (!home.empty()) {
            dir = home / ".local" / "share" / "quickswitch";
        } else {
            std::error_code ec;
            dir = std::filesystem::temp_directory_path(ec) / "quickswitch";
        }
    }

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        spdlog::warn("Unable to create data directory {}: {}", dir.string(), ec.message());
    }
    return dir;
}

std::filesystem::path Config::history_path() {
    return data_dir() / "history.txt";
}

void Config::load() {
    load_from(config_path());
}

bool Config::load_from(const std::filesystem::path &path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return false;
    }

    std::ifstream file(path);
    if (!file) {
        spdlog::warn("Unable to read config file {}", path.string());
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        parse_line(line);
    }
    spdlog::info("Loaded config from {}", path.string());
    return true;
}

void Config::parse_line(const std::string &line) {
    if (line.empty() || line[0] == '#' || line[0] == ';') {
        return;
    }

    auto pos = line.find('=');
    if (pos == std::string::npos) {
        return;
    }

    std::string key = line.substr(0, pos);
    std::string value = line.substr(pos + 1);

    key.erase(0, key.find_first_not_of(" \t\r\n"));
    key.erase(key.find_last_not_of(" \t\r\n") + 1);
    value.erase(0, value.find_first_not_of(" \t\r\n"));
    value.erase(value.find_last_not_of(" \t\r\n") + 1);

    if (key == "history_max_entries") {
        history_max_entries_ = parse_count(key, value, history_max_entries_, 1, 10000);
    } else if (key == "history_sort") {
        history_sort_ = parse_history_sort(value, history_sort_);
    } else if (key == "preview_lines") {
        preview_lines_ = parse_count(key, value, preview_lines_, 1, 1000);
    } else if (key == "directory_preview_limit") {
        directory_preview_limit_ = parse_count(key, value, directory_preview_limit_, 1, 10000);
    } else if (key == "show_hidden") {
        show_hidden_ = parse_bool(value, show_hidden_);
    } else if (key == "image_preview") {
        image_preview_ = parse_bool(value, image_preview_);
    } else {
        spdlog::debug("Unknown config key: {}", key);
    }
}

bool Config::save_to(const std::filesystem::path &path) const {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    std::ofstream file(path);
    if (!file) {
        spdlog::warn("Failed to save config to: {}", path.string());
        return false;
    }

    file << "# quickswitch configuration\n";
    file << "# Number of directories remembered (1 - 10000)\n";
    file << "history_max_entries=" << history_max_entries_ << "\n";
    file << "# History ordering (recent, frequency, alphabetical)\n";
    file << "history_sort=" << history_sort_name(history_sort_) << "\n";
    file << "\n";
    file << "# Preview limits\n";
    file << "preview_lines=" << preview_lines_ << "\n";
    file << "directory_preview_limit=" << directory_preview_limit_ << "\n";
    file << "image_preview=" << (image_preview_ ? "true" : "false") << "\n";
    file << "\n";
    file << "show_hidden=" << (show_hidden_ ? "true" : "false") << "\n";
    return static_cast<bool>(file);
}

PreviewOptions Config::preview_options() const {
    PreviewOptions options;
    options.line_limit = preview_lines_;
    options.directory_limit = directory_preview_limit_;
    options.image_enabled = image_preview_;
    options.show_hidden = show_hidden_;
    return options;
}

}
