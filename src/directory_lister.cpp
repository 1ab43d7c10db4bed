#include "directory_lister.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace quickswitch {

Entry make_entry(const std::filesystem::directory_entry &dirent) {
    Entry entry;
    entry.path = dirent.path();
    entry.name = dirent.path().filename().string();

    std::error_code ec;
    const auto link_status = dirent.symlink_status(ec);
    if (ec) {
        entry.kind = EntryKind::Other;
        return entry;
    }

    if (std::filesystem::is_symlink(link_status)) {
        entry.kind = EntryKind::Symlink;
        std::error_code target_ec;
        entry.target_is_directory = dirent.is_directory(target_ec) && !target_ec;
    } else if (std::filesystem::is_directory(link_status)) {
        entry.kind = EntryKind::Directory;
    } else if (std::filesystem::is_regular_file(link_status)) {
        entry.kind = EntryKind::File;
        std::error_code size_ec;
        const auto size = dirent.file_size(size_ec);
        entry.size = size_ec ? 0 : size;
    } else {
        entry.kind = EntryKind::Other;
    }

    std::error_code time_ec;
    const auto modified = dirent.last_write_time(time_ec);
    if (!time_ec) {
        entry.modified = modified;
    }
    return entry;
}

bool list_directory(const std::filesystem::path &path, const ListOptions &options,
                    ListResult &result, Error &error) {
    result = ListResult{};

    std::error_code ec;
    const auto status = std::filesystem::status(path, ec);
    if (status.type() == std::filesystem::file_type::not_found) {
        error = Error{ErrorKind::NotFound, "Path does not exist: " + path.string()};
        return false;
    }
    if (ec) {
        error = make_error(ec, path.string());
        return false;
    }
    if (!std::filesystem::is_directory(status)) {
        error = Error{ErrorKind::NotADirectory, "Not a directory: " + path.string()};
        return false;
    }

    std::filesystem::directory_iterator it(path, std::filesystem::directory_options::none, ec);
    if (ec) {
        error = make_error(ec, "Error reading directory " + path.string());
        return false;
    }

    for (const std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        if (result.entries.size() >= options.max_entries) {
            result.truncated = true;
            break;
        }
        const auto &dirent = *it;
        const std::string name = dirent.path().filename().string();
        if (!options.show_hidden && !name.empty() && name[0] == '.') {
            continue;
        }
        result.entries.push_back(make_entry(dirent));
    }

    if (ec) {
        error = make_error(ec, "Error reading directory " + path.string());
        result.entries.clear();
        return false;
    }

    sort_entries(result.entries);
    spdlog::debug("Listed {} entries in {}{}", result.entries.size(), path.string(),
                  result.truncated ? " (truncated)" : "");
    return true;
}

}
