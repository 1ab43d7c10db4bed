#include "preview.hpp"
#include "directory_lister.hpp"
#include "document_extractor.hpp"
#include "text_format.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <string>
#include <system_error>

namespace quickswitch {

namespace {

constexpr std::size_t kReadChunkBytes = 64 * 1024;
constexpr std::size_t kRemainderCountLimit = 100000;

void report(Error *error, Error value) {
    spdlog::warn("Preview degraded ({}): {}", error_kind_name(value.kind), value.message);
    if (error != nullptr) {
        *error = std::move(value);
    }
}

std::string lower_extension(const std::filesystem::path &path) {
    return to_lower_ascii(path.extension().string());
}

// Listed sizes are only recorded for regular files; symlinks resolve here.
std::uintmax_t resolved_size(const Entry &entry) {
    if (entry.kind == EntryKind::File) {
        return entry.size;
    }
    std::error_code ec;
    const auto size = std::filesystem::file_size(entry.path, ec);
    return ec ? entry.size : size;
}

}

PreviewKind classify(const Entry &entry, const PreviewOptions &options) {
    if (entry.is_navigable()) {
        return PreviewKind::Directory;
    }
    const std::string ext = lower_extension(entry.path);
    if (ext == ".pdf") {
        return PreviewKind::Document;
    }
    if (options.image_enabled && (ext == ".png" || ext == ".jpg" || ext == ".jpeg")) {
        return PreviewKind::Image;
    }
    return PreviewKind::Sniffed;
}

bool runs_in_background(PreviewKind kind) {
    return kind == PreviewKind::Image || kind == PreviewKind::Document;
}

PreviewDispatcher::PreviewDispatcher(PreviewOptions options) : options_(options) {}

PreviewPayload PreviewDispatcher::preview(const Entry &entry, Error *error,
                                          const CancelCheck &cancelled) const {
    if (entry.kind == EntryKind::Other) {
        return binary_info(entry, error);
    }
    if (entry.kind == EntryKind::Symlink && !entry.target_is_directory) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(entry.path, ec)) {
            return binary_info(entry, error);
        }
    }

    switch (classify(entry, options_)) {
        case PreviewKind::Directory:
            return preview_directory(entry, error);
        case PreviewKind::Document:
            return preview_document(entry, error, cancelled);
        case PreviewKind::Image:
            return preview_image(entry, error, cancelled);
        case PreviewKind::Sniffed:
            return preview_sniffed(entry, error);
    }
    return EmptyPreview{};
}

PreviewPayload PreviewDispatcher::preview_directory(const Entry &entry, Error *error) const {
    std::error_code ec;
    std::filesystem::directory_iterator it(entry.path, std::filesystem::directory_options::none, ec);
    if (ec) {
        report(error, make_error(ec, "Error reading directory " + entry.name));
        return EmptyPreview{};
    }

    DirectorySummary summary;
    const std::filesystem::directory_iterator end;
    for (; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        if (!options_.show_hidden) {
            const std::string name = it->path().filename().string();
            if (!name.empty() && name[0] == '.') {
                continue;
            }
        }
        if (summary.children.size() < options_.directory_limit) {
            summary.children.push_back(make_entry(*it));
            continue;
        }
        // Past the cap only the count matters, so no stat calls are made.
        if (summary.remaining >= kRemainderCountLimit) {
            summary.remaining_is_lower_bound = true;
            break;
        }
        ++summary.remaining;
    }

    if (ec) {
        report(error, make_error(ec, "Error reading directory " + entry.name));
    }
    sort_entries(summary.children);
    return summary;
}

PreviewPayload PreviewDispatcher::preview_document(const Entry &entry, Error *error,
                                                   const CancelCheck &cancelled) const {
    if (resolved_size(entry) > options_.max_document_bytes) {
        report(error, Error{ErrorKind::DecodeFailure, "Document too large to extract: " + entry.name});
        return binary_info(entry, nullptr);
    }

    DocumentText document;
    Error extract_error;
    if (!extract_document_text(entry.path, options_.line_limit, document, extract_error, cancelled)) {
        report(error, extract_error);
        return binary_info(entry, nullptr);
    }
    return document;
}

PreviewPayload PreviewDispatcher::preview_image(const Entry &entry, Error *error,
                                                const CancelCheck &cancelled) const {
    if (resolved_size(entry) > options_.max_image_bytes) {
        report(error, Error{ErrorKind::DecodeFailure, "Image too large to decode: " + entry.name});
        return binary_info(entry, nullptr);
    }

    RgbImage decoded;
    Error decode_error;
    if (!decode_image(entry.path, decoded, decode_error, cancelled)) {
        report(error, decode_error);
        return binary_info(entry, nullptr);
    }

    ImageRender render;
    render.source_width = decoded.width;
    render.source_height = decoded.height;
    // Each terminal cell shows two vertically stacked pixels.
    render.raster = downscale(decoded, options_.image_columns, options_.image_rows * 2);
    return render;
}

PreviewPayload PreviewDispatcher::preview_sniffed(const Entry &entry, Error *error) const {
    std::ifstream file(entry.path, std::ios::binary);
    if (!file) {
        report(error, Error{ErrorKind::IoFailure, "Unable to open " + entry.name});
        return binary_info(entry, nullptr);
    }

    std::string chunk(options_.sniff_bytes, '\0');
    file.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    chunk.resize(static_cast<std::size_t>(file.gcount()));
    if (file.bad()) {
        report(error, Error{ErrorKind::IoFailure, "Read error in " + entry.name});
        return binary_info(entry, nullptr);
    }

    const bool window_full = chunk.size() == options_.sniff_bytes;
    if (chunk.find('\0') != std::string::npos || !is_valid_utf8(chunk, window_full)) {
        return binary_info(entry, error);
    }

    TextExcerpt excerpt;
    excerpt.file_size = resolved_size(entry);
    excerpt.bytes_read = chunk.size();

    std::string current;
    const auto push_line = [&] {
        if (!current.empty() && current.back() == '\r') {
            current.pop_back();
        }
        std::string text = current.size() > options_.max_line_bytes
                               ? truncate_utf8(current, options_.max_line_bytes) + "…"
                               : current;
        excerpt.lines.push_back(
            NumberedLine{excerpt.lines.size() + 1, escape_control_characters(text)});
        current.clear();
    };

    bool limit_reached = false;
    std::size_t pos = 0;
    while (true) {
        for (; pos < chunk.size(); ++pos) {
            const char c = chunk[pos];
            if (c == '\n') {
                push_line();
                if (excerpt.lines.size() >= options_.line_limit) {
                    ++pos;
                    limit_reached = true;
                    break;
                }
            } else if (current.size() <= options_.max_line_bytes) {
                current.push_back(c);
            }
        }
        if (limit_reached || !file || excerpt.bytes_read >= options_.max_text_bytes) {
            break;
        }

        const std::uintmax_t budget = options_.max_text_bytes - excerpt.bytes_read;
        chunk.assign(static_cast<std::size_t>(std::min<std::uintmax_t>(kReadChunkBytes, budget)), '\0');
        file.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        chunk.resize(static_cast<std::size_t>(file.gcount()));
        if (file.bad()) {
            report(error, Error{ErrorKind::IoFailure, "Read error in " + entry.name});
            break;
        }
        if (chunk.empty()) {
            break;
        }
        excerpt.bytes_read += chunk.size();
        pos = 0;
    }

    if (!limit_reached && !current.empty() && excerpt.lines.size() < options_.line_limit) {
        push_line();
    }

    excerpt.truncated = limit_reached ? (pos < chunk.size() || excerpt.bytes_read < excerpt.file_size)
                                      : excerpt.bytes_read < excerpt.file_size;
    return excerpt;
}

PreviewPayload PreviewDispatcher::binary_info(const Entry &entry, Error *error) const {
    std::error_code ec;
    const auto size = std::filesystem::file_size(entry.path, ec);
    if (ec) {
        if (entry.kind == EntryKind::Other) {
            return BinaryInfo{entry.size};
        }
        report(error, make_error(ec, "Unable to stat " + entry.name));
        return BinaryInfo{entry.size};
    }
    return BinaryInfo{size};
}

}
