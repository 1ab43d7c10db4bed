#pragma once

#include "entry.hpp"
#include "image_decoder.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace quickswitch {

struct NumberedLine {
    std::size_t number{0};
    std::string text;
};

struct EmptyPreview {};

struct PendingPreview {
    std::string name;
};

struct DirectorySummary {
    std::vector<Entry> children;
    std::size_t remaining{0};
    bool remaining_is_lower_bound{false};
};

struct TextExcerpt {
    std::vector<NumberedLine> lines;
    bool truncated{false};
    std::uintmax_t bytes_read{0};
    std::uintmax_t file_size{0};
};

struct ImageRender {
    RgbImage raster;
    int source_width{0};
    int source_height{0};
};

struct DocumentText {
    std::vector<NumberedLine> lines;
    bool truncated{false};
    int pages_read{0};
    int page_count{0};
};

struct BinaryInfo {
    std::uintmax_t size{0};
};

using PreviewPayload = std::variant<EmptyPreview, PendingPreview, DirectorySummary, TextExcerpt,
                                    ImageRender, DocumentText, BinaryInfo>;

}
