#pragma once

#include "errors.hpp"
#include "image_decoder.hpp"
#include "preview_payload.hpp"

#include <cstddef>
#include <filesystem>

namespace quickswitch {

// Extracts plain text from a PDF one page at a time, stopping as soon as `max_lines`
// lines have been collected. Pages past that point are never rendered to text.
bool extract_document_text(const std::filesystem::path &path, std::size_t max_lines,
                           DocumentText &document, Error &error,
                           const CancelCheck &cancelled = {});

}
