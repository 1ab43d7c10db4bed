#include "document_extractor.hpp"
#include "text_format.hpp"

#include <memory>
#include <sstream>
#include <string>

#include <poppler-document.h>
#include <poppler-page.h>

namespace quickswitch {

bool extract_document_text(const std::filesystem::path &path, std::size_t max_lines,
                           DocumentText &document, Error &error, const CancelCheck &cancelled) {
    document = DocumentText{};

    std::unique_ptr<poppler::document> pdf(poppler::document::load_from_file(path.string()));
    if (!pdf) {
        error = Error{ErrorKind::DecodeFailure, "Failed to open PDF: " + path.filename().string()};
        return false;
    }
    if (pdf->is_locked()) {
        error = Error{ErrorKind::DecodeFailure, "PDF is encrypted: " + path.filename().string()};
        return false;
    }

    document.page_count = pdf->pages();
    for (int index = 0; index < document.page_count; ++index) {
        if (document.lines.size() >= max_lines) {
            document.truncated = true;
            break;
        }
        if (cancelled && cancelled()) {
            error = Error{ErrorKind::DecodeFailure, "PDF extraction cancelled"};
            return false;
        }

        std::unique_ptr<poppler::page> page(pdf->create_page(index));
        if (!page) {
            continue;
        }
        const poppler::byte_array utf8 = page->text().to_utf8();
        ++document.pages_read;

        std::istringstream stream(std::string(utf8.begin(), utf8.end()));
        std::string line;
        while (std::getline(stream, line)) {
            if (document.lines.size() >= max_lines) {
                document.truncated = true;
                break;
            }
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (!line.empty() && line.front() == '\f') {
                line.erase(0, 1);
            }
            document.lines.push_back(
                NumberedLine{document.lines.size() + 1, escape_control_characters(line)});
        }
    }

    if (document.pages_read == 0 && document.page_count > 0) {
        error = Error{ErrorKind::DecodeFailure, "No extractable text in " + path.filename().string()};
        return false;
    }
    return true;
}

}
