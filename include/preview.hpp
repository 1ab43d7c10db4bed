#pragma once

#include "entry.hpp"
#include "errors.hpp"
#include "image_decoder.hpp"
#include "preview_payload.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace quickswitch {

enum class PreviewKind {
    Directory,
    Document,
    Image,
    Sniffed
};

struct PreviewOptions {
    std::size_t line_limit{100};
    std::size_t directory_limit{100};
    std::size_t sniff_bytes{8192};
    std::size_t max_line_bytes{1024};
    std::uintmax_t max_text_bytes{1024 * 1024};
    std::uintmax_t max_image_bytes{32ULL * 1024 * 1024};
    std::uintmax_t max_document_bytes{64ULL * 1024 * 1024};
    int image_columns{64};
    int image_rows{32};
    bool image_enabled{true};
    // Dot-files in directory previews follow the listing's hidden-file setting.
    bool show_hidden{true};
};

PreviewKind classify(const Entry &entry, const PreviewOptions &options);

// Image decoding and document extraction are slow enough to run off the input thread.
bool runs_in_background(PreviewKind kind);

class PreviewDispatcher {
public:
    PreviewDispatcher() = default;
    explicit PreviewDispatcher(PreviewOptions options);

    // Builds the payload for one entry. Never throws for I/O or decode problems: those
    // degrade to BinaryInfo (or EmptyPreview) and are reported through `error` when
    // it is non-null.
    PreviewPayload preview(const Entry &entry, Error *error = nullptr,
                           const CancelCheck &cancelled = {}) const;

    const PreviewOptions &options() const { return options_; }

private:
    PreviewPayload preview_directory(const Entry &entry, Error *error) const;
    PreviewPayload preview_document(const Entry &entry, Error *error, const CancelCheck &cancelled) const;
    PreviewPayload preview_image(const Entry &entry, Error *error, const CancelCheck &cancelled) const;
    PreviewPayload preview_sniffed(const Entry &entry, Error *error) const;
    PreviewPayload binary_info(const Entry &entry, Error *error) const;

    PreviewOptions options_;
};

}
