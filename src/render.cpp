#include "render.hpp"
#include "filter.hpp"
#include "text_format.hpp"

#include <ftxui/screen/color.hpp>

#include <algorithm>
#include <string>
#include <type_traits>
#include <variant>

namespace quickswitch {
namespace {

struct Theme {
    ftxui::Color background;
    ftxui::Color panel;
    ftxui::Color panel_alt;
    ftxui::Color accent;
    ftxui::Color border;
    ftxui::Color text;
    ftxui::Color text_dim;
    ftxui::Color directory;
    ftxui::Color warning;
    ftxui::Color danger;
};

const Theme kTheme{ftxui::Color::RGB(16, 18, 26),    ftxui::Color::RGB(26, 28, 38),
                   ftxui::Color::RGB(32, 34, 46),    ftxui::Color::RGB(129, 200, 190),
                   ftxui::Color::RGB(118, 92, 199),  ftxui::Color::RGB(230, 230, 230),
                   ftxui::Color::RGB(160, 164, 182), ftxui::Color::RGB(124, 200, 146),
                   ftxui::Color::RGB(230, 196, 84),  ftxui::Color::RGB(232, 125, 104)};

std::string entry_icon(const Entry &entry) {
    switch (entry.kind) {
        case EntryKind::Directory: return "📁 ";
        case EntryKind::Symlink:   return entry.target_is_directory ? "🔗 " : "↪ ";
        case EntryKind::File:      return "📄 ";
        case EntryKind::Other:     return "⚙ ";
    }
    return "  ";
}

ftxui::Color entry_color(const Entry &entry) {
    if (entry.is_navigable()) {
        return kTheme.directory;
    }
    if (entry.kind == EntryKind::Other) {
        return kTheme.warning;
    }
    return kTheme.text;
}

ftxui::Element highlighted_name(const std::string &name, const std::string &query) {
    using namespace ftxui;
    const auto ranges = match_ranges(name, query);
    if (ranges.empty()) {
        return text(name);
    }

    Elements parts;
    std::size_t cursor = 0;
    for (const auto &[begin, end] : ranges) {
        if (begin > cursor) {
            parts.push_back(text(name.substr(cursor, begin - cursor)));
        }
        parts.push_back(text(name.substr(begin, end - begin)) | bold | underlined |
                        color(kTheme.warning));
        cursor = end;
    }
    if (cursor < name.size()) {
        parts.push_back(text(name.substr(cursor)));
    }
    return hbox(std::move(parts));
}

ftxui::Element render_row(const Navigator &navigator, std::size_t view_index, bool selected) {
    using namespace ftxui;
    const Entry &entry = navigator.displayed_at(view_index);

    Element detail;
    if (const HistoryEntry *record = navigator.history_details(view_index)) {
        detail = text(std::to_string(record->visits) + "× " + format_visit_time(record->last_visited));
    } else if (entry.is_navigable()) {
        detail = text("<DIR>");
    } else {
        detail = text(format_file_size(entry.size));
    }

    auto line = hbox({
        text(entry_icon(entry)),
        highlighted_name(entry.name, navigator.query()) | flex,
        text("  "),
        detail | align_right | size(WIDTH, EQUAL, 20),
    });

    if (selected) {
        return line | bgcolor(kTheme.panel_alt) | color(kTheme.accent) | bold | focus;
    }
    return line | color(entry_color(entry));
}

ftxui::Element render_list(const Navigator &navigator) {
    using namespace ftxui;
    Elements rows;
    const auto selection = navigator.selection();
    for (std::size_t i = 0; i < navigator.displayed_count(); ++i) {
        rows.push_back(render_row(navigator, i, selection && *selection == i));
    }

    if (rows.empty()) {
        std::string message = "Empty directory";
        if (!navigator.query().empty()) {
            message = "No entries match \"" + navigator.query() + "\"";
        } else if (navigator.mode() == NavigatorMode::History) {
            message = "No history yet";
        }
        rows.push_back(text(message) | color(kTheme.text_dim) | dim | center);
    }

    return vbox(std::move(rows)) | vscroll_indicator | yframe | yflex;
}

ftxui::Element render_numbered(const std::vector<NumberedLine> &lines, std::size_t scroll) {
    using namespace ftxui;
    std::size_t width = std::to_string(lines.empty() ? 0 : lines.back().number).size();
    width = std::max<std::size_t>(width, 3);

    Elements rows;
    for (std::size_t i = std::min(scroll, lines.size()); i < lines.size(); ++i) {
        rows.push_back(hbox({
            text(format_line_number(lines[i].number, width)) | color(kTheme.text_dim),
            text(lines[i].text) | color(kTheme.text),
        }));
    }
    return vbox(std::move(rows));
}

ftxui::Element render_image(const ImageRender &image, std::size_t scroll) {
    using namespace ftxui;
    const RgbImage &raster = image.raster;
    Elements rows;
    for (int y = static_cast<int>(scroll) * 2; y < raster.height; y += 2) {
        Elements cells;
        for (int x = 0; x < raster.width; ++x) {
            const Rgb top = raster.at(x, y);
            const Rgb bottom = y + 1 < raster.height ? raster.at(x, y + 1) : Rgb{0, 0, 0};
            cells.push_back(text("▀") | color(Color::RGB(top.r, top.g, top.b)) |
                            bgcolor(Color::RGB(bottom.r, bottom.g, bottom.b)));
        }
        rows.push_back(hbox(std::move(cells)));
    }
    rows.push_back(text(std::to_string(image.source_width) + "×" +
                        std::to_string(image.source_height)) |
                   color(kTheme.text_dim) | dim);
    return vbox(std::move(rows));
}

ftxui::Element render_help() {
    using namespace ftxui;
    auto key = [](const std::string &keys, const std::string &action) {
        return hbox({text(keys) | bold | color(kTheme.accent) | size(WIDTH, EQUAL, 14),
                     text(action) | color(kTheme.text)});
    };
    return vbox({
        text("Keys") | bold | color(kTheme.accent),
        separator() | color(kTheme.border),
        key("↑↓ / j k", "Move selection"),
        key("← / h", "Parent directory"),
        key("→ / l", "Enter directory"),
        key("Enter", "Enter directory or pick file's folder"),
        key("Tab", "Pick highlighted directory"),
        key("/", "Search"),
        key("v", "Toggle history"),
        key("PgUp PgDn", "Scroll preview"),
        key("Esc / q", "Cancel"),
    });
}

}

ftxui::Element render_preview(const PreviewPayload &payload, std::size_t scroll) {
    using namespace ftxui;
    return std::visit(
        [scroll](const auto &value) -> Element {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, EmptyPreview>) {
                return render_help();
            } else if constexpr (std::is_same_v<T, PendingPreview>) {
                return text("Loading " + value.name + "…") | color(kTheme.text_dim) | dim;
            } else if constexpr (std::is_same_v<T, DirectorySummary>) {
                Elements rows;
                for (std::size_t i = std::min(scroll, value.children.size());
                     i < value.children.size(); ++i) {
                    const Entry &child = value.children[i];
                    rows.push_back(text(entry_icon(child) + child.name) | color(entry_color(child)));
                }
                if (value.children.empty()) {
                    rows.push_back(text("Empty directory") | color(kTheme.text_dim) | dim);
                }
                if (value.remaining > 0) {
                    rows.push_back(text(format_remainder(value.remaining, value.remaining_is_lower_bound)) |
                                   color(kTheme.text_dim) | dim);
                }
                return vbox(std::move(rows));
            } else if constexpr (std::is_same_v<T, TextExcerpt>) {
                Elements rows{render_numbered(value.lines, scroll)};
                if (value.lines.empty()) {
                    rows.push_back(text("Empty file") | color(kTheme.text_dim) | dim);
                }
                if (value.truncated) {
                    rows.push_back(text("… " + format_file_size(value.file_size) + " total") |
                                   color(kTheme.text_dim) | dim);
                }
                return vbox(std::move(rows));
            } else if constexpr (std::is_same_v<T, ImageRender>) {
                return render_image(value, scroll);
            } else if constexpr (std::is_same_v<T, DocumentText>) {
                Elements rows{render_numbered(value.lines, scroll)};
                rows.push_back(text("Page " + std::to_string(value.pages_read) + " of " +
                                    std::to_string(value.page_count) +
                                    (value.truncated ? " (truncated)" : "")) |
                               color(kTheme.text_dim) | dim);
                return vbox(std::move(rows));
            } else {
                return vbox({
                    text("Binary file") | bold | color(kTheme.warning),
                    text(format_file_size(value.size)) | color(kTheme.text_dim),
                });
            }
        },
        payload);
}

ftxui::Element render_navigator(const Navigator &navigator) {
    using namespace ftxui;

    std::string location = navigator.mode() == NavigatorMode::History
                               ? "Recent directories"
                               : navigator.current_dir().string();
    auto header = hbox({
        text(" " + std::string(mode_name(navigator.mode())) + " ") | bold |
            bgcolor(kTheme.accent) | color(kTheme.background),
        text(" "),
        text(location) | bold | color(kTheme.accent),
        filler(),
        text(std::to_string(navigator.displayed_count()) + " items") | color(kTheme.text_dim),
    });

    std::string preview_title = " Preview ";
    if (const Entry *entry = navigator.selected_entry()) {
        preview_title = " " + entry->name + " ";
    }

    auto list = window(text(" Entries ") | color(kTheme.accent), render_list(navigator)) |
                color(kTheme.border) | bgcolor(kTheme.panel);
    auto preview = window(text(preview_title) | color(kTheme.accent),
                          render_preview(navigator.preview(), navigator.preview_scroll()) | yframe |
                              flex) |
                   color(kTheme.border) | bgcolor(kTheme.panel);

    Element footer;
    if (navigator.mode() == NavigatorMode::Searching) {
        footer = hbox({text("/") | bold | color(kTheme.warning),
                       text(navigator.query()) | color(kTheme.text), text("█") | blink});
    } else if (!navigator.status().empty()) {
        footer = text(navigator.status()) | color(kTheme.danger);
    } else {
        footer = text("Enter: open  Tab: pick  /: search  v: history  q: quit") |
                 color(kTheme.text_dim);
    }

    return vbox({
               header,
               separator() | color(kTheme.border),
               hbox({list | size(WIDTH, GREATER_THAN, 30) | flex, preview | flex}) | flex,
               separator() | color(kTheme.border),
               footer,
           }) |
           bgcolor(kTheme.background) | color(kTheme.text);
}

}
