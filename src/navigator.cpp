#include "navigator.hpp"
#include "text_format.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace quickswitch {

namespace {

constexpr long kPreviewScrollStep = 10;

std::filesystem::path resolve_directory(const std::filesystem::path &path) {
    std::error_code ec;
    auto resolved = std::filesystem::canonical(path, ec);
    if (!ec) {
        return resolved;
    }
    resolved = std::filesystem::absolute(path, ec);
    return ec ? path.lexically_normal() : resolved.lexically_normal();
}

bool is_character(const KeyEvent &event, char c) {
    return event.key == Key::Character && event.text.size() == 1 && event.text[0] == c;
}

}

const char *mode_name(NavigatorMode mode) {
    switch (mode) {
        case NavigatorMode::Browsing:  return "BROWSE";
        case NavigatorMode::Searching: return "SEARCH";
        case NavigatorMode::History:   return "HISTORY";
    }
    return "BROWSE";
}

Navigator::Navigator(const std::filesystem::path &start_dir, HistoryStore &history,
                     NavigatorOptions options)
    : history_(history), options_(std::move(options)) {
    options_.preview.show_hidden = options_.list.show_hidden;
    dispatcher_ = PreviewDispatcher(options_.preview);
    if (options_.background_previews) {
        const PreviewDispatcher dispatcher = dispatcher_;
        worker_ = std::make_unique<PreviewWorker>(
            [dispatcher](const Entry &entry, Error *error, const CancelCheck &cancelled) {
                return dispatcher.preview(entry, error, cancelled);
            });
    }

    current_dir_ = resolve_directory(start_dir);
    ListResult listing;
    Error error;
    if (list_directory(current_dir_, options_.list, listing, error)) {
        dir_entries_ = std::move(listing.entries);
        listing_truncated_ = listing.truncated;
    } else {
        set_status(error.message);
    }

    spdlog::info("Navigator started in {}", current_dir_.string());
    if (options_.initial_mode == NavigatorMode::History) {
        enter_history();
    } else {
        refresh_view();
    }
}

Navigator::~Navigator() {
    cancel_pending_preview();
}

const EntrySet &Navigator::displayed_entries() const {
    return mode_ == NavigatorMode::History ? history_entries_ : dir_entries_;
}

std::optional<std::size_t> Navigator::selection() const {
    if (view_.empty()) {
        return std::nullopt;
    }
    return selection_;
}

const Entry *Navigator::selected_entry() const {
    if (view_.empty()) {
        return nullptr;
    }
    return &displayed_entries()[view_[selection_]];
}

const Entry &Navigator::displayed_at(std::size_t view_index) const {
    return displayed_entries()[view_.at(view_index)];
}

const HistoryEntry *Navigator::history_details(std::size_t view_index) const {
    if (mode_ != NavigatorMode::History || view_index >= view_.size()) {
        return nullptr;
    }
    return &history_details_[view_[view_index]];
}

void Navigator::set_preview_notify(std::function<void()> notify) {
    if (worker_) {
        worker_->set_notify(std::move(notify));
    }
}

void Navigator::cancel_pending_preview() {
    if (worker_) {
        worker_->cancel();
    }
    // A placeholder whose job was dropped must be regenerated on the next refresh.
    if (std::holds_alternative<PendingPreview>(preview_)) {
        preview_path_.clear();
    }
}

bool Navigator::poll_preview() {
    if (!worker_) {
        return false;
    }
    auto result = worker_->take_result();
    if (!result || result->generation != preview_generation_) {
        return false;
    }
    preview_ = std::move(result->payload);
    if (result->error) {
        set_status(result->error->message);
    }
    return true;
}

Outcome Navigator::handle_key(const KeyEvent &event) {
    switch (mode_) {
        case NavigatorMode::Browsing:
            return handle_browsing(event);
        case NavigatorMode::Searching:
            return handle_searching(event);
        case NavigatorMode::History:
            return handle_history(event);
    }
    return Outcome::Continue;
}

Outcome Navigator::handle_browsing(const KeyEvent &event) {
    switch (event.key) {
        case Key::Up:       move_selection(-1); return Outcome::Continue;
        case Key::Down:     move_selection(1); return Outcome::Continue;
        case Key::Home:     jump_selection(false); return Outcome::Continue;
        case Key::End:      jump_selection(true); return Outcome::Continue;
        case Key::PageUp:   scroll_preview(-kPreviewScrollStep); return Outcome::Continue;
        case Key::PageDown: scroll_preview(kPreviewScrollStep); return Outcome::Continue;
        case Key::Left:     go_to_parent(); return Outcome::Continue;
        case Key::Right:    descend_selected(); return Outcome::Continue;
        case Key::Enter:    return confirm_selected(false);
        case Key::Tab:      return confirm_selected(true);
        case Key::Escape:   return Outcome::Cancelled;
        case Key::Backspace:
            return Outcome::Continue;
        case Key::Character:
            break;
    }

    if (is_character(event, 'k')) {
        move_selection(-1);
    } else if (is_character(event, 'j')) {
        move_selection(1);
    } else if (is_character(event, 'h')) {
        go_to_parent();
    } else if (is_character(event, 'l')) {
        descend_selected();
    } else if (is_character(event, '/')) {
        begin_search();
    } else if (is_character(event, 'v')) {
        enter_history();
    } else if (is_character(event, 'q')) {
        return Outcome::Cancelled;
    }
    return Outcome::Continue;
}

Outcome Navigator::handle_searching(const KeyEvent &event) {
    switch (event.key) {
        case Key::Up:       move_selection(-1); return Outcome::Continue;
        case Key::Down:     move_selection(1); return Outcome::Continue;
        case Key::Home:     jump_selection(false); return Outcome::Continue;
        case Key::End:      jump_selection(true); return Outcome::Continue;
        case Key::PageUp:   scroll_preview(-kPreviewScrollStep); return Outcome::Continue;
        case Key::PageDown: scroll_preview(kPreviewScrollStep); return Outcome::Continue;
        case Key::Left:     go_to_parent(); return Outcome::Continue;
        case Key::Right:    descend_selected(); return Outcome::Continue;
        case Key::Enter:    return confirm_selected(false);
        case Key::Tab:      return confirm_selected(true);
        case Key::Escape:
            end_search();
            return Outcome::Continue;
        case Key::Backspace:
            pop_utf8_code_point(query_);
            refresh_view();
            return Outcome::Continue;
        case Key::Character:
            if (!event.text.empty()) {
                query_ += event.text;
                refresh_view();
            }
            return Outcome::Continue;
    }
    return Outcome::Continue;
}

Outcome Navigator::handle_history(const KeyEvent &event) {
    switch (event.key) {
        case Key::Up:       move_selection(-1); return Outcome::Continue;
        case Key::Down:     move_selection(1); return Outcome::Continue;
        case Key::Home:     jump_selection(false); return Outcome::Continue;
        case Key::End:      jump_selection(true); return Outcome::Continue;
        case Key::PageUp:   scroll_preview(-kPreviewScrollStep); return Outcome::Continue;
        case Key::PageDown: scroll_preview(kPreviewScrollStep); return Outcome::Continue;
        case Key::Right:    descend_selected(); return Outcome::Continue;
        case Key::Enter:    return confirm_selected(false);
        case Key::Tab:      return confirm_selected(true);
        case Key::Escape:
            leave_history();
            return Outcome::Continue;
        case Key::Left:
        case Key::Backspace:
            return Outcome::Continue;
        case Key::Character:
            break;
    }

    if (is_character(event, 'k')) {
        move_selection(-1);
    } else if (is_character(event, 'j')) {
        move_selection(1);
    } else if (is_character(event, 'l')) {
        descend_selected();
    } else if (is_character(event, 'v')) {
        leave_history();
    } else if (is_character(event, 'q')) {
        return Outcome::Cancelled;
    }
    return Outcome::Continue;
}

bool Navigator::change_directory(const std::filesystem::path &target, bool record_history) {
    const std::filesystem::path resolved = resolve_directory(target);

    ListResult listing;
    Error error;
    if (!list_directory(resolved, options_.list, listing, error)) {
        spdlog::warn("Cannot enter {}: {}", resolved.string(), error.message);
        set_status(error.message);
        return false;
    }

    cancel_pending_preview();
    current_dir_ = resolved;
    dir_entries_ = std::move(listing.entries);
    listing_truncated_ = listing.truncated;
    mode_ = NavigatorMode::Browsing;
    query_.clear();
    selection_ = 0;
    status_.clear();
    if (listing_truncated_) {
        set_status("Listing truncated at " + std::to_string(options_.list.max_entries) + " entries");
    }

    if (record_history) {
        Error history_error;
        if (!history_.record(current_dir_, history_error)) {
            set_status(history_error.message);
        }
    }

    refresh_view();
    return true;
}

void Navigator::go_to_parent() {
    if (current_dir_ == current_dir_.root_path() || !current_dir_.has_parent_path()) {
        return;
    }
    change_directory(current_dir_.parent_path(), false);
}

void Navigator::descend_selected() {
    const Entry *entry = selected_entry();
    if (entry == nullptr || !entry->is_navigable()) {
        return;
    }
    const std::filesystem::path target = entry->path;
    change_directory(target, true);
}

void Navigator::enter_history() {
    cancel_pending_preview();
    history_entries_.clear();
    history_details_.clear();

    for (auto &record : history_.display_order(options_.history_sort)) {
        std::error_code ec;
        if (!std::filesystem::is_directory(record.path, ec)) {
            continue;
        }
        Entry entry;
        entry.name = record.path.string();
        entry.path = record.path;
        entry.kind = EntryKind::Directory;
        history_entries_.push_back(std::move(entry));
        history_details_.push_back(std::move(record));
    }

    mode_ = NavigatorMode::History;
    query_.clear();
    selection_ = 0;
    refresh_view();
    if (history_entries_.empty()) {
        set_status("History is empty");
    }
}

void Navigator::leave_history() {
    cancel_pending_preview();
    mode_ = NavigatorMode::Browsing;
    query_.clear();
    selection_ = 0;
    refresh_view();
}

void Navigator::begin_search() {
    mode_ = NavigatorMode::Searching;
    refresh_view();
}

void Navigator::end_search() {
    mode_ = NavigatorMode::Browsing;
    query_.clear();
    refresh_view();
}

void Navigator::move_selection(long delta) {
    if (view_.empty()) {
        return;
    }
    const long last = static_cast<long>(view_.size()) - 1;
    const long next = std::clamp(static_cast<long>(selection_) + delta, 0L, last);
    if (static_cast<std::size_t>(next) == selection_) {
        return;
    }
    selection_ = static_cast<std::size_t>(next);
    refresh_preview(false);
}

void Navigator::jump_selection(bool to_end) {
    if (view_.empty()) {
        return;
    }
    selection_ = to_end ? view_.size() - 1 : 0;
    refresh_preview(false);
}

void Navigator::scroll_preview(long delta) {
    const long limit = std::max(0L, static_cast<long>(preview_line_count()) - 1);
    preview_scroll_ = static_cast<std::size_t>(
        std::clamp(static_cast<long>(preview_scroll_) + delta, 0L, limit));
}

Outcome Navigator::confirm_selected(bool explicit_confirm) {
    const Entry *entry = selected_entry();
    if (entry != nullptr && entry->is_navigable() && !explicit_confirm) {
        descend_selected();
        return Outcome::Continue;
    }

    std::filesystem::path target;
    if (entry == nullptr) {
        target = current_dir_;
    } else if (entry->is_navigable()) {
        target = resolve_directory(entry->path);
    } else {
        target = resolve_directory(entry->path.parent_path());
    }

    handoff_path_ = target;
    cancel_pending_preview();

    Error history_error;
    if (!history_.record(target, history_error)) {
        spdlog::warn("History not saved on exit: {}", history_error.message);
    }
    spdlog::info("Confirmed {}", target.string());
    return Outcome::Confirmed;
}

void Navigator::refresh_view() {
    view_ = filter_entries(displayed_entries(), query_);
    if (view_.empty()) {
        selection_ = 0;
    } else {
        selection_ = std::min(selection_, view_.size() - 1);
    }
    refresh_preview(false);
}

void Navigator::refresh_preview(bool force) {
    const Entry *entry = selected_entry();
    if (entry == nullptr) {
        cancel_pending_preview();
        ++preview_generation_;
        preview_ = EmptyPreview{};
        preview_path_.clear();
        preview_scroll_ = 0;
        return;
    }
    if (!force && entry->path == preview_path_ && !std::holds_alternative<EmptyPreview>(preview_)) {
        return;
    }

    ++preview_generation_;
    preview_path_ = entry->path;
    preview_scroll_ = 0;

    if (worker_ && runs_in_background(classify(*entry, dispatcher_.options()))) {
        preview_ = PendingPreview{entry->name};
        worker_->submit(preview_generation_, *entry);
        return;
    }

    cancel_pending_preview();
    Error error;
    preview_ = dispatcher_.preview(*entry, &error);
    if (!error.message.empty()) {
        set_status(error.message);
    }
}

void Navigator::set_status(const std::string &message) {
    status_ = message;
}

std::size_t Navigator::preview_line_count() const {
    return std::visit(
        [](const auto &payload) -> std::size_t {
            using T = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<T, TextExcerpt> || std::is_same_v<T, DocumentText>) {
                return payload.lines.size();
            } else if constexpr (std::is_same_v<T, DirectorySummary>) {
                return payload.children.size();
            } else if constexpr (std::is_same_v<T, ImageRender>) {
                return static_cast<std::size_t>((payload.raster.height + 1) / 2);
            } else {
                return 0;
            }
        },
        preview_);
}

}
