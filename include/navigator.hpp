#pragma once

#include "directory_lister.hpp"
#include "entry.hpp"
#include "filter.hpp"
#include "history_store.hpp"
#include "preview.hpp"
#include "preview_payload.hpp"
#include "preview_worker.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace quickswitch {

enum class NavigatorMode {
    Browsing,
    Searching,
    History
};

const char *mode_name(NavigatorMode mode);

enum class Key {
    Up,
    Down,
    Left,
    Right,
    Enter,
    Escape,
    Backspace,
    Tab,
    PageUp,
    PageDown,
    Home,
    End,
    Character
};

struct KeyEvent {
    Key key{Key::Character};
    std::string text;

    static KeyEvent of(Key key) { return KeyEvent{key, {}}; }
    static KeyEvent character(std::string text) { return KeyEvent{Key::Character, std::move(text)}; }
};

enum class Outcome {
    Continue,
    Confirmed,
    Cancelled
};

struct NavigatorOptions {
    ListOptions list;
    PreviewOptions preview;
    HistorySort history_sort{HistorySort::Recent};
    NavigatorMode initial_mode{NavigatorMode::Browsing};
    // Decode images and extract documents on the preview worker instead of inline.
    bool background_previews{false};
};

// Owns the session: current directory listing, query, filtered view, selection,
// mode and preview. Every call to handle_key leaves the view, the selection and the
// preview consistent with each other before it returns.
class Navigator {
public:
    Navigator(const std::filesystem::path &start_dir, HistoryStore &history,
              NavigatorOptions options = {});
    ~Navigator();

    Navigator(const Navigator &) = delete;
    Navigator &operator=(const Navigator &) = delete;

    Outcome handle_key(const KeyEvent &event);

    // Adopts a finished background preview if it still belongs to the highlighted
    // entry. Returns true when the preview changed.
    bool poll_preview();
    void set_preview_notify(std::function<void()> notify);
    void cancel_pending_preview();

    NavigatorMode mode() const { return mode_; }
    const std::filesystem::path &current_dir() const { return current_dir_; }
    const std::string &query() const { return query_; }
    const EntrySet &displayed_entries() const;
    const FilteredView &view() const { return view_; }
    std::size_t displayed_count() const { return view_.size(); }
    std::optional<std::size_t> selection() const;
    const Entry *selected_entry() const;
    const Entry &displayed_at(std::size_t view_index) const;
    const HistoryEntry *history_details(std::size_t view_index) const;

    const PreviewPayload &preview() const { return preview_; }
    std::size_t preview_scroll() const { return preview_scroll_; }
    const std::string &status() const { return status_; }
    bool listing_truncated() const { return listing_truncated_; }
    const std::optional<std::filesystem::path> &handoff_path() const { return handoff_path_; }

private:
    bool change_directory(const std::filesystem::path &target, bool record_history);
    void go_to_parent();
    void descend_selected();
    void enter_history();
    void leave_history();
    void begin_search();
    void end_search();
    void move_selection(long delta);
    void jump_selection(bool to_end);
    void scroll_preview(long delta);
    Outcome confirm_selected(bool explicit_confirm);

    Outcome handle_browsing(const KeyEvent &event);
    Outcome handle_searching(const KeyEvent &event);
    Outcome handle_history(const KeyEvent &event);

    void refresh_view();
    void refresh_preview(bool force);
    void set_status(const std::string &message);
    std::size_t preview_line_count() const;

    HistoryStore &history_;
    NavigatorOptions options_;
    PreviewDispatcher dispatcher_;
    std::unique_ptr<PreviewWorker> worker_;

    NavigatorMode mode_{NavigatorMode::Browsing};
    std::filesystem::path current_dir_;
    EntrySet dir_entries_;
    EntrySet history_entries_;
    std::vector<HistoryEntry> history_details_;
    bool listing_truncated_{false};

    std::string query_;
    FilteredView view_;
    std::size_t selection_{0};

    PreviewPayload preview_{EmptyPreview{}};
    std::filesystem::path preview_path_;
    std::uint64_t preview_generation_{0};
    std::size_t preview_scroll_{0};

    std::string status_;
    std::optional<std::filesystem::path> handoff_path_;
};

}
