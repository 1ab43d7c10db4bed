#include "navigator.hpp"
#include "test_support.hpp"

#include <png.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <random>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using namespace quickswitch;
using quickswitch::testing::TempDir;
using quickswitch::testing::write_file;

namespace {

KeyEvent key(Key k) {
    return KeyEvent::of(k);
}

KeyEvent ch(const std::string &text) {
    return KeyEvent::character(text);
}

void type(Navigator &navigator, const std::string &text) {
    for (char c : text) {
        assert(navigator.handle_key(ch(std::string(1, c))) == Outcome::Continue);
    }
}

void check_consistent(const Navigator &navigator) {
    const auto selection = navigator.selection();
    if (navigator.displayed_count() == 0) {
        assert(!selection);
        assert(navigator.selected_entry() == nullptr);
        assert(std::holds_alternative<EmptyPreview>(navigator.preview()));
    } else {
        assert(selection);
        assert(*selection < navigator.displayed_count());
        assert(navigator.selected_entry() != nullptr);
    }
}

struct Fixture {
    TempDir root;
    TempDir data;
    HistoryStore history{data / "history.txt"};

    Fixture() {
        std::filesystem::create_directory(root / "banana");
        write_file(root / "banana" / "inside.txt", "hello\n");
        write_file(root / "apple.txt", "apple\n");
        write_file(root / "avocado.md", "# avocado\n");
    }
};

void test_initial_state() {
    Fixture f;
    Navigator navigator(f.root.path(), f.history);
    assert(navigator.mode() == NavigatorMode::Browsing);
    assert(navigator.current_dir() == f.root.path());
    assert(navigator.query().empty());
    assert(navigator.displayed_count() == 3);
    assert(navigator.selection() == std::optional<std::size_t>(0));
    assert(navigator.selected_entry()->name == "banana");
    const auto *summary = std::get_if<DirectorySummary>(&navigator.preview());
    assert(summary != nullptr);
    assert(summary->children.size() == 1);
    check_consistent(navigator);
}

void test_search_transitions() {
    Fixture f;
    Navigator navigator(f.root.path(), f.history);

    assert(navigator.handle_key(ch("/")) == Outcome::Continue);
    assert(navigator.mode() == NavigatorMode::Searching);

    type(navigator, "av");
    assert(navigator.query() == "av");
    assert(navigator.displayed_count() == 1);
    assert(navigator.selected_entry()->name == "avocado.md");
    assert(std::holds_alternative<TextExcerpt>(navigator.preview()));

    // j and k are query text while searching.
    type(navigator, "j");
    assert(navigator.query() == "avj");
    assert(navigator.displayed_count() == 0);
    check_consistent(navigator);

    assert(navigator.handle_key(key(Key::Backspace)) == Outcome::Continue);
    assert(navigator.query() == "av");
    assert(navigator.displayed_count() == 1);
    check_consistent(navigator);

    assert(navigator.handle_key(key(Key::Escape)) == Outcome::Continue);
    assert(navigator.mode() == NavigatorMode::Browsing);
    assert(navigator.query().empty());
    assert(navigator.displayed_count() == 3);
    check_consistent(navigator);
}

void test_selection_is_clamped_when_view_shrinks() {
    Fixture f;
    Navigator navigator(f.root.path(), f.history);
    assert(navigator.handle_key(key(Key::End)) == Outcome::Continue);
    assert(navigator.selection() == std::optional<std::size_t>(2));

    navigator.handle_key(ch("/"));
    type(navigator, "apple");
    assert(navigator.displayed_count() == 1);
    assert(navigator.selection() == std::optional<std::size_t>(0));
    assert(navigator.selected_entry()->name == "apple.txt");
}

void test_descend_and_parent() {
    Fixture f;
    Navigator navigator(f.root.path(), f.history);

    navigator.handle_key(ch("/"));
    type(navigator, "ban");
    assert(navigator.handle_key(key(Key::Right)) == Outcome::Continue);
    assert(navigator.mode() == NavigatorMode::Browsing);
    assert(navigator.current_dir() == f.root / "banana");
    assert(navigator.query().empty());
    assert(navigator.selection() == std::optional<std::size_t>(0));
    assert(navigator.selected_entry()->name == "inside.txt");
    assert(f.history.list().size() == 1);
    assert(f.history.list().front().path == f.root / "banana");

    assert(navigator.handle_key(ch("h")) == Outcome::Continue);
    assert(navigator.current_dir() == f.root.path());
    assert(navigator.selection() == std::optional<std::size_t>(0));
    assert(f.history.list().size() == 1);

    assert(navigator.handle_key(ch("l")) == Outcome::Continue);
    assert(navigator.current_dir() == f.root / "banana");
    assert(f.history.list().front().visits == 2);

    // Descending into a file does nothing.
    assert(navigator.handle_key(key(Key::Right)) == Outcome::Continue);
    assert(navigator.current_dir() == f.root / "banana");
}

void test_parent_of_root_is_noop() {
    TempDir data;
    HistoryStore history(data / "history.txt");
    Navigator navigator("/", history);
    assert(navigator.current_dir() == "/");
    assert(navigator.handle_key(key(Key::Left)) == Outcome::Continue);
    assert(navigator.current_dir() == "/");
}

void test_enter_on_file_confirms_parent() {
    Fixture f;
    Navigator navigator(f.root.path(), f.history);
    assert(navigator.handle_key(key(Key::Down)) == Outcome::Continue);
    assert(navigator.selected_entry()->name == "apple.txt");

    assert(navigator.handle_key(key(Key::Enter)) == Outcome::Confirmed);
    assert(navigator.handoff_path().has_value());
    assert(*navigator.handoff_path() == f.root.path());
    assert(f.history.list().front().path == f.root.path());
}

void test_enter_on_directory_descends_and_tab_confirms() {
    Fixture f;
    Navigator navigator(f.root.path(), f.history);
    assert(navigator.handle_key(key(Key::Tab)) == Outcome::Confirmed);
    assert(*navigator.handoff_path() == f.root / "banana");

    Navigator second(f.root.path(), f.history);
    assert(second.handle_key(key(Key::Enter)) == Outcome::Continue);
    assert(second.current_dir() == f.root / "banana");
}

void test_cancel() {
    Fixture f;
    Navigator navigator(f.root.path(), f.history);
    assert(navigator.handle_key(key(Key::Escape)) == Outcome::Cancelled);
    assert(!navigator.handoff_path().has_value());
    assert(f.history.list().empty());

    Navigator again(f.root.path(), f.history);
    assert(again.handle_key(ch("q")) == Outcome::Cancelled);
}

void test_empty_directory() {
    TempDir root;
    TempDir data;
    HistoryStore history(data / "history.txt");
    Navigator navigator(root.path(), history);
    check_consistent(navigator);

    assert(navigator.handle_key(key(Key::Down)) == Outcome::Continue);
    assert(navigator.handle_key(key(Key::Up)) == Outcome::Continue);
    assert(navigator.handle_key(key(Key::End)) == Outcome::Continue);
    navigator.handle_key(key(Key::Right));
    navigator.handle_key(ch("/"));
    type(navigator, "x");
    navigator.handle_key(key(Key::Backspace));
    navigator.handle_key(key(Key::Backspace));
    check_consistent(navigator);

    assert(navigator.handle_key(key(Key::Tab)) == Outcome::Confirmed);
    assert(*navigator.handoff_path() == root.path());
}

void test_missing_start_directory() {
    TempDir root;
    TempDir data;
    HistoryStore history(data / "history.txt");
    Navigator navigator(root / "gone", history);
    assert(navigator.displayed_count() == 0);
    assert(!navigator.status().empty());
    check_consistent(navigator);
}

void test_failed_descend_keeps_listing() {
    Fixture f;
    Navigator navigator(f.root.path(), f.history);
    std::filesystem::remove_all(f.root / "banana");

    navigator.handle_key(key(Key::Right));
    assert(navigator.current_dir() == f.root.path());
    assert(navigator.displayed_count() == 3);
    assert(!navigator.status().empty());
    check_consistent(navigator);
}

void test_history_mode() {
    Fixture f;
    Error error;
    assert(f.history.record(f.root / "banana", error));
    assert(f.history.record(f.root / "vanished", error));
    assert(f.history.record(f.root.path(), error));

    Navigator navigator(f.root / "banana", f.history);
    assert(navigator.handle_key(ch("v")) == Outcome::Continue);
    assert(navigator.mode() == NavigatorMode::History);
    // Directories that no longer exist are not offered.
    assert(navigator.displayed_count() == 2);
    assert(navigator.selected_entry()->path == f.root.path());
    assert(navigator.history_details(0) != nullptr);
    assert(navigator.history_details(0)->visits == 1);

    navigator.handle_key(ch("j"));
    assert(navigator.selected_entry()->path == f.root / "banana");
    navigator.handle_key(key(Key::Escape));
    assert(navigator.mode() == NavigatorMode::Browsing);
    assert(navigator.current_dir() == f.root / "banana");

    navigator.handle_key(ch("v"));
    assert(navigator.handle_key(key(Key::Enter)) == Outcome::Continue);
    assert(navigator.mode() == NavigatorMode::Browsing);
    assert(navigator.current_dir() == f.root.path());
    assert(f.history.list().front().visits == 2);

    NavigatorOptions options;
    options.initial_mode = NavigatorMode::History;
    Navigator started(f.root.path(), f.history, options);
    assert(started.mode() == NavigatorMode::History);
    assert(started.handle_key(key(Key::Tab)) == Outcome::Confirmed);
    assert(*started.handoff_path() == f.root.path());
}

void write_png(const std::filesystem::path &path, int width, int height) {
    std::vector<png_byte> pixels(static_cast<std::size_t>(width) * height * 3, 0x80);
    png_image image{};
    image.version = PNG_IMAGE_VERSION;
    image.width = static_cast<png_uint_32>(width);
    image.height = static_cast<png_uint_32>(height);
    image.format = PNG_FORMAT_RGB;
    const int ok = png_image_write_to_file(&image, path.c_str(), 0, pixels.data(), 0, nullptr);
    assert(ok != 0);
    (void)ok;
}

// Polls until a background result is adopted. Gives up after about five seconds.
bool wait_for_preview(Navigator &navigator) {
    for (int i = 0; i < 500; ++i) {
        if (navigator.poll_preview()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}

int adopted_width(const Navigator &navigator) {
    const auto *image = std::get_if<ImageRender>(&navigator.preview());
    assert(image != nullptr);
    return image->source_width;
}

struct MediaFixture {
    TempDir root;
    TempDir data;
    HistoryStore history{data / "history.txt"};
    NavigatorOptions options;

    MediaFixture() {
        write_png(root / "a_small.png", 4, 2);
        write_png(root / "b_large.png", 16, 8);
        write_file(root / "c_notes.txt", "notes\n");
        write_file(root / "d_broken.png", "definitely not a png");
        options.background_previews = true;
    }
};

void test_background_preview_is_adopted() {
    MediaFixture f;
    Navigator navigator(f.root.path(), f.history, f.options);
    assert(navigator.selected_entry()->name == "a_small.png");
    const auto *pending = std::get_if<PendingPreview>(&navigator.preview());
    assert(pending != nullptr);
    assert(pending->name == "a_small.png");
    assert(wait_for_preview(navigator));
    assert(adopted_width(navigator) == 4);
    assert(!navigator.poll_preview());
    check_consistent(navigator);
}

void test_superseded_background_preview_is_dropped() {
    MediaFixture f;
    Navigator navigator(f.root.path(), f.history, f.options);
    assert(navigator.handle_key(key(Key::Down)) == Outcome::Continue);
    assert(navigator.selected_entry()->name == "b_large.png");
    assert(std::holds_alternative<PendingPreview>(navigator.preview()));

    assert(wait_for_preview(navigator));
    assert(adopted_width(navigator) == 16);

    // The first image's job can never land on top of the second one.
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    assert(!navigator.poll_preview());
    assert(adopted_width(navigator) == 16);
}

void test_moving_to_inline_preview_cancels_job() {
    MediaFixture f;
    Navigator navigator(f.root.path(), f.history, f.options);
    assert(navigator.handle_key(key(Key::Down)) == Outcome::Continue);
    assert(navigator.handle_key(key(Key::Down)) == Outcome::Continue);
    assert(navigator.selected_entry()->name == "c_notes.txt");
    assert(std::holds_alternative<TextExcerpt>(navigator.preview()));

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    assert(!navigator.poll_preview());
    assert(std::holds_alternative<TextExcerpt>(navigator.preview()));

    // Going back regenerates the image instead of keeping a dropped placeholder.
    assert(navigator.handle_key(key(Key::Up)) == Outcome::Continue);
    assert(navigator.selected_entry()->name == "b_large.png");
    assert(std::holds_alternative<PendingPreview>(navigator.preview()));
    assert(wait_for_preview(navigator));
    assert(adopted_width(navigator) == 16);
}

void test_background_failure_reports_status() {
    MediaFixture f;
    Navigator navigator(f.root.path(), f.history, f.options);
    std::atomic<int> notified{0};
    navigator.set_preview_notify([&notified] { ++notified; });

    assert(navigator.handle_key(key(Key::End)) == Outcome::Continue);
    assert(navigator.selected_entry()->name == "d_broken.png");
    assert(wait_for_preview(navigator));
    assert(std::holds_alternative<BinaryInfo>(navigator.preview()));
    assert(!navigator.status().empty());

    for (int i = 0; i < 500 && notified.load() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    assert(notified.load() > 0);
    navigator.set_preview_notify({});
}

void test_random_key_sequences_keep_selection_valid() {
    Fixture f;
    std::filesystem::create_directory(f.root / "banana" / "deeper");
    write_file(f.root / "banana" / "deeper" / "a.txt", "a\n");

    const KeyEvent keys[] = {key(Key::Up),       key(Key::Down),   key(Key::Left),
                             key(Key::Right),    key(Key::Home),   key(Key::End),
                             key(Key::Backspace), key(Key::PageUp), key(Key::PageDown),
                             ch("/"),            ch("a"),          ch("n"),
                             ch("z"),            ch("v"),          key(Key::Escape)};

    std::mt19937 rng(1234);
    std::uniform_int_distribution<std::size_t> pick(0, std::size(keys) - 1);
    Navigator navigator(f.root.path(), f.history);
    for (int i = 0; i < 2000; ++i) {
        const KeyEvent &event = keys[pick(rng)];
        if (event.key == Key::Escape && navigator.mode() == NavigatorMode::Browsing) {
            continue;
        }
        // Stay inside the fixture tree.
        if (event.key == Key::Left && navigator.current_dir() == f.root.path()) {
            continue;
        }
        assert(navigator.handle_key(event) == Outcome::Continue);
        check_consistent(navigator);
    }
}

}

int main() {
    test_initial_state();
    test_search_transitions();
    test_selection_is_clamped_when_view_shrinks();
    test_descend_and_parent();
    test_parent_of_root_is_noop();
    test_enter_on_file_confirms_parent();
    test_enter_on_directory_descends_and_tab_confirms();
    test_cancel();
    test_empty_directory();
    test_missing_start_directory();
    test_failed_descend_keeps_listing();
    test_history_mode();
    test_background_preview_is_adopted();
    test_superseded_background_preview_is_dropped();
    test_moving_to_inline_preview_cancels_job();
    test_background_failure_reports_status();
    test_random_key_sequences_keep_selection_valid();

    std::cout << "All navigator tests passed." << std::endl;
    return 0;
}
