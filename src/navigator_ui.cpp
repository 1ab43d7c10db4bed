#include "navigator_ui.hpp"
#include "render.hpp"

#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>

#include <spdlog/spdlog.h>

namespace quickswitch {

std::optional<KeyEvent> translate_event(const ftxui::Event &event) {
    using ftxui::Event;

    if (event == Event::ArrowUp) return KeyEvent::of(Key::Up);
    if (event == Event::ArrowDown) return KeyEvent::of(Key::Down);
    if (event == Event::ArrowLeft) return KeyEvent::of(Key::Left);
    if (event == Event::ArrowRight) return KeyEvent::of(Key::Right);
    if (event == Event::Return) return KeyEvent::of(Key::Enter);
    if (event == Event::Escape) return KeyEvent::of(Key::Escape);
    if (event == Event::Backspace) return KeyEvent::of(Key::Backspace);
    if (event == Event::Tab) return KeyEvent::of(Key::Tab);
    if (event == Event::PageUp) return KeyEvent::of(Key::PageUp);
    if (event == Event::PageDown) return KeyEvent::of(Key::PageDown);
    if (event == Event::Home) return KeyEvent::of(Key::Home);
    if (event == Event::End) return KeyEvent::of(Key::End);

    if (event.is_character()) {
        const std::string &text = event.character();
        if (text.empty() || static_cast<unsigned char>(text[0]) < 0x20 || text == "\x7f") {
            return std::nullopt;
        }
        return KeyEvent::character(text);
    }
    return std::nullopt;
}

Outcome run_navigator_ui(Navigator &navigator) {
    using namespace ftxui;

    Outcome outcome = Outcome::Continue;
    auto screen = ScreenInteractive::Fullscreen();

    navigator.set_preview_notify([&screen] { screen.PostEvent(Event::Custom); });

    auto component = Renderer([&] { return render_navigator(navigator); });

    component = CatchEvent(component, [&](Event event) {
        if (event == Event::Custom) {
            navigator.poll_preview();
            return true;
        }

        auto key = translate_event(event);
        if (!key) {
            return false;
        }

        outcome = navigator.handle_key(*key);
        if (outcome != Outcome::Continue) {
            screen.Exit();
        }
        return true;
    });

    screen.Loop(component);

    navigator.set_preview_notify({});
    navigator.cancel_pending_preview();
    spdlog::debug("Navigator loop finished");
    return outcome == Outcome::Continue ? Outcome::Cancelled : outcome;
}

}
