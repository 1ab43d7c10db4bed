#pragma once

#include "navigator.hpp"

#include <ftxui/component/event.hpp>

#include <optional>

namespace quickswitch {

// Maps a terminal event onto the navigator's key vocabulary. Mouse input, cursor
// reports and other non-key events map to nothing.
std::optional<KeyEvent> translate_event(const ftxui::Event &event);

// Runs the full-screen loop until the navigator confirms or cancels.
Outcome run_navigator_ui(Navigator &navigator);

}
