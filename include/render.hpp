#pragma once

#include "navigator.hpp"

#include <ftxui/dom/elements.hpp>

namespace quickswitch {

// Builds the full-screen frame for the navigator's current state. Pure: reads the
// navigator and touches nothing else.
ftxui::Element render_navigator(const Navigator &navigator);

ftxui::Element render_preview(const PreviewPayload &payload, std::size_t scroll);

}
