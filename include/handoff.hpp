#pragma once

#include "errors.hpp"

#include <filesystem>
#include <optional>

namespace quickswitch {

// Writes the confirmed directory as the whole content of `output_file`, without a
// trailing newline. A cancelled session (no target) truncates the file to empty.
bool write_handoff(const std::filesystem::path &output_file,
                   const std::optional<std::filesystem::path> &target, Error &error);

}
