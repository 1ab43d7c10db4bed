#pragma once

#include "errors.hpp"

#include <filesystem>
#include <optional>

namespace quickswitch {

// Installs the default spdlog logger. Verbosity 0 leaves logging off unless
// QUICKSWITCH_LOG names a level; 1 is info, 2 debug, 3 and above trace.
bool init_logging(int verbosity, const std::optional<std::filesystem::path> &log_file,
                  Error &error);

std::filesystem::path default_log_path();

}
