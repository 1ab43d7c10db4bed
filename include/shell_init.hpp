#pragma once

#include <optional>
#include <string>

namespace quickswitch {

// Shell snippet defining `qs` and `qshs` for the named shell (bash, zsh, fish or
// powershell). `binary` is the command the wrappers invoke.
std::optional<std::string> shell_init_script(const std::string &shell, const std::string &binary);

}
