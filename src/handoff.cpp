#include "handoff.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <fstream>
#include <system_error>

namespace quickswitch {

bool write_handoff(const std::filesystem::path &output_file,
                   const std::optional<std::filesystem::path> &target, Error &error) {
    std::ofstream file(output_file, std::ios::binary | std::ios::trunc);
    if (!file) {
        error = make_error(std::error_code(errno, std::generic_category()),
                           "Cannot open output file " + output_file.string());
        return false;
    }

    if (target) {
        file << target->string();
    }
    file.flush();
    if (!file) {
        error = Error{ErrorKind::IoFailure, "Failed to write output file " + output_file.string()};
        return false;
    }

    spdlog::info("Handoff to {}: {}", output_file.string(), target ? target->string() : "<cancelled>");
    return true;
}

}
