#include "logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <unistd.h>

#include <cstdlib>
#include <ctime>
#include <memory>
#include <string>

namespace quickswitch {
namespace {

spdlog::level::level_enum level_for(int verbosity) {
    if (verbosity >= 3) return spdlog::level::trace;
    if (verbosity == 2) return spdlog::level::debug;
    if (verbosity == 1) return spdlog::level::info;

    const char *env = std::getenv("QUICKSWITCH_LOG");
    if (env == nullptr || *env == '\0') {
        return spdlog::level::off;
    }
    return spdlog::level::from_str(env);
}

}

std::filesystem::path default_log_path() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    char date[16];
    std::strftime(date, sizeof(date), "%Y-%m-%d", &local);

    std::error_code ec;
    std::filesystem::path dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        dir = "/tmp";
    }
    return dir / ("qs-" + std::string(date) + "-" + std::to_string(::getpid()) + ".log");
}

bool init_logging(int verbosity, const std::optional<std::filesystem::path> &log_file,
                  Error &error) {
    const auto level = level_for(verbosity);
    if (level == spdlog::level::off) {
        spdlog::set_level(spdlog::level::off);
        return true;
    }

    const std::filesystem::path path = log_file ? *log_file : default_log_path();
    try {
        auto logger = spdlog::basic_logger_mt("quickswitch", path.string());
        spdlog::set_default_logger(logger);
    } catch (const spdlog::spdlog_ex &ex) {
        spdlog::set_level(spdlog::level::off);
        error = Error{ErrorKind::IoFailure, "Cannot open log file " + path.string() + ": " + ex.what()};
        return false;
    }

    spdlog::set_pattern("[%H:%M:%S.%e] [%l] %v");
    spdlog::set_level(level);
    spdlog::flush_on(spdlog::level::warn);
    spdlog::info("quickswitch logging at {} to {}", spdlog::level::to_string_view(level), path.string());
    return true;
}

}
