#include "config.hpp"
#include "handoff.hpp"
#include "history_store.hpp"
#include "logging.hpp"
#include "navigator.hpp"
#include "navigator_ui.hpp"
#include "shell_init.hpp"

#include <spdlog/spdlog.h>

#include <unistd.h>

#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace {

constexpr const char *kVersion = "quickswitch 0.3.0";

void print_usage(std::ostream &out) {
    out << "Usage: quickswitch [START_DIR] [options]\n"
           "\n"
           "Options:\n"
           "  -o, --output-file FILE  Write the chosen directory to FILE instead of stdout\n"
           "      --history           Start in history mode\n"
           "  -v, -vv, -vvv           Log at info, debug or trace level\n"
           "      --log-file FILE     Log file (default: <tmp>/qs-<date>-<pid>.log)\n"
           "      --init SHELL        Print the qs/qshs wrapper for bash, zsh, fish or powershell\n"
           "  -h, --help              Show this help\n"
           "      --version           Show the version\n";
}

int fail(const std::string &message) {
    std::cerr << "quickswitch: " << message << std::endl;
    return 1;
}

int usage_error(const std::string &message) {
    std::cerr << "quickswitch: " << message << "\n\n";
    print_usage(std::cerr);
    return 2;
}

struct Arguments {
    std::optional<std::filesystem::path> start_dir;
    std::optional<std::filesystem::path> output_file;
    std::optional<std::filesystem::path> log_file;
    std::optional<std::string> init_shell;
    bool history{false};
    int verbosity{0};
};

}

int main(int argc, char **argv) {
    Arguments args;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(std::cout);
            return 0;
        } else if (arg == "--version") {
            std::cout << kVersion << std::endl;
            return 0;
        } else if (arg == "-o" || arg == "--output-file") {
            auto file = value();
            if (!file) return usage_error(arg + " needs a file argument");
            args.output_file = *file;
        } else if (arg == "--log-file") {
            auto file = value();
            if (!file) return usage_error(arg + " needs a file argument");
            args.log_file = *file;
        } else if (arg == "--init") {
            auto shell = value();
            if (!shell) return usage_error(arg + " needs a shell name");
            args.init_shell = *shell;
        } else if (arg == "--history") {
            args.history = true;
        } else if (arg == "-v" || arg == "-vv" || arg == "-vvv") {
            args.verbosity += static_cast<int>(arg.size()) - 1;
        } else if (arg == "--verbose") {
            ++args.verbosity;
        } else if (!arg.empty() && arg[0] == '-') {
            return usage_error("unknown option " + arg);
        } else if (!args.start_dir) {
            args.start_dir = arg;
        } else {
            return usage_error("unexpected argument " + arg);
        }
    }

    if (args.init_shell) {
        std::string binary = argc > 0 ? argv[0] : "quickswitch";
        std::error_code ec;
        const auto absolute = std::filesystem::canonical("/proc/self/exe", ec);
        if (!ec) {
            binary = absolute.string();
        }
        auto script = quickswitch::shell_init_script(*args.init_shell, binary);
        if (!script) {
            return usage_error("unsupported shell " + *args.init_shell);
        }
        std::cout << *script;
        return 0;
    }

    if (!::isatty(STDIN_FILENO) || !::isatty(STDOUT_FILENO)) {
        return fail("stdin and stdout must be a terminal");
    }

    quickswitch::Error error;
    if (!quickswitch::init_logging(args.verbosity, args.log_file, error)) {
        std::cerr << "quickswitch: " << error.message << std::endl;
    }

    try {
        quickswitch::Config config;
        config.load();

        quickswitch::HistoryStore history(quickswitch::Config::history_path(),
                                          config.history_max_entries());
        if (!history.load(error)) {
            spdlog::warn("Starting with empty history: {}", error.message);
        }

        quickswitch::NavigatorOptions options;
        options.list.show_hidden = config.show_hidden();
        options.preview = config.preview_options();
        options.history_sort = config.history_sort();
        options.initial_mode = args.history ? quickswitch::NavigatorMode::History
                                            : quickswitch::NavigatorMode::Browsing;
        options.background_previews = true;

        const std::filesystem::path start =
            args.start_dir ? *args.start_dir : std::filesystem::current_path();
        quickswitch::Navigator navigator(start, history, options);

        const quickswitch::Outcome outcome = quickswitch::run_navigator_ui(navigator);
        std::optional<std::filesystem::path> target;
        if (outcome == quickswitch::Outcome::Confirmed) {
            target = navigator.handoff_path();
        }

        if (args.output_file) {
            if (!quickswitch::write_handoff(*args.output_file, target, error)) {
                spdlog::error("{}", error.message);
                return fail(error.message);
            }
        } else if (target) {
            std::cout << target->string() << std::endl;
        }
        spdlog::shutdown();
        return 0;
    } catch (const std::exception &ex) {
        spdlog::error("Fatal error: {}", ex.what());
        return fail(ex.what());
    }
}
