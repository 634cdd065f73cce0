#include "config.hpp"
#include "platform/daemonizer.hpp"
#include "platform/linux/linux_event_loop.hpp"

#include <expected>
#include <print>
#include <string>

namespace {

struct Options {
    bool foreground = false;
    bool verbose = false;
    bool help = false;
    std::string config_path;
    std::string log_path;
};

void usage() {
    std::println("Usage: voxkeyd [options]");
    std::println("Options:");
    std::println("  -f, --foreground    Run in foreground (don't daemonize)");
    std::println("  -v, --verbose       Enable verbose logging");
    std::println("  -c, --config PATH   Config file path");
    std::println("  -l, --log PATH      Append daemon stderr to PATH instead of discarding it");
    std::println("  -h, --help          Show this help");
}

std::expected<Options, std::string> parse_args(int argc, char* argv[]) {
    Options opts;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto value = [&]() -> const char* { return i + 1 < argc ? argv[++i] : nullptr; };

        if (arg == "--foreground" || arg == "-f") {
            opts.foreground = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--config" || arg == "-c" || arg == "--log" || arg == "-l") {
            const char* v = value();
            if (!v) return std::unexpected("Missing value for " + arg);
            (arg == "--config" || arg == "-c" ? opts.config_path : opts.log_path) = v;
        } else {
            return std::unexpected("Unknown option: " + arg);
        }
    }
    return opts;
}

} // namespace

int main(int argc, char* argv[]) {
    auto opts = parse_args(argc, argv);
    if (!opts) {
        std::println(stderr, "{}", opts.error());
        usage();
        return 1;
    }
    if (opts->help) {
        usage();
        return 0;
    }

    Config config = opts->config_path.empty() ? Config::load_default() : Config::load(opts->config_path);

    if (!opts->foreground) {
        platform::daemonize(opts->log_path);
    }

    if (opts->verbose) {
        std::println(stderr, "[voxkey] Starting (backend: {}, mode: {}, output: {})",
                     config.backend.url, mode_name(config.session.mode),
                     routing_name(config.session.routing));
    }

    LinuxEventLoop loop(std::move(config), opts->verbose);
    if (!loop.init()) {
        std::println(stderr, "Failed to initialize event loop");
        return 1;
    }

    loop.run();
    return 0;
}
