#include "common/cli_config.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <boost/program_options.hpp>
#include <fmt/format.h>

namespace po = boost::program_options;

namespace logkv {

namespace {

// ── Helpers ───────────────────────────────────────────────────────────────────

struct CommandArity {
    std::string_view name;
    std::size_t      min_args;
    std::size_t      max_args;
};

constexpr std::size_t kUnbounded = static_cast<std::size_t>(-1);

constexpr CommandArity kCommands[] = {
    {"get",     1, 1},
    {"set",     2, 2},
    {"rm",      1, kUnbounded},
    {"clear",   0, 0},
    {"keys",    0, 0},
    {"values",  0, 0},
    {"count",   0, 0},
    {"size",    0, 0},
    {"stats",   0, 0},
    {"compact", 0, 0},
    {"verify",  0, 0},
};

void validate_command(const CliConfig& cfg) {
    for (const auto& cmd : kCommands) {
        if (cmd.name != cfg.command) {
            continue;
        }
        const std::size_t n = cfg.args.size();
        if (n < cmd.min_args || n > cmd.max_args) {
            if (cmd.min_args == cmd.max_args) {
                throw std::runtime_error(
                    fmt::format("'{}' takes {} argument(s), got {}", cfg.command, cmd.min_args, n));
            }
            throw std::runtime_error(
                fmt::format("'{}' takes at least {} argument(s), got {}", cfg.command, cmd.min_args, n));
        }
        return;
    }
    throw std::runtime_error(fmt::format("Unknown command '{}'", cfg.command));
}

// Validate the fully populated CliConfig.
void validate(const CliConfig& cfg) {
    if (cfg.path.empty()) {
        throw std::runtime_error("--path must not be empty");
    }
    if (cfg.max_key_size == 0) {
        throw std::runtime_error("--max-key-size must be > 0");
    }
    validate_command(cfg);
}

} // anonymous namespace

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("path,p",
            po::value<std::string>()->required(),
            "Data file to open (created if missing)")
        ("log-level,l",
            po::value<std::string>()->default_value("warn"),
            "Log level: trace|debug|info|warn|error|critical|off")
        ("no-lock",
            "Do not take the advisory file lock")
        ("no-sync",
            "Do not fdatasync each write")
        ("compact-on-open",
            "Compact on open when the garbage threshold is reached")
        ("max-key-size",
            po::value<std::size_t>()->default_value(64 * 1024),
            "Longest accepted key, in bytes")
        ("command",
            po::value<std::string>()->required(),
            "get|set|rm|clear|keys|values|count|size|stats|compact|verify")
        ("args",
            po::value<std::vector<std::string>>()->default_value({}, ""),
            "Command arguments");
}

// ── parse_cli_config ──────────────────────────────────────────────────────────

CliConfig parse_cli_config(int argc, char* argv[]) {
    po::options_description desc("logkv-cli options");
    add_options(desc);

    po::positional_options_description positional;
    positional.add("command", 1);
    positional.add("args", -1);

    po::variables_map vm;
    try {
        po::store(
            po::command_line_parser(argc, argv)
                .options(desc)
                .positional(positional)
                .run(),
            vm);

        // Handle --help before notify() so missing required options don't error.
        if (vm.count("help")) {
            std::ostringstream oss;
            oss << "Usage: logkv-cli --path FILE [options] <command> [args...]\n" << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    CliConfig cfg;
    cfg.path            = vm["path"].as<std::string>();
    cfg.log_level       = vm["log-level"].as<std::string>();
    cfg.lock_file       = vm.count("no-lock") == 0;
    cfg.sync_writes     = vm.count("no-sync") == 0;
    cfg.compact_on_open = vm.count("compact-on-open") > 0;
    cfg.max_key_size    = vm["max-key-size"].as<std::size_t>();
    cfg.command         = vm["command"].as<std::string>();
    cfg.args            = vm["args"].as<std::vector<std::string>>();

    validate(cfg);
    return cfg;
}

// ── to_store_options ──────────────────────────────────────────────────────────

StoreOptions to_store_options(const CliConfig& cfg) {
    StoreOptions options;
    options.max_key_size        = cfg.max_key_size;
    options.lock_file           = cfg.lock_file;
    options.sync_writes         = cfg.sync_writes;
    options.compact_on_open     = cfg.compact_on_open;
    options.reset_if_unreadable = false;
    // Single-threaded tool.
    options.thread_safe         = false;
    return options;
}

} // namespace logkv
