#pragma once

#include "storage/store_options.hpp"

#include <cstddef>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

namespace logkv {

// ── CliConfig ─────────────────────────────────────────────────────────────────
// Configuration for one logkv-cli invocation.
// Populated by parse_cli_config() from CLI arguments.

struct CliConfig {
    std::string path;                 // Data file to open
    std::string log_level;            // spdlog level string
    bool        lock_file;            // false with --no-lock
    bool        sync_writes;          // false with --no-sync
    bool        compact_on_open;      // true with --compact-on-open
    std::size_t max_key_size;         // Longest accepted key, in bytes

    std::string              command; // get | set | rm | clear | keys | values | count | size | stats | compact | verify
    std::vector<std::string> args;    // Positional arguments after the command
};

// ── parse_cli_config ──────────────────────────────────────────────────────────
// Parse CLI arguments into a CliConfig.
//
// On success: returns a fully validated CliConfig.
// On error  : throws std::runtime_error with a human-readable message.
//             --help also throws, carrying the usage text.
//
// Validates:
//   - --path is present and not empty
//   - the command is known and has the right number of arguments
//   - --max-key-size > 0

[[nodiscard]] CliConfig parse_cli_config(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with logkv-cli
// options.  Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

// Store tuning implied by the CLI flags.  The CLI never resets an unreadable
// file: it reports it.
[[nodiscard]] StoreOptions to_store_options(const CliConfig& cfg);

} // namespace logkv
