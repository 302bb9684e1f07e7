#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace logkv {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Install the global default logger ("logkv") used by every Store whose
// options do not name another one.
// Call once at program start before any logging.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// Create (or retrieve if already exists) a named logger, for example one per
// Store handle passed through StoreOptions::logger.
//   name   – shown in every log line as [<name>]
//   level  – initial log level
std::shared_ptr<spdlog::logger> make_store_logger(
    const std::string& name,
    spdlog::level::level_enum level = spdlog::level::info);

// Parse a log-level string from CLI args ("trace", "debug", "info", …).
// Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

} // namespace logkv
