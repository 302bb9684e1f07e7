// logkv-cli: inspect and maintain a logkv data file from the shell.
//
//   logkv-cli --path FILE [options] <command> [args...]
//
// Exit status: 0 on success, 1 on error, 2 when `get` finds no such key.

#include "common/cli_config.hpp"
#include "common/logger.hpp"
#include "storage/errors.hpp"
#include "storage/store.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <stdexcept>
#include <string>
#include <system_error>

namespace {

constexpr int kExitOk       = 0;
constexpr int kExitError    = 1;
constexpr int kExitNotFound = 2;

int report(const char* what, const std::error_code& ec) {
    spdlog::error("logkv-cli: {} failed: {}", what, ec.message());
    return kExitError;
}

// ── Commands ──────────────────────────────────────────────────────────────────

int cmd_get(const logkv::Store& store, const std::string& key) {
    std::string value;
    auto ec = store.read(key, value);
    if (ec == logkv::StoreErrc::key_not_found) {
        fprintf(stderr, "(not found)\n");
        return kExitNotFound;
    }
    if (ec) return report("get", ec);

    fwrite(value.data(), 1, value.size(), stdout);
    fputc('\n', stdout);
    return kExitOk;
}

int cmd_stats(const logkv::Store& store) {
    const auto s = store.stats();
    fprintf(stdout,
        "path:             %s\n"
        "keys:             %zu\n"
        "value bytes:      %llu\n"
        "file bytes:       %llu\n"
        "garbage bytes:    %llu\n"
        "compactions:      %llu\n"
        "recovered bytes:  %llu\n",
        store.path().c_str(), s.count,
        static_cast<unsigned long long>(s.total_value_size),
        static_cast<unsigned long long>(s.file_size),
        static_cast<unsigned long long>(s.garbage_bytes),
        static_cast<unsigned long long>(s.compactions),
        static_cast<unsigned long long>(s.recovered_bytes));
    return kExitOk;
}

int cmd_compact(logkv::Store& store) {
    const auto before = store.stats().file_size;
    if (auto ec = store.compact()) return report("compact", ec);
    const auto after = store.stats().file_size;
    fprintf(stdout, "compacted: %llu -> %llu bytes\n",
            static_cast<unsigned long long>(before),
            static_cast<unsigned long long>(after));
    return kExitOk;
}

// Opening already replays and checksums every frame; this also reads every
// live value back through the index.
int cmd_verify(const logkv::Store& store) {
    std::size_t ok = 0;
    std::size_t bad = 0;
    std::string value;
    for (const auto& key : store.keys()) {
        if (auto ec = store.read(key, value)) {
            spdlog::error("logkv-cli: key of {} bytes unreadable: {}", key.size(), ec.message());
            ++bad;
        } else {
            ++ok;
        }
    }

    const auto recovered = store.stats().recovered_bytes;
    fprintf(stdout, "records ok: %zu, unreadable: %zu, tail bytes dropped on open: %llu\n",
            ok, bad, static_cast<unsigned long long>(recovered));
    return bad == 0 ? kExitOk : kExitError;
}

int run(logkv::Store& store, const logkv::CliConfig& cfg) {
    const auto& cmd  = cfg.command;
    const auto& args = cfg.args;

    if (cmd == "get") {
        return cmd_get(store, args[0]);
    }
    if (cmd == "set") {
        if (auto ec = store.set(args[0], args[1])) return report("set", ec);
        return kExitOk;
    }
    if (cmd == "rm") {
        if (auto ec = store.remove_many(args)) return report("rm", ec);
        return kExitOk;
    }
    if (cmd == "clear") {
        if (auto ec = store.remove_all()) return report("clear", ec);
        return kExitOk;
    }
    if (cmd == "keys") {
        for (const auto& key : store.keys()) {
            fprintf(stdout, "%s\n", key.c_str());
        }
        return kExitOk;
    }
    if (cmd == "values") {
        for (const auto& value : store.all_values()) {
            fwrite(value.data(), 1, value.size(), stdout);
            fputc('\n', stdout);
        }
        return kExitOk;
    }
    if (cmd == "count") {
        fprintf(stdout, "%zu\n", store.count());
        return kExitOk;
    }
    if (cmd == "size") {
        fprintf(stdout, "%llu\n", static_cast<unsigned long long>(store.total_size()));
        return kExitOk;
    }
    if (cmd == "stats")   return cmd_stats(store);
    if (cmd == "compact") return cmd_compact(store);
    if (cmd == "verify")  return cmd_verify(store);

    // parse_cli_config() rejects unknown commands.
    throw std::logic_error("unhandled command " + cmd);
}

} // anonymous namespace

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    logkv::CliConfig cfg;
    try {
        cfg = logkv::parse_cli_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return kExitError;
    }

    logkv::init_default_logger(logkv::parse_log_level(cfg.log_level));
    spdlog::debug("logkv-cli: {} on {}", cfg.command, cfg.path);

    try {
        logkv::Store store(cfg.path, logkv::to_store_options(cfg));
        if (auto ec = store.open()) {
            spdlog::error("logkv-cli: cannot open {}: {}", cfg.path, ec.message());
            return kExitError;
        }

        const int status = run(store, cfg);

        if (auto ec = store.close()) return report("close", ec);
        return status;

    } catch (const std::exception& ex) {
        spdlog::error("logkv-cli: exception: {}", ex.what());
        return kExitError;
    }
}
