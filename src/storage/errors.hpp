#pragma once

#include <system_error>
#include <type_traits>

namespace logkv {

// ── StoreErrc ────────────────────────────────────────────────────────────────
//
// Engine-level failure kinds.  OS failures are not listed here: they travel as
// errno values in std::system_category(), the same way the log code reports
// them.

enum class StoreErrc {
    invalid_key = 1,   // empty or longer than StoreOptions::max_key_size
    invalid_value,     // longer than StoreOptions::max_value_size
    corruption,        // frame checksum / framing mismatch, or index mismatch
    bad_header,        // data file does not start with a valid header
    not_a_file,        // path exists but is not a regular file
    locked,            // another handle already holds the file lock
    key_not_found,
};

[[nodiscard]] const std::error_category& store_category() noexcept;

[[nodiscard]] std::error_code make_error_code(StoreErrc e) noexcept;

} // namespace logkv

template <>
struct std::is_error_code_enum<logkv::StoreErrc> : std::true_type {};
