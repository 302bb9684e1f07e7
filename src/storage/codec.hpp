#pragma once

#include "storage/errors.hpp"
#include "storage/store.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace logkv {

// ── ValueCodec ────────────────────────────────────────────────────────────────
// Caller-supplied conversion between a typed value and the opaque bytes the
// Store keeps.  Returning std::nullopt signals a conversion failure.

template <typename T>
class ValueCodec {
public:
    virtual ~ValueCodec() = default;

    [[nodiscard]] virtual std::optional<std::string> encode(const T& value) const = 0;
    [[nodiscard]] virtual std::optional<T> decode(std::string_view bytes) const = 0;
};

// Identity codec.
class StringCodec final : public ValueCodec<std::string> {
public:
    [[nodiscard]] std::optional<std::string> encode(const std::string& value) const override {
        return value;
    }

    [[nodiscard]] std::optional<std::string> decode(std::string_view bytes) const override {
        return std::string(bytes);
    }
};

// ── Typed helpers ─────────────────────────────────────────────────────────────

// Encodes and stores `value`.  An encode failure is StoreErrc::invalid_value
// and writes nothing.
template <typename T>
[[nodiscard]] std::error_code set_value(Store& store,
                                        std::string_view key,
                                        const T& value,
                                        const ValueCodec<T>& codec) {
    auto bytes = codec.encode(value);
    if (!bytes) {
        return make_error_code(StoreErrc::invalid_value);
    }
    return store.set(key, *bytes);
}

// Absent, unreadable and undecodable values all yield std::nullopt.
template <typename T>
[[nodiscard]] std::optional<T> get_value(const Store& store,
                                         std::string_view key,
                                         const ValueCodec<T>& codec) {
    auto bytes = store.get(key);
    if (!bytes) {
        return std::nullopt;
    }
    return codec.decode(*bytes);
}

// Every live value, most recent first, or std::nullopt if any one of them
// fails to decode.
template <typename T>
[[nodiscard]] std::optional<std::vector<T>> all_values_as(const Store& store,
                                                          const ValueCodec<T>& codec) {
    std::vector<T> result;
    for (const auto& bytes : store.all_values()) {
        auto value = codec.decode(bytes);
        if (!value) {
            return std::nullopt;
        }
        result.push_back(std::move(*value));
    }
    return result;
}

} // namespace logkv
