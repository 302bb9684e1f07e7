#include "storage/errors.hpp"

#include <string>

namespace logkv {

namespace {

class StoreCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "logkv"; }

    std::string message(int ev) const override {
        switch (static_cast<StoreErrc>(ev)) {
            case StoreErrc::invalid_key:   return "invalid key";
            case StoreErrc::invalid_value: return "invalid value";
            case StoreErrc::corruption:    return "data file corruption";
            case StoreErrc::bad_header:    return "bad data file header";
            case StoreErrc::not_a_file:    return "path is not a regular file";
            case StoreErrc::locked:        return "data file is locked by another handle";
            case StoreErrc::key_not_found: return "key not found";
        }
        return "unknown logkv error";
    }
};

} // anonymous namespace

const std::error_category& store_category() noexcept {
    static const StoreCategory category;
    return category;
}

std::error_code make_error_code(StoreErrc e) noexcept {
    return {static_cast<int>(e), store_category()};
}

} // namespace logkv
