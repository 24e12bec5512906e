// ============================================================================
// cotree/core/error.cpp - Error Category Implementation
// ============================================================================

#include "cotree/core/error.hpp"

#include <string>

namespace cotree {

namespace {

class CotreeCategoryImpl : public std::error_category {
   public:
    const char* name() const noexcept override { return "cotree"; }

    std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
            case Errc::InvalidArgument:
                return "Invalid argument";
            case Errc::WouldCreateCycle:
                return "Operation would create a cycle";
            default:
                return "Unknown cotree error";
        }
    }
};

}  // namespace

const std::error_category& CotreeCategory() noexcept {
    static const CotreeCategoryImpl instance;
    return instance;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), CotreeCategory()};
}

}  // namespace cotree
