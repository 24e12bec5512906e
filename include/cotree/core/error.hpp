// ============================================================================
// cotree/core/error.hpp - Error Codes for cotree
// ============================================================================
//
// Hierarchy operations that can be misused in a recoverable way come in a
// Try* flavour returning Result<T, Error>. Error is a std::error_code in the
// cotree category.
//
// USAGE:
// ------
//   auto result = child.TrySetParent(&grandchild);
//   if (result.IsErr() && result.Error() == Errc::WouldCreateCycle) {
//       // grandchild lives below child, leave the tree as it is
//   }
//
// ============================================================================

#pragma once

#include <system_error>

namespace cotree {

enum class Errc {
    InvalidArgument = 1,
    WouldCreateCycle,
};

const std::error_category& CotreeCategory() noexcept;

std::error_code make_error_code(Errc e) noexcept;

using Error = std::error_code;

}  // namespace cotree

namespace std {
template <>
struct is_error_code_enum<cotree::Errc> : true_type {};
}  // namespace std
