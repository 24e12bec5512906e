// ============================================================================
// cotree/core/result.hpp - Result Type for Checked Operations
// ============================================================================
//
// Result<void, E> is either success or an error value (E). The Try*
// operations of Node return it so callers can reject a bad reparent without
// the tree being touched.
//
// USAGE:
// ------
//   Result<void, Error> Reattach(Node& node, Node* parent) {
//       if (parent == &node) return Err(Errc::InvalidArgument);
//       node.SetParent(parent);
//       return Ok();
//   }
//
//   if (auto result = Reattach(node, parent); result.IsErr()) {
//       std::cerr << result.Error().message() << std::endl;
//   }
//
// ============================================================================

#pragma once

#include <optional>
#include <type_traits>
#include <utility>

namespace cotree {

// ============================================================================
// Ok and Err Tag Types
// ============================================================================

struct OkTag {};

template <typename E>
struct ErrTag {
    E error;

    template <typename U>
    explicit ErrTag(U&& e) : error(std::forward<U>(e)) {}
};

inline OkTag Ok() {
    return OkTag{};
}

template <typename E>
ErrTag<std::decay_t<E>> Err(E&& error) {
    return ErrTag<std::decay_t<E>>(std::forward<E>(error));
}

// ============================================================================
// Result
// ============================================================================

// Only the value-less form is provided
template <typename T, typename E>
class Result;

template <typename E>
class Result<void, E> {
   public:
    Result(OkTag) : error_(std::nullopt) {}

    // The error tag may carry a type convertible to E (Errc -> std::error_code)
    template <typename U>
    Result(ErrTag<U>&& err) : error_(E(std::move(err.error))) {}

    bool IsOk() const noexcept { return !error_.has_value(); }
    bool IsErr() const noexcept { return error_.has_value(); }

    explicit operator bool() const noexcept { return IsOk(); }

    // Undefined behavior if IsOk()
    E& Error() & { return *error_; }
    const E& Error() const& { return *error_; }
    E&& Error() && { return std::move(*error_); }

   private:
    std::optional<E> error_;
};

}  // namespace cotree
