// ============================================================================
// cotree/core/defer.hpp - Deferred Cleanup
// ============================================================================
//
// Defer runs a callable when it goes out of scope, whether the scope is left
// by a normal return or by an exception. Node::Annotate(value, body) uses it
// to put the previous annotation back after the body.
//
// USAGE:
// ------
//   auto previous = std::exchange(field, override_value);
//   Defer restore([&] { field = std::move(previous); });
//   RunBody();  // field is restored here, even if RunBody() throws
//
// ============================================================================

#pragma once

#include <type_traits>
#include <utility>

namespace cotree {

// ============================================================================
// Defer - RAII Deferred Execution
// ============================================================================
template <typename F>
class Defer {
   public:
    explicit Defer(F func) noexcept(std::is_nothrow_move_constructible_v<F>) : func_(std::move(func)) {}

    ~Defer() { func_(); }

    // Runs exactly once, in the scope that created it
    Defer(const Defer&) = delete;
    Defer& operator=(const Defer&) = delete;
    Defer(Defer&&) = delete;
    Defer& operator=(Defer&&) = delete;

   private:
    F func_;
};

template <typename F>
Defer(F) -> Defer<F>;

}  // namespace cotree
