// ============================================================================
// cotree/core/children.hpp - Child Collection with Transient Bookkeeping
// ============================================================================
//
// Children<T> is an IntrusiveList that also counts how many of its members
// are transient. A transient member is background work that its parent does
// not wait for, so the collection is "finished" as soon as every remaining
// member is transient:
//
//     IsFinished()  <=>  Size() == TransientCount()
//
// The member's transient flag must not change while it is linked.
//
// The plain IntrusiveList Insert/Remove are hidden (private base), so the
// counter cannot be bypassed through this type.
//
// ============================================================================

#pragma once

#include "cotree/core/check.hpp"
#include "cotree/core/intrusive_list.hpp"

#include <concepts>
#include <cstddef>

namespace cotree {

template <typename T>
concept TransientAware = requires(const T& item) {
    { item.IsTransient() } -> std::convertible_to<bool>;
};

// Checked at instantiation: Node names Children<Node> while still incomplete
template <typename T>
class Children : private IntrusiveList<T> {
    static_assert(TransientAware<T>, "Children members must expose IsTransient()");

    using Base = IntrusiveList<T>;

   public:
    using iterator = typename Base::Iterator;
    using const_iterator = typename Base::ConstIterator;

    Children() = default;

    Children& Insert(T* item) {
        Base::Insert(item);
        if (item->IsTransient()) {
            ++transient_count_;
        }
        return *this;
    }

    Children& Remove(T* item) {
        Base::Remove(item);
        if (item->IsTransient()) {
            COTREE_CHECK(transient_count_ > 0, "transient count underflow");
            --transient_count_;
        }
        return *this;
    }

    using Base::begin;
    using Base::Each;
    using Base::Empty;
    using Base::end;
    using Base::First;
    using Base::Includes;
    using Base::IsConsistent;
    using Base::Last;
    using Base::Size;

    size_t TransientCount() const noexcept { return transient_count_; }
    bool HasTransients() const noexcept { return transient_count_ > 0; }

    // No member left that the owner has to wait for
    bool IsFinished() const noexcept { return Base::Size() == transient_count_; }

   private:
    size_t transient_count_ = 0;
};

}  // namespace cotree
