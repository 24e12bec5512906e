// ============================================================================
// cotree/core/intrusive_list.hpp - Mutation-Tolerant Intrusive List
// ============================================================================
//
// IntrusiveList<T> is a doubly linked list whose link pointers live on the
// members themselves. A member type derives from ListHook; the list never
// allocates and never owns its members.
//
// LAYOUT:
// -------
// The list header is itself a ListHook (the anchor). anchor.next is the first
// member and anchor.prev is the last. Member links are NOT circular: the
// first member's prev and the last member's next are null.
//
//     anchor.next --> [A] <--> [B] <--> [C] <-- anchor.prev
//
// ITERATION:
// ----------
// Traversal keeps a cursor (initially the anchor) and always yields
// cursor->next. After the body ran, the cursor only advances to the yielded
// member if that member is still cursor->next. So the body may remove the
// yielded member, or any member after it, and iteration continues with the
// right successor, with nothing skipped and nothing visited twice.
//
// What the body must NOT do is remove the cursor itself, i.e. a member that
// was already visited before the current one.
//
// USAGE:
// ------
//   struct Job : ListHook { int id; };
//
//   IntrusiveList<Job> jobs;
//   jobs.Insert(&a).Insert(&b).Insert(&c);
//
//   for (Job& job : jobs) {
//       if (job.id == 2) jobs.Remove(&job);  // fine
//   }
//
// ============================================================================

#pragma once

#include "cotree/core/check.hpp"

#include <cstddef>
#include <iterator>
#include <type_traits>

namespace cotree {

template <typename T>
class IntrusiveList;

// ============================================================================
// ListHook - Link slots embedded in every list member
// ============================================================================
class ListHook {
   public:
    ListHook() = default;
    ~ListHook() = default;

    // Links are identity, never copied
    ListHook(const ListHook&) = delete;
    ListHook& operator=(const ListHook&) = delete;
    ListHook(ListHook&&) = delete;
    ListHook& operator=(ListHook&&) = delete;

    // True while this object is a member of some list
    bool IsLinked() const noexcept { return owner_ != nullptr; }

   private:
    template <typename>
    friend class IntrusiveList;

    ListHook* prev_ = nullptr;  // toward the first member
    ListHook* next_ = nullptr;  // toward the insertion end
    const void* owner_ = nullptr;
};

// ============================================================================
// IntrusiveList<T>
// ============================================================================
template <typename T>
class IntrusiveList {
    static_assert(std::is_base_of_v<ListHook, T>, "IntrusiveList members must derive from ListHook");

   public:
    // ========================================================================
    // BasicIterator - cursor-based, re-derives the successor at every step
    // ========================================================================
    template <typename V>
    class BasicIterator {
        using HookPtr = std::conditional_t<std::is_const_v<V>, const ListHook*, ListHook*>;

       public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::remove_const_t<V>;
        using difference_type = std::ptrdiff_t;
        using pointer = V*;
        using reference = V&;

        BasicIterator() noexcept = default;

        reference operator*() const noexcept { return *static_cast<pointer>(current_); }
        pointer operator->() const noexcept { return static_cast<pointer>(current_); }

        BasicIterator& operator++() noexcept {
            // If current_ removed itself (or was replaced), the cursor stays
            // where it is and the new successor is picked up from there.
            if (NextOf(cursor_) == current_) {
                cursor_ = current_;
            }
            current_ = NextOf(cursor_);
            return *this;
        }

        bool operator==(const BasicIterator& other) const noexcept { return current_ == other.current_; }

       private:
        friend class IntrusiveList;

        explicit BasicIterator(HookPtr anchor) noexcept : cursor_(anchor), current_(NextOf(anchor)) {}

        HookPtr cursor_ = nullptr;
        HookPtr current_ = nullptr;
    };

    using Iterator = BasicIterator<T>;
    using ConstIterator = BasicIterator<const T>;
    using iterator = Iterator;
    using const_iterator = ConstIterator;

    IntrusiveList() = default;

    // The anchor's address is what members point back to
    IntrusiveList(const IntrusiveList&) = delete;
    IntrusiveList& operator=(const IntrusiveList&) = delete;
    IntrusiveList(IntrusiveList&&) = delete;
    IntrusiveList& operator=(IntrusiveList&&) = delete;

    // Members still linked at destruction are released, not destroyed
    ~IntrusiveList() {
        ListHook* hook = anchor_.next_;
        while (hook) {
            ListHook* next = hook->next_;
            hook->prev_ = nullptr;
            hook->next_ = nullptr;
            hook->owner_ = nullptr;
            hook = next;
        }
    }

    // ========================================================================
    // Mutation
    // ========================================================================

    // Append item as the new last member. O(1).
    IntrusiveList& Insert(T* item) {
        ListHook* hook = item;
        COTREE_CHECK(!hook->IsLinked(), "item is already a member of a list");

        if (!anchor_.next_) {
            anchor_.next_ = hook;
            anchor_.prev_ = hook;
            hook->prev_ = nullptr;
            hook->next_ = nullptr;
        } else {
            anchor_.prev_->next_ = hook;
            hook->prev_ = anchor_.prev_;
            hook->next_ = nullptr;
            anchor_.prev_ = hook;
        }

        hook->owner_ = this;
        ++size_;
        return *this;
    }

    // Unlink item from wherever it sits. O(1).
    IntrusiveList& Remove(T* item) {
        ListHook* hook = item;
        COTREE_CHECK(hook->owner_ == this, "item is not a member of this list");

        if (anchor_.next_ == hook) {
            anchor_.next_ = hook->next_;
        } else {
            hook->prev_->next_ = hook->next_;
        }

        if (anchor_.prev_ == hook) {
            anchor_.prev_ = hook->prev_;
        } else {
            hook->next_->prev_ = hook->prev_;
        }

        hook->prev_ = nullptr;
        hook->next_ = nullptr;
        hook->owner_ = nullptr;
        --size_;
        return *this;
    }

    // ========================================================================
    // Traversal
    // ========================================================================

    Iterator begin() noexcept { return Iterator(&anchor_); }
    Iterator end() noexcept { return Iterator(); }

    ConstIterator begin() const noexcept { return ConstIterator(&anchor_); }
    ConstIterator end() const noexcept { return ConstIterator(); }

    // visitor(T&) for every member in insertion order, mutation-tolerant
    template <typename F>
    void Each(F&& visitor) {
        for (T& item : *this) {
            visitor(item);
        }
    }

    // Identity-based membership test. O(n).
    bool Includes(const T* needle) const noexcept {
        const ListHook* target = needle;
        for (const ListHook* hook = anchor_.next_; hook; hook = hook->next_) {
            if (hook == target) return true;
        }
        return false;
    }

    // ========================================================================
    // Query
    // ========================================================================

    T* First() const noexcept { return anchor_.next_ ? static_cast<T*>(anchor_.next_) : nullptr; }
    T* Last() const noexcept { return anchor_.prev_ ? static_cast<T*>(anchor_.prev_) : nullptr; }

    size_t Size() const noexcept { return size_; }
    bool Empty() const noexcept { return anchor_.next_ == nullptr; }

    // Walk both directions and compare against Size(). O(n).
    bool IsConsistent() const noexcept {
        size_t forward = 0;
        const ListHook* previous = nullptr;
        for (const ListHook* hook = anchor_.next_; hook; hook = hook->next_) {
            if (hook->prev_ != previous || hook->owner_ != this) return false;
            previous = hook;
            ++forward;
        }
        if (previous != anchor_.prev_) return false;

        size_t backward = 0;
        for (const ListHook* hook = anchor_.prev_; hook; hook = hook->prev_) {
            ++backward;
        }
        return forward == size_ && backward == size_ && (size_ == 0) == Empty();
    }

   private:
    static ListHook* NextOf(const ListHook* hook) noexcept { return hook->next_; }

    ListHook anchor_;
    size_t size_ = 0;
};

}  // namespace cotree
