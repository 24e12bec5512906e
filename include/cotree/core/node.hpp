// ============================================================================
// cotree/core/node.hpp - Task Hierarchy Node
// ============================================================================
//
// Node is one entry in the task hierarchy that a cooperative scheduler keeps
// for its running tasks. Every node knows its parent (non-owning) and keeps
// its children in an intrusive Children<Node> list, so attaching, detaching
// and moving a node between parents never allocates after the parent's
// collection exists.
//
// KEY CONCEPTS:
// -------------
// 1. TRANSIENT: A transient child is background work. Its parent counts as
//    finished while only transient children remain, and Stop() does not
//    cascade into it (Terminate() does).
//
// 2. FINISHED: No child is left that the node has to wait for. A finished
//    node with a parent can be collapsed out of the tree with Consume().
//
// 3. CONSUME: Detaches a finished node from its parent, drops children that
//    are themselves finished, re-homes unfinished children onto the former
//    parent, and then continues with the parent. Chains of dead
//    intermediate nodes collapse in one call.
//
// 4. HOOKS: Node has no execution state of its own. A concrete task type
//    composes a Node and plugs in a NodeHooks implementation that supplies
//    real stop, stopped and backtrace behavior.
//
// OWNERSHIP:
// ----------
// The tree owns nothing. Nodes are owned by whoever runs the task; a child
// that Consume() drops is merely detached. Destroying a node detaches it from
// its parent and orphans its children.
//
// All of this is single-threaded: the tree must only be touched from the
// scheduler's own thread.
//
// USAGE:
// ------
//   Node root;
//   Node worker(&root);
//   Node monitor(&root, {.transient = true});
//
//   root.Stop();                      // reaches worker, not monitor
//   root.Terminate();                 // reaches both
//
//   // later, when worker is done with its own children:
//   worker.Consume();                 // worker leaves root
//
//   root.PrintHierarchy(std::cerr);
//
// ============================================================================

#pragma once

#include "cotree/core/children.hpp"
#include "cotree/core/defer.hpp"
#include "cotree/core/error.hpp"
#include "cotree/core/intrusive_list.hpp"
#include "cotree/core/result.hpp"

#include <cstddef>
#include <iosfwd>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cotree {

class Node;

using BacktraceLines = std::vector<std::string>;

// ============================================================================
// NodeHooks - Extension points for a concrete task type
// ============================================================================
//
// Every method has a default that gives plain tree behavior, so an
// implementation only overrides what it has real state for.
//
class NodeHooks {
   public:
    virtual ~NodeHooks() = default;

    // Stop the task behind node. The default only cascades to the
    // non-transient children; an override usually cancels itself and then
    // calls node.StopChildren(defer_later).
    virtual void Stop(Node& node, bool defer_later);

    // Default: the node tracks no children collection.
    virtual bool IsStopped(const Node& node) const;

    // Up to length frames starting at from, innermost first.
    virtual std::optional<BacktraceLines> Backtrace(const Node& node, size_t from, size_t length) const;

    // Type shown in Node::Description()
    virtual std::string_view TypeName() const;

    // Shared stateless instance used by nodes created without hooks
    static NodeHooks& Default();
};

// ============================================================================
// NodeOptions - Construction-time settings
// ============================================================================
struct NodeOptions {
    std::optional<std::string> annotation;
    bool transient = false;   // fixed for the node's lifetime
    NodeHooks* hooks = nullptr;  // non-owning, nullptr selects NodeHooks::Default()
};

// ============================================================================
// Node
// ============================================================================
class Node : public ListHook {
   public:
    static constexpr size_t kAllFrames = std::numeric_limits<size_t>::max();

    explicit Node(Node* parent = nullptr, NodeOptions options = {});
    explicit Node(NodeOptions options) : Node(nullptr, std::move(options)) {}

    ~Node();

    // Identity is the node's address
    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;
    Node(Node&&) = delete;
    Node& operator=(Node&&) = delete;

    // ========================================================================
    // Structure
    // ========================================================================

    Node* Parent() const noexcept { return parent_; }

    // Topmost ancestor. O(depth).
    Node* Root() noexcept;
    const Node* Root() const noexcept;

    // nullptr until the first child attaches, and again after Consume().
    // Read-only: membership changes go through SetParent().
    const Children<Node>* ChildList() const noexcept { return children_.get(); }

    bool HasChildren() const noexcept { return children_ && !children_->Empty(); }

    bool IsTransient() const noexcept { return transient_; }

    // No non-transient child left (vacuously true without children)
    bool IsFinished() const noexcept { return !children_ || children_->IsFinished(); }

    // Move this node under parent, or detach it with nullptr. Setting the
    // current parent again is a no-op.
    Node& SetParent(Node* parent);

    // As SetParent(), but refuses a parent that is this node or lives in
    // this node's subtree.
    Result<void, Error> TrySetParent(Node* parent);

    // Collapse this node (and then its finished ancestors) out of the tree.
    void Consume();

    // visitor(Node&, size_t level) in depth-first pre-order, level 0 for
    // this node. The visitor may detach the node it is given.
    template <typename F>
    void Traverse(F&& visitor) {
        TraverseFrom(visitor, 0);
    }

    // visitor(const Node&, size_t level), same order
    template <typename F>
    void Traverse(F&& visitor) const {
        TraverseFrom(visitor, 0);
    }

    // ========================================================================
    // Stopping
    // ========================================================================

    // Stop the node itself (through its hooks) and every non-transient child.
    // defer_later is forwarded untouched; hooks decide what it means.
    void Stop(bool defer_later = false);

    // Stop(defer_later) on every non-transient direct child
    void StopChildren(bool defer_later = false);

    // Stop(false) on this node, then Terminate() on every child, transient or
    // not.
    void Terminate();

    bool IsStopped() const;

    // ========================================================================
    // Diagnostics
    // ========================================================================

    const std::optional<std::string>& Annotation() const noexcept { return annotation_; }

    // std::nullopt clears the annotation
    void Annotate(std::optional<std::string> annotation) { annotation_ = std::move(annotation); }

    // Override the annotation while body runs; the previous value comes back
    // on every exit path.
    template <typename F>
    decltype(auto) Annotate(std::optional<std::string> annotation, F&& body) {
        auto previous = std::exchange(annotation_, std::move(annotation));
        Defer restore([this, &previous]() noexcept { annotation_ = std::move(previous); });
        return std::forward<F>(body)();
    }

    std::optional<BacktraceLines> Backtrace(size_t from = 0, size_t length = kAllFrames) const;

    // "<type>:0x<address>[ transient]", then the annotation or else the
    // innermost backtrace frame
    std::string Description() const;

    // "#<description>"
    std::string ToString() const;

    // One line per node, one tab of indent per level
    void PrintHierarchy(std::ostream& out, bool with_backtrace = true) const;

    NodeHooks& Hooks() const noexcept { return *hooks_; }
    void SetHooks(NodeHooks* hooks) noexcept;

   private:
    void AddChild(Node* child);
    void RemoveChild(Node* child);

    template <typename F>
    void TraverseFrom(F& visitor, size_t level) {
        visitor(*this, level);

        // Held locally: a visitor may make this node drop its collection
        if (auto children = children_) {
            for (Node& child : *children) {
                child.TraverseFrom(visitor, level + 1);
            }
        }
    }

    template <typename F>
    void TraverseFrom(F& visitor, size_t level) const {
        visitor(*this, level);

        if (auto children = children_) {
            for (const Node& child : std::as_const(*children)) {
                child.TraverseFrom(visitor, level + 1);
            }
        }
    }

    Node* parent_ = nullptr;
    std::shared_ptr<Children<Node>> children_;
    NodeHooks* hooks_;
    std::optional<std::string> annotation_;
    mutable std::optional<std::string> object_name_;
    const bool transient_;
};

std::ostream& operator<<(std::ostream& os, const Node& node);

}  // namespace cotree
