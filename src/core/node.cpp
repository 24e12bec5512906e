// ============================================================================
// cotree/core/node.cpp - Task Hierarchy Node Implementation
// ============================================================================

#include "cotree/core/node.hpp"

#include <cstdint>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace cotree {

// ============================================================================
// NodeHooks defaults
// ============================================================================

void NodeHooks::Stop(Node& node, bool defer_later) {
    node.StopChildren(defer_later);
}

bool NodeHooks::IsStopped(const Node& node) const {
    return node.ChildList() == nullptr;
}

std::optional<BacktraceLines> NodeHooks::Backtrace(const Node&, size_t, size_t) const {
    return std::nullopt;
}

std::string_view NodeHooks::TypeName() const {
    return "cotree::Node";
}

NodeHooks& NodeHooks::Default() {
    static NodeHooks instance;
    return instance;
}

// ============================================================================
// Construction
// ============================================================================

Node::Node(Node* parent, NodeOptions options)
    : hooks_(options.hooks ? options.hooks : &NodeHooks::Default()),
      annotation_(std::move(options.annotation)),
      transient_(options.transient) {
    if (parent) {
        parent->AddChild(this);
    }
}

Node::~Node() {
    if (children_) {
        for (Node& child : *children_) {
            RemoveChild(&child);
        }
    }

    if (parent_) {
        parent_->RemoveChild(this);
    }
}

// ============================================================================
// Structure
// ============================================================================

Node* Node::Root() noexcept {
    Node* node = this;
    while (node->parent_) {
        node = node->parent_;
    }
    return node;
}

const Node* Node::Root() const noexcept {
    const Node* node = this;
    while (node->parent_) {
        node = node->parent_;
    }
    return node;
}

Node& Node::SetParent(Node* parent) {
    if (parent_ == parent) {
        return *this;
    }

    if (parent_) {
        parent_->RemoveChild(this);
    }

    if (parent) {
        parent->AddChild(this);
    }

    return *this;
}

Result<void, Error> Node::TrySetParent(Node* parent) {
    if (parent == this) {
        return Err(Errc::InvalidArgument);
    }

    for (const Node* ancestor = parent; ancestor; ancestor = ancestor->parent_) {
        if (ancestor == this) {
            return Err(Errc::WouldCreateCycle);
        }
    }

    SetParent(parent);
    return Ok();
}

void Node::AddChild(Node* child) {
    if (!children_) {
        children_ = std::make_shared<Children<Node>>();
    }
    children_->Insert(child);
    child->parent_ = this;
}

void Node::RemoveChild(Node* child) {
    COTREE_CHECK(children_ != nullptr, "node has no children to remove from");
    children_->Remove(child);
    child->parent_ = nullptr;
}

// ============================================================================
// Consume
// ============================================================================
//
// Walks upward iteratively. Nodes are visited in the same order as a
// recursive Consume() on the parent would visit them.
//
void Node::Consume() {
    Node* node = this;

    while (Node* parent = node->parent_) {
        if (!node->IsFinished()) {
            return;
        }

        parent->RemoveChild(node);

        if (node->children_) {
            // Every child is removed before it is looked at again, so the
            // cursor never leaves the anchor.
            for (Node& child : *node->children_) {
                const bool finished = child.IsFinished();
                node->RemoveChild(&child);
                if (!finished) {
                    parent->AddChild(&child);
                }
            }

            node->children_.reset();
        }

        node = parent;
    }
}

// ============================================================================
// Stopping
// ============================================================================

void Node::Stop(bool defer_later) {
    hooks_->Stop(*this, defer_later);
}

void Node::StopChildren(bool defer_later) {
    if (auto children = children_) {
        for (Node& child : *children) {
            if (!child.IsTransient()) {
                child.Stop(defer_later);
            }
        }
    }
}

void Node::Terminate() {
    Stop(false);

    // Stop() may be deferred or a no-op; terminate the whole subtree anyway
    if (auto children = children_) {
        for (Node& child : *children) {
            child.Terminate();
        }
    }
}

bool Node::IsStopped() const {
    return hooks_->IsStopped(*this);
}

// ============================================================================
// Diagnostics
// ============================================================================

std::optional<BacktraceLines> Node::Backtrace(size_t from, size_t length) const {
    return hooks_->Backtrace(*this, from, length);
}

void Node::SetHooks(NodeHooks* hooks) noexcept {
    hooks_ = hooks ? hooks : &NodeHooks::Default();
    object_name_.reset();
}

std::string Node::Description() const {
    if (!object_name_) {
        std::ostringstream name;
        name << hooks_->TypeName() << ":0x" << std::hex << std::setw(16) << std::setfill('0')
             << reinterpret_cast<std::uintptr_t>(this);
        if (transient_) {
            name << " transient";
        }
        object_name_ = name.str();
    }

    if (annotation_) {
        return *object_name_ + " " + *annotation_;
    }

    if (auto frames = Backtrace(0, 1); frames && !frames->empty()) {
        return *object_name_ + " " + frames->front();
    }

    return *object_name_;
}

std::string Node::ToString() const {
    return "#<" + Description() + ">";
}

void Node::PrintHierarchy(std::ostream& out, bool with_backtrace) const {
    Traverse([&out, with_backtrace](const Node& node, size_t level) {
        const std::string indent(level, '\t');

        out << indent << node << '\n';

        if (!with_backtrace) {
            return;
        }

        if (auto frames = node.Backtrace()) {
            for (size_t i = 0; i < frames->size(); ++i) {
                out << indent << (i == 0 ? "→ " : "  ") << (*frames)[i] << '\n';
            }
        }
    });
}

std::ostream& operator<<(std::ostream& os, const Node& node) {
    return os << node.ToString();
}

}  // namespace cotree
