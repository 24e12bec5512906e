// ============================================================================
// Node Tests
// ============================================================================

#include <gtest/gtest.h>

#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include "cotree/core/node.hpp"

using namespace cotree;

// ============================================================================
// Construction and attach / detach
// ============================================================================

TEST(NodeTest, StandaloneNode) {
    Node node;

    EXPECT_EQ(node.Parent(), nullptr);
    EXPECT_EQ(node.ChildList(), nullptr);
    EXPECT_FALSE(node.HasChildren());
    EXPECT_FALSE(node.IsTransient());
    EXPECT_TRUE(node.IsFinished());
    EXPECT_TRUE(node.IsStopped());
    EXPECT_FALSE(node.Annotation().has_value());
    EXPECT_EQ(node.Root(), &node);
}

TEST(NodeTest, ConstructWithParentAttaches) {
    Node parent;
    Node child(&parent);

    EXPECT_EQ(child.Parent(), &parent);
    ASSERT_NE(parent.ChildList(), nullptr);
    EXPECT_TRUE(parent.ChildList()->Includes(&child));
    EXPECT_TRUE(parent.HasChildren());
    EXPECT_FALSE(parent.IsFinished());
    EXPECT_FALSE(parent.IsStopped());
}

TEST(NodeTest, ConstructWithOptions) {
    Node parent;
    Node child(&parent, {.annotation = "reading socket", .transient = true});

    EXPECT_TRUE(child.IsTransient());
    EXPECT_EQ(child.Annotation(), "reading socket");
    EXPECT_EQ(parent.ChildList()->TransientCount(), 1u);
    EXPECT_TRUE(parent.IsFinished());

    Node orphan({.annotation = "orphan"});
    EXPECT_EQ(orphan.Parent(), nullptr);
    EXPECT_EQ(orphan.Annotation(), "orphan");
}

TEST(NodeTest, RootWalksToTop) {
    Node root;
    Node middle(&root);
    Node leaf(&middle);

    EXPECT_EQ(leaf.Root(), &root);
    EXPECT_EQ(middle.Root(), &root);

    const Node& const_leaf = leaf;
    EXPECT_EQ(const_leaf.Root(), &root);
}

TEST(NodeTest, SetParentMovesBetweenParents) {
    Node first;
    Node second;
    Node child(&first, {.transient = true});

    child.SetParent(&second);

    EXPECT_EQ(child.Parent(), &second);
    EXPECT_FALSE(first.ChildList()->Includes(&child));
    EXPECT_TRUE(second.ChildList()->Includes(&child));
    EXPECT_EQ(first.ChildList()->TransientCount(), 0u);
    EXPECT_EQ(second.ChildList()->TransientCount(), 1u);
    EXPECT_FALSE(first.HasChildren());
}

TEST(NodeTest, SetParentToCurrentIsNoop) {
    Node parent;
    Node a(&parent);
    Node b(&parent);

    a.SetParent(&parent);

    // Still first, not re-appended
    EXPECT_EQ(parent.ChildList()->First(), &a);
    EXPECT_EQ(parent.ChildList()->Size(), 2u);
}

TEST(NodeTest, SetParentNullDetaches) {
    Node parent;
    Node child(&parent);

    child.SetParent(nullptr);

    EXPECT_EQ(child.Parent(), nullptr);
    EXPECT_FALSE(child.IsLinked());
    EXPECT_FALSE(parent.HasChildren());
    // The collection stays allocated once created
    EXPECT_NE(parent.ChildList(), nullptr);
}

TEST(NodeTest, ChildListIsReadOnly) {
    Node parent;
    Node child(&parent);

    static_assert(std::is_const_v<std::remove_pointer_t<decltype(parent.ChildList())>>);

    // Reading still works; the link is only changed through SetParent()
    size_t count = 0;
    for (const Node& member : *parent.ChildList()) {
        EXPECT_EQ(member.Parent(), &parent);
        ++count;
    }
    EXPECT_EQ(count, 1u);
}

TEST(NodeTest, SetParentIsChainable) {
    Node parent;
    Node child;

    EXPECT_EQ(&child.SetParent(&parent), &child);
}

TEST(NodeTest, TrySetParentAccepts) {
    Node parent;
    Node child;

    auto result = child.TrySetParent(&parent);

    EXPECT_TRUE(result.IsOk());
    EXPECT_EQ(child.Parent(), &parent);
}

TEST(NodeTest, TrySetParentRejectsSelf) {
    Node node;

    auto result = node.TrySetParent(&node);

    ASSERT_TRUE(result.IsErr());
    EXPECT_EQ(result.Error(), Errc::InvalidArgument);
    EXPECT_EQ(node.Parent(), nullptr);
}

TEST(NodeTest, TrySetParentRejectsDescendant) {
    Node root;
    Node middle(&root);
    Node leaf(&middle);

    auto result = root.TrySetParent(&leaf);

    ASSERT_TRUE(result.IsErr());
    EXPECT_EQ(result.Error(), Errc::WouldCreateCycle);
    EXPECT_EQ(root.Parent(), nullptr);
    EXPECT_EQ(leaf.Parent(), &middle);
}

TEST(NodeTest, DestroyingChildDetachesIt) {
    Node parent;
    {
        Node child(&parent, {.transient = true});
        EXPECT_TRUE(parent.HasChildren());
    }

    EXPECT_FALSE(parent.HasChildren());
    EXPECT_EQ(parent.ChildList()->TransientCount(), 0u);
    EXPECT_TRUE(parent.ChildList()->IsConsistent());
}

TEST(NodeTest, DestroyingParentOrphansChildren) {
    Node a;
    Node b;
    {
        Node parent;
        a.SetParent(&parent);
        b.SetParent(&parent);
    }

    EXPECT_EQ(a.Parent(), nullptr);
    EXPECT_EQ(b.Parent(), nullptr);
    EXPECT_FALSE(a.IsLinked());
    EXPECT_FALSE(b.IsLinked());
}

// ============================================================================
// Traverse
// ============================================================================

TEST(NodeTest, TraversePreOrderWithLevels) {
    Node root({.annotation = "root"});
    Node a(&root, {.annotation = "a"});
    Node a1(&a, {.annotation = "a1"});
    Node a2(&a, {.annotation = "a2"});
    Node b(&root, {.annotation = "b"});
    Node b1(&b, {.annotation = "b1"});

    std::vector<std::string> visited;
    root.Traverse([&](Node& node, size_t level) {
        visited.push_back(std::string(level, '-') + *node.Annotation());
    });

    EXPECT_EQ(visited, (std::vector<std::string>{"root", "-a", "--a1", "--a2", "-b", "--b1"}));
}

TEST(NodeTest, ConstTraverseVisitsSameOrder) {
    Node root({.annotation = "root"});
    Node a(&root, {.annotation = "a"});
    Node a1(&a, {.annotation = "a1"});
    Node b(&root, {.annotation = "b"});
    const Node& view = root;

    std::vector<std::string> visited;
    view.Traverse([&](const Node& node, size_t level) {
        visited.push_back(std::string(level, '-') + *node.Annotation());
    });

    EXPECT_EQ(visited, (std::vector<std::string>{"root", "-a", "--a1", "-b"}));
}

TEST(NodeTest, TraverseToleratesVisitorDetachingNode) {
    Node root;
    Node a(&root, {.annotation = "a"});
    Node b(&root, {.annotation = "b"});
    Node c(&root, {.annotation = "c"});

    std::vector<std::string> visited;
    root.Traverse([&](Node& node, size_t level) {
        if (level == 0) return;
        visited.push_back(*node.Annotation());
        node.SetParent(nullptr);
    });

    EXPECT_EQ(visited, (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_FALSE(root.HasChildren());
}

// ============================================================================
// Annotation
// ============================================================================

TEST(NodeTest, AnnotateSetsValue) {
    Node node;

    node.Annotate("connecting");

    EXPECT_EQ(node.Annotation(), "connecting");
}

TEST(NodeTest, AnnotateNulloptClears) {
    Node node({.annotation = "connecting"});

    node.Annotate(std::nullopt);

    EXPECT_FALSE(node.Annotation().has_value());
    EXPECT_EQ(node.Description().find("connecting"), std::string::npos);
}

TEST(NodeTest, ScopedAnnotateRestores) {
    Node node({.annotation = "idle"});

    int result = node.Annotate("busy", [&] {
        EXPECT_EQ(node.Annotation(), "busy");
        return 7;
    });

    EXPECT_EQ(result, 7);
    EXPECT_EQ(node.Annotation(), "idle");
}

TEST(NodeTest, ScopedAnnotateRestoresAbsentValue) {
    Node node;

    node.Annotate("busy", [] {});

    EXPECT_FALSE(node.Annotation().has_value());
}

TEST(NodeTest, ScopedAnnotateRestoresOnException) {
    Node node({.annotation = "idle"});

    EXPECT_THROW(node.Annotate("busy", []() -> void { throw std::runtime_error("boom"); }), std::runtime_error);

    EXPECT_EQ(node.Annotation(), "idle");
}

TEST(NodeTest, ScopedAnnotateCanClearTemporarily) {
    Node node({.annotation = "idle"});

    node.Annotate(std::nullopt, [&] { EXPECT_FALSE(node.Annotation().has_value()); });

    EXPECT_EQ(node.Annotation(), "idle");
}

TEST(NodeTest, NestedScopedAnnotate) {
    Node node({.annotation = "outer"});

    node.Annotate("middle", [&] {
        node.Annotate("inner", [&] { EXPECT_EQ(node.Annotation(), "inner"); });
        EXPECT_EQ(node.Annotation(), "middle");
    });

    EXPECT_EQ(node.Annotation(), "outer");
}

// ============================================================================
// Description / printing
// ============================================================================

namespace {

class TracedHooks : public NodeHooks {
   public:
    std::optional<BacktraceLines> Backtrace(const Node&, size_t from, size_t length) const override {
        BacktraceLines frames;
        for (size_t i = from; i < lines.size() && frames.size() < length; ++i) {
            frames.push_back(lines[i]);
        }
        return frames;
    }

    std::string_view TypeName() const override { return "Traced"; }

    BacktraceLines lines{"worker.cpp:10", "main.cpp:3"};
};

}  // namespace

TEST(NodeTest, DescriptionFormat) {
    Node node;

    std::string description = node.Description();

    EXPECT_EQ(description.rfind("cotree::Node:0x", 0), 0u);
    // type, ":0x", 16 hex digits
    EXPECT_EQ(description.size(), std::string("cotree::Node:0x").size() + 16);
    EXPECT_EQ(node.Description(), description);
}

TEST(NodeTest, DescriptionMarksTransientAndAnnotation) {
    Node node({.annotation = "polling", .transient = true});

    std::string description = node.Description();

    EXPECT_NE(description.find(" transient polling"), std::string::npos);
    EXPECT_EQ(node.ToString(), "#<" + description + ">");
}

TEST(NodeTest, DescriptionFallsBackToBacktrace) {
    TracedHooks hooks;
    Node node({.hooks = &hooks});

    std::string description = node.Description();

    EXPECT_EQ(description.rfind("Traced:0x", 0), 0u);
    EXPECT_NE(description.find(" worker.cpp:10"), std::string::npos);
    EXPECT_EQ(description.find("main.cpp"), std::string::npos);

    node.Annotate("named");
    EXPECT_NE(node.Description().find(" named"), std::string::npos);
    EXPECT_EQ(node.Description().find("worker.cpp"), std::string::npos);
}

TEST(NodeTest, StreamOperatorUsesToString) {
    Node node({.annotation = "x"});
    std::ostringstream out;

    out << node;

    EXPECT_EQ(out.str(), node.ToString());
}

TEST(NodeTest, PrintHierarchyIndentsByLevel) {
    Node root({.annotation = "root"});
    Node child(&root, {.annotation = "child"});
    Node grandchild(&child, {.annotation = "grandchild"});
    std::ostringstream out;

    const Node& view = root;
    view.PrintHierarchy(out, false);

    std::string expected = root.ToString() + "\n" + "\t" + child.ToString() + "\n" + "\t\t" +
                           grandchild.ToString() + "\n";
    EXPECT_EQ(out.str(), expected);
}

TEST(NodeTest, PrintHierarchyWithBacktrace) {
    TracedHooks hooks;
    Node root({.annotation = "root"});
    Node child(&root, {.annotation = "child", .hooks = &hooks});
    std::ostringstream out;

    root.PrintHierarchy(out);

    std::string expected = root.ToString() + "\n" + "\t" + child.ToString() + "\n" + "\t→ worker.cpp:10\n" +
                           "\t  main.cpp:3\n";
    EXPECT_EQ(out.str(), expected);
}

TEST(NodeTest, SetHooksResetsCachedName) {
    TracedHooks hooks;
    Node node;
    EXPECT_EQ(node.Description().rfind("cotree::Node", 0), 0u);

    node.SetHooks(&hooks);
    EXPECT_EQ(node.Description().rfind("Traced", 0), 0u);
    EXPECT_EQ(&node.Hooks(), &hooks);

    node.SetHooks(nullptr);
    EXPECT_EQ(&node.Hooks(), &NodeHooks::Default());
}
