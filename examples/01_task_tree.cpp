// ============================================================================
// Example 01: Task Tree
// ============================================================================
//
// A toy scheduler that keeps its jobs in a cotree hierarchy. Each Job owns a
// Node and acts as that node's hooks, so stopping the tree cancels the jobs.
//
// RUN:
//   cd build && ./examples/01_task_tree
//
// ============================================================================

#include "cotree/cotree.hpp"

#include <deque>
#include <iostream>
#include <memory>
#include <string>

using namespace cotree;

// A unit of work that takes a fixed number of scheduler ticks
class Job : public NodeHooks {
   public:
    Job(Job* parent, std::string name, int ticks, bool transient = false)
        : ticks_left_(ticks),
          node_(parent ? &parent->node_ : nullptr, {.annotation = std::move(name), .transient = transient, .hooks = this}) {}

    void Stop(Node& node, bool defer_later) override {
        if (!cancelled_) {
            std::cout << "  cancel " << *node.Annotation() << (defer_later ? " (deferred)" : "") << std::endl;
        }
        cancelled_ = true;
        node.StopChildren(defer_later);
    }

    bool IsStopped(const Node&) const override { return Done(); }

    std::string_view TypeName() const override { return "Job"; }

    // Run one tick; returns true once the job has completed
    bool Tick() {
        if (!Done()) {
            --ticks_left_;
        }
        return Done();
    }

    bool Done() const { return cancelled_ || ticks_left_ <= 0; }

    Node& GetNode() { return node_; }

   private:
    int ticks_left_;
    bool cancelled_ = false;
    Node node_;
};

// Runs every job round-robin; a finished job is consumed out of the tree
void RunUntilIdle(Node& root, std::deque<std::unique_ptr<Job>>& jobs, int max_ticks) {
    for (int tick = 1; tick <= max_ticks; ++tick) {
        for (auto& job : jobs) {
            if (job->GetNode().Parent() && job->Tick() && job->GetNode().IsFinished()) {
                std::cout << "  tick " << tick << ": " << *job->GetNode().Annotation() << " done" << std::endl;
                job->GetNode().Consume();
            }
        }
        if (root.IsFinished()) {
            return;
        }
    }
}

int main() {
    std::cout << "=== cotree Example 01: Task Tree ===" << std::endl;
    std::cout << std::endl;

    Node root({.annotation = "scheduler"});
    std::deque<std::unique_ptr<Job>> jobs;

    auto server = std::make_unique<Job>(nullptr, "server", 1);
    server->GetNode().SetParent(&root);
    Job* server_ptr = server.get();
    jobs.push_back(std::move(server));
    jobs.push_back(std::make_unique<Job>(server_ptr, "request #1", 2));
    jobs.push_back(std::make_unique<Job>(server_ptr, "request #2", 5));
    jobs.push_back(std::make_unique<Job>(server_ptr, "keepalive", 1000, true));

    std::cout << "--- Hierarchy ---" << std::endl;
    root.PrintHierarchy(std::cout, false);
    std::cout << std::endl;

    std::cout << "--- Run 3 ticks ---" << std::endl;
    RunUntilIdle(root, jobs, 3);
    root.PrintHierarchy(std::cout, false);
    std::cout << std::endl;

    // keepalive is transient: Stop() leaves it running, Terminate() does not
    std::cout << "--- Stop ---" << std::endl;
    root.Stop();
    root.PrintHierarchy(std::cout, false);
    std::cout << std::endl;

    std::cout << "--- Terminate ---" << std::endl;
    root.Terminate();
    RunUntilIdle(root, jobs, 10);
    root.PrintHierarchy(std::cout, false);
    std::cout << std::endl;
    std::cout << "=== Done! ===" << std::endl;
    return 0;
}
