/**
 * @file test_task_graph.cpp
 * @brief Unit tests for TaskGraph — structure queries and the state machine.
 * @author Dimitris Kafetzis
 */

#include "graph/task_graph.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <thread>

using namespace crew_orchestrator;

// ─── Helpers ─────────────────────────────────

static Task make_task(const std::string& id, const std::string& phase = "construction") {
    return Task{
        .id = id,
        .owner = "Carpenter",
        .description = "Task " + id,
        .phase = phase
    };
}

static bool contains_id(const std::vector<TaskId>& ids, const TaskId& id) {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

/// A → B → C plus A → D.
static TaskGraph make_tree() {
    TaskGraph graph;
    for (const auto* id : {"A", "B", "C", "D"}) {
        EXPECT_TRUE(graph.add_task(make_task(id)));
    }
    EXPECT_TRUE(graph.add_dependency("A", "B"));
    EXPECT_TRUE(graph.add_dependency("B", "C"));
    EXPECT_TRUE(graph.add_dependency("A", "D"));
    return graph;
}

/// Drive a Ready task through InProgress to Completed.
static void complete(TaskGraph& graph, const TaskId& id) {
    ASSERT_TRUE(graph.mark_in_progress(id));
    ASSERT_TRUE(graph.mark_completed(id, "done"));
}

// ─── Construction ────────────────────────────

TEST(TaskGraphTest, AddTaskStartsPending) {
    TaskGraph graph;
    auto id = graph.add_task(make_task("t1"));
    ASSERT_TRUE(id);
    EXPECT_EQ(*id, "t1");
    EXPECT_EQ(graph.task_count(), 1u);
    EXPECT_EQ(graph.find("t1")->status, TaskStatus::Pending);
}

TEST(TaskGraphTest, DuplicateIdRejected) {
    TaskGraph graph;
    ASSERT_TRUE(graph.add_task(make_task("t1")));
    auto again = graph.add_task(make_task("t1"));
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, ErrorCode::DuplicateTask);
    EXPECT_EQ(graph.task_count(), 1u);
}

TEST(TaskGraphTest, EmptyIdRejected) {
    TaskGraph graph;
    auto added = graph.add_task(make_task(""));
    ASSERT_FALSE(added);
    EXPECT_EQ(added.error().code, ErrorCode::InvalidInput);
}

TEST(TaskGraphTest, DependencyOnUnknownTaskRejected) {
    TaskGraph graph;
    graph.add_task(make_task("A"));
    auto wired = graph.add_dependency("Z", "A");
    ASSERT_FALSE(wired);
    EXPECT_EQ(wired.error().code, ErrorCode::NotFound);
}

TEST(TaskGraphTest, RepeatedEdgeIgnored) {
    auto graph = make_tree();
    EXPECT_TRUE(graph.add_dependency("A", "B"));
    EXPECT_EQ(graph.dependencies("B").size(), 1u);
    EXPECT_EQ(graph.direct_dependents("A").size(), 2u);
}

TEST(TaskGraphTest, RemoveDependency) {
    auto graph = make_tree();
    EXPECT_TRUE(graph.remove_dependency("A", "B"));
    EXPECT_FALSE(graph.remove_dependency("A", "B"));
    EXPECT_TRUE(graph.dependencies("B").empty());
    EXPECT_FALSE(contains_id(graph.direct_dependents("A"), "B"));
}

TEST(TaskGraphTest, GetNonexistentTask) {
    TaskGraph graph;
    EXPECT_FALSE(graph.get_task("nope").has_value());
    EXPECT_EQ(graph.find("nope"), nullptr);
}

// ─── Queries ─────────────────────────────────

TEST(TaskGraphTest, TransitiveDependents) {
    auto graph = make_tree();
    auto dependents = graph.dependents_of("A");
    EXPECT_EQ(dependents.size(), 3u);
    EXPECT_TRUE(contains_id(dependents, "B"));
    EXPECT_TRUE(contains_id(dependents, "C"));
    EXPECT_TRUE(contains_id(dependents, "D"));
    EXPECT_TRUE(graph.dependents_of("C").empty());
}

TEST(TaskGraphTest, TopologicalOrderRespectsEdges) {
    auto graph = make_tree();
    auto order = graph.topological_order();
    ASSERT_EQ(order.size(), 4u);

    auto pos = [&](const TaskId& id) {
        return std::find(order.begin(), order.end(), id) - order.begin();
    };
    EXPECT_LT(pos("A"), pos("B"));
    EXPECT_LT(pos("B"), pos("C"));
    EXPECT_LT(pos("A"), pos("D"));
}

TEST(TaskGraphTest, CycleDetection) {
    auto graph = make_tree();
    EXPECT_FALSE(graph.has_cycle());

    graph.add_dependency("C", "A");
    EXPECT_TRUE(graph.has_cycle());
    EXPECT_LT(graph.topological_order().size(), graph.task_count());
}

TEST(TaskGraphTest, TaskIdsKeepInsertionOrder) {
    auto graph = make_tree();
    EXPECT_EQ(graph.task_ids(), (std::vector<TaskId>{"A", "B", "C", "D"}));
}

// ─── Readiness ───────────────────────────────

TEST(TaskGraphTest, ReadyTasksPromotesRootsOnly) {
    auto graph = make_tree();
    auto ready = graph.ready_tasks();
    EXPECT_EQ(ready, std::vector<TaskId>{"A"});
    EXPECT_EQ(graph.find("A")->status, TaskStatus::Ready);
    EXPECT_EQ(graph.find("B")->status, TaskStatus::Pending);

    // Already Ready tasks are not reported twice.
    EXPECT_TRUE(graph.ready_tasks().empty());
}

TEST(TaskGraphTest, CompletionUnlocksDependents) {
    auto graph = make_tree();
    graph.ready_tasks();
    complete(graph, "A");

    auto ready = graph.ready_tasks();
    EXPECT_EQ(ready, (std::vector<TaskId>{"B", "D"}));
    EXPECT_EQ(graph.tasks_in(TaskStatus::Ready), (std::vector<TaskId>{"B", "D"}));
}

// ─── State Machine ───────────────────────────

TEST(TaskGraphTest, InvalidTransitionsRejected) {
    auto graph = make_tree();

    auto early = graph.mark_in_progress("B");
    ASSERT_FALSE(early);
    EXPECT_EQ(early.error().code, ErrorCode::InvalidTransition);

    auto not_started = graph.mark_completed("A", "done");
    ASSERT_FALSE(not_started);
    EXPECT_EQ(not_started.error().code, ErrorCode::InvalidTransition);

    graph.ready_tasks();
    complete(graph, "A");
    auto backwards = graph.mark_failed("A", "too late");
    ASSERT_FALSE(backwards);
    EXPECT_EQ(backwards.error().code, ErrorCode::InvalidTransition);
    EXPECT_EQ(graph.find("A")->status, TaskStatus::Completed);

    auto unknown = graph.mark_in_progress("Z");
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().code, ErrorCode::NotFound);
}

TEST(TaskGraphTest, InProgressCountsAttempts) {
    auto graph = make_tree();
    graph.ready_tasks();
    ASSERT_TRUE(graph.mark_in_progress("A"));
    EXPECT_EQ(graph.find("A")->attempts, 1u);
    EXPECT_NE(graph.find("A")->started_seq, 0u);
}

TEST(TaskGraphTest, RetryUpToBudget) {
    auto graph = make_tree();
    graph.ready_tasks();

    for (uint32_t attempt = 1; attempt <= 2; ++attempt) {
        ASSERT_TRUE(graph.mark_in_progress("A"));
        ASSERT_TRUE(graph.mark_failed("A", "boom"));
        ASSERT_TRUE(graph.retry("A", 2));
        EXPECT_EQ(graph.find("A")->retry_count, attempt);
        EXPECT_EQ(graph.find("A")->status, TaskStatus::Ready);
        EXPECT_FALSE(graph.find("A")->error.has_value());
    }

    ASSERT_TRUE(graph.mark_in_progress("A"));
    ASSERT_TRUE(graph.mark_failed("A", "boom"));
    auto exhausted = graph.retry("A", 2);
    ASSERT_FALSE(exhausted);
    EXPECT_EQ(exhausted.error().code, ErrorCode::InvalidTransition);
    EXPECT_EQ(graph.find("A")->status, TaskStatus::Failed);
    EXPECT_EQ(graph.find("A")->retry_count, 2u);
    EXPECT_EQ(graph.find("A")->attempts, 3u);
}

TEST(TaskGraphTest, RetryRequiresFailedStatus) {
    auto graph = make_tree();
    auto retried = graph.retry("A", 5);
    ASSERT_FALSE(retried);
    EXPECT_EQ(retried.error().code, ErrorCode::InvalidTransition);
}

TEST(TaskGraphTest, BlockDependentsCascadesTransitively) {
    auto graph = make_tree();
    graph.ready_tasks();
    ASSERT_TRUE(graph.mark_in_progress("A"));
    ASSERT_TRUE(graph.mark_failed("A", "boom"));

    auto blocked = graph.block_dependents("A");
    EXPECT_EQ(blocked.size(), 3u);
    for (const auto* id : {"B", "C", "D"}) {
        const auto* task = graph.find(id);
        EXPECT_EQ(task->status, TaskStatus::Blocked) << id;
        ASSERT_TRUE(task->error.has_value());
        EXPECT_EQ(*task->error, "blocked: dependency A failed");
    }
    EXPECT_TRUE(graph.all_terminal());
}

TEST(TaskGraphTest, BlockDependentsLeavesFinishedTasksAlone) {
    auto graph = make_tree();
    graph.ready_tasks();
    complete(graph, "A");
    graph.ready_tasks();
    complete(graph, "D");
    ASSERT_TRUE(graph.mark_in_progress("B"));
    ASSERT_TRUE(graph.mark_failed("B", "boom"));

    auto blocked = graph.block_dependents("B");
    EXPECT_EQ(blocked, std::vector<TaskId>{"C"});
    EXPECT_EQ(graph.find("D")->status, TaskStatus::Completed);
}

TEST(TaskGraphTest, MarkBlockedOnlyFromPendingOrReady) {
    auto graph = make_tree();
    ASSERT_TRUE(graph.mark_blocked("C", "blocked: dependency X failed"));
    EXPECT_EQ(graph.find("C")->status, TaskStatus::Blocked);

    auto again = graph.mark_blocked("C", "again");
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, ErrorCode::InvalidTransition);
}

TEST(TaskGraphTest, ForceReadyIgnoresDependencies) {
    auto graph = make_tree();
    ASSERT_TRUE(graph.force_ready("C"));
    EXPECT_EQ(graph.find("C")->status, TaskStatus::Ready);

    auto not_pending = graph.force_ready("C");
    EXPECT_FALSE(not_pending);
}

TEST(TaskGraphTest, CancelRemainingSkipsFinishedTasks) {
    auto graph = make_tree();
    graph.ready_tasks();
    complete(graph, "A");
    graph.ready_tasks();

    auto cancelled = graph.cancel_remaining();
    EXPECT_EQ(cancelled, (std::vector<TaskId>{"B", "C", "D"}));
    EXPECT_EQ(graph.find("A")->status, TaskStatus::Completed);
    EXPECT_EQ(graph.find("C")->status, TaskStatus::Cancelled);
    EXPECT_TRUE(graph.all_terminal());
}

TEST(TaskGraphTest, SequenceNumbersFollowTransitions) {
    auto graph = make_tree();
    graph.ready_tasks();
    complete(graph, "A");
    graph.ready_tasks();
    ASSERT_TRUE(graph.mark_in_progress("B"));

    const auto* a = graph.find("A");
    const auto* b = graph.find("B");
    EXPECT_LT(a->ready_seq, a->started_seq);
    EXPECT_LT(a->started_seq, a->finished_seq);
    EXPECT_LT(a->finished_seq, b->ready_seq);
    EXPECT_LT(b->ready_seq, b->started_seq);
}

// ─── Snapshot and Progress ───────────────────

TEST(TaskGraphTest, SnapshotCountsAndCompletion) {
    auto graph = make_tree();
    graph.ready_tasks();
    complete(graph, "A");

    auto snap = graph.snapshot();
    EXPECT_EQ(snap.total, 4u);
    EXPECT_EQ(snap.count(TaskStatus::Completed), 1u);
    EXPECT_EQ(snap.count(TaskStatus::Pending), 3u);
    EXPECT_DOUBLE_EQ(snap.completion_percent, 25.0);
}

TEST(TaskGraphTest, SnapshotReadableDuringMutation) {
    TaskGraph graph;
    for (int i = 0; i < 200; ++i) {
        graph.add_task(make_task("t" + std::to_string(i)));
    }

    std::atomic<bool> done{false};
    std::jthread reader([&] {
        while (!done.load()) {
            auto snap = graph.snapshot();
            EXPECT_LE(snap.count(TaskStatus::Completed), snap.total);
        }
    });

    graph.ready_tasks();
    for (const auto& id : graph.tasks_in(TaskStatus::Ready)) {
        graph.mark_in_progress(id);
        graph.mark_completed(id, "ok");
    }
    done.store(true);
    reader.join();

    EXPECT_EQ(graph.snapshot().count(TaskStatus::Completed), 200u);
}

TEST(TaskGraphTest, PhaseProgressOrderedByPhaseRank) {
    TaskGraph graph;
    graph.add_task(make_task("1", "finishing"));
    graph.add_task(make_task("2", "planning"));
    graph.add_task(make_task("3", "finishing"));
    graph.add_task(make_task("4", "landscaping"));
    graph.ready_tasks();
    complete(graph, "1");

    auto phases = graph.phase_progress();
    ASSERT_EQ(phases.size(), 3u);
    EXPECT_EQ(phases[0].phase, "planning");
    EXPECT_EQ(phases[1].phase, "finishing");
    EXPECT_EQ(phases[1].total, 2u);
    EXPECT_EQ(phases[1].completed, 1u);
    EXPECT_EQ(phases[2].phase, "landscaping");
}
