#include <algorithm>

#include <gtest/gtest.h>

#include "backend/task_service.hpp"
#include "cli/default_bindings.hpp"
#include "cli/review_session.hpp"
#include "cli/run_shell.hpp"
#include "cli/task_reviewer.hpp"
#include "fake_backend.hpp"
#include "scripted_prompter.hpp"

using tr_test::FakeBackend;
using tr_test::make_record;
using tr_test::ScriptedPrompter;

namespace {

tr::TimePoint fixed_now() {
    return *tr::parse_stamp("20240601T120000Z");
}

bool has_tag(const nlohmann::json& record, const std::string& tag) {
    auto tags = record.value("tags", std::vector<std::string>{});
    return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

} // namespace

// Three open tasks: "a" (urgency 9, red), "b" (5, uncolored), "c" (1, green).
// Seeded keys: projects w/h, assignees a(lice)/b(ob), tag d(ocs).
class TaskReviewerTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend.add(make_record("a", "Write report", "work", 9, {"@alice", "red", "docs"}));
        backend.add(make_record("b", "Fix bike", "home", 5, {"@bob"}));
        backend.add(make_record("c", "Call mom", "home", 1, {"green"}));
        session.review_tag = "r:tester";
        session.clock = fixed_now;
        tr::seed_bindings(keys, svc.fetch("", tr::SortMode::Urgency));
    }

    void run(std::initializer_list<int> script) {
        io.keys.assign(script.begin(), script.end());
        reviewer.review(svc.fetch("", session.sort_mode));
    }

    FakeBackend backend;
    tr::TaskService svc{backend, fixed_now};
    tr::KeyRegistry keys;
    ScriptedPrompter io;
    tr::ReviewSession session;
    tr::TaskReviewer reviewer{svc, keys, io, session};
};

TEST_F(TaskReviewerTest, SeededKeysFollowTaskVocabulary) {
    EXPECT_EQ(keys.maps_to('w', tr::ctx::kProject), "work");
    EXPECT_EQ(keys.maps_to('h', tr::ctx::kProject), "home");
    EXPECT_EQ(keys.maps_to('a', tr::ctx::kAssignee), "alice");
    EXPECT_EQ(keys.maps_to('b', tr::ctx::kAssignee), "bob");
    EXPECT_EQ(keys.maps_to('d', tr::ctx::kTag), "docs");
    EXPECT_EQ(keys.maps_to('r', tr::ctx::kItemEditor), tr::action::kReviewed);
    EXPECT_EQ(keys.maps_to('r', tr::ctx::kListing), tr::action::kReview);
}

TEST_F(TaskReviewerTest, AssigneeEditReplacesPriorAssignee) {
    run({'r', 'a', 'b', 'q'});

    ASSERT_EQ(backend.imports.size(), 1u);
    const auto& stored = backend.find("a");
    EXPECT_TRUE(has_tag(stored, "@bob"));
    EXPECT_FALSE(has_tag(stored, "@alice"));
    EXPECT_TRUE(has_tag(stored, "red"));
    EXPECT_TRUE(has_tag(stored, "docs"));
    // The in-memory copy was refreshed from the backend.
    EXPECT_EQ(reviewer.tasks()[0].assignee_tag(), "@bob");
    EXPECT_EQ(reviewer.tasks()[0].modified, stored["modified"].get<std::string>());
}

TEST_F(TaskReviewerTest, ConflictDiscardsEditAndRefreshes) {
    io.keys = {'r', 'd', 'x', 'q'};
    auto tasks = svc.fetch("", session.sort_mode);
    backend.touch("a");
    reviewer.review(tasks);

    EXPECT_TRUE(backend.imports.empty());
    EXPECT_EQ(backend.find("a")["status"], "pending");
    EXPECT_EQ(io.count("mod time has changed"), 1u);
    EXPECT_EQ(io.count("Press any key to refresh."), 1u);
    // Stays on the same task with the backend's stamp.
    EXPECT_EQ(reviewer.tasks()[0].modified, backend.find("a")["modified"].get<std::string>());
    EXPECT_EQ(reviewer.tasks()[0].status, tr::TaskStatus::Pending);
    EXPECT_EQ(io.keys_read, 4);
}

TEST_F(TaskReviewerTest, StatusChangeElsewhereIsRecoverable) {
    io.keys = {'r', 'c', 'b', 'x', 'q'};
    auto tasks = svc.fetch("", session.sort_mode);
    backend.find("a")["status"] = "waiting";
    backend.touch("a");
    ASSERT_NO_THROW(reviewer.review(tasks));

    EXPECT_TRUE(backend.imports.empty());
    EXPECT_EQ(io.count("mod time has changed"), 1u);
    EXPECT_EQ(backend.find("a")["status"], "waiting");
    EXPECT_EQ(reviewer.tasks()[0].modified, backend.find("a")["modified"].get<std::string>());
    EXPECT_EQ(io.keys_read, 5);
}

TEST_F(TaskReviewerTest, BackFromFirstItemReturnsToListing) {
    run({'r', 'b', 'q'});
    EXPECT_EQ(io.count("Found 3 tasks."), 2u);
    EXPECT_TRUE(backend.imports.empty());
}

TEST_F(TaskReviewerTest, UnboundKeyAdvancesWithoutWriting) {
    run({'r', 'z', 'z', 'z', 'q'});
    EXPECT_TRUE(backend.imports.empty());
    // Walking past the last task ends the review; 'q' is never read.
    EXPECT_EQ(io.keys_read, 4);
    EXPECT_EQ(io.keys.size(), 1u);
}

TEST_F(TaskReviewerTest, CancelledPickerKeepsTaskOnScreen) {
    run({'r', 'c', '!', 'q'});
    EXPECT_TRUE(backend.imports.empty());
    EXPECT_EQ(io.count("Task Color"), 1u);
    EXPECT_EQ(io.count("Found 3 tasks."), 1u);
}

TEST_F(TaskReviewerTest, JumpOutOfRangeIsIgnored) {
    io.lines = {"7", "abc", "-1", "2"};
    run({'g', 'g', 'g', 'g', 'x'});

    EXPECT_EQ(io.count("Found 3 tasks."), 4u);
    ASSERT_EQ(backend.imports.size(), 1u);
    EXPECT_EQ(backend.find("c")["status"], "deleted");
    EXPECT_EQ(backend.find("a")["status"], "pending");
}

TEST_F(TaskReviewerTest, MarkReviewedHidesTaskFromNextListing) {
    run({'r', 'r', 'b', 'b', 'q'});

    ASSERT_EQ(backend.imports.size(), 1u);
    EXPECT_EQ(backend.find("a")["reviewed"], "20240601T120000Z");
    EXPECT_EQ(io.count("> 1 tasks already reviewed."), 1u);
    EXPECT_EQ(io.count("Found 2 tasks."), 1u);
}

TEST_F(TaskReviewerTest, ReviewingTwiceDoesNotWriteAgain) {
    backend.find("a")["reviewed"] = "20240601T110000Z";
    session.show_all = true;

    run({'r', 'r', 'q'});
    EXPECT_TRUE(backend.imports.empty());
}

TEST_F(TaskReviewerTest, ToggleShowAllRevealsReviewedTasks) {
    backend.find("b")["reviewed"] = "20240601T110000Z";
    run({'a', 'q'});

    EXPECT_EQ(io.count("> 1 tasks already reviewed."), 1u);
    EXPECT_EQ(io.count("Found 2 tasks."), 1u);
    EXPECT_EQ(io.count("> Showing all tasks."), 1u);
    EXPECT_EQ(io.count("Found 3 tasks."), 1u);
    EXPECT_TRUE(session.show_all);
}

TEST_F(TaskReviewerTest, ResortReordersWorkingSet) {
    run({'c', 'q'});
    EXPECT_EQ(session.sort_mode, tr::SortMode::Color);
    EXPECT_EQ(io.count("> Sorted by Color."), 1u);
    ASSERT_EQ(reviewer.tasks().size(), 3u);
    EXPECT_EQ(reviewer.tasks()[0].uuid, "a");
    EXPECT_EQ(reviewer.tasks()[1].uuid, "c");
    EXPECT_EQ(reviewer.tasks()[2].uuid, "b");
}

TEST_F(TaskReviewerTest, BulkFixColorsOnlyUncoloredTasks) {
    run({'f', 'q'});

    ASSERT_EQ(backend.imports.size(), 1u);
    EXPECT_TRUE(has_tag(backend.find("b"), "green"));
    EXPECT_TRUE(has_tag(backend.find("a"), "red"));
    EXPECT_FALSE(has_tag(backend.find("a"), "green"));
    EXPECT_EQ(reviewer.tasks()[1].color_tag(), "green");
}

TEST_F(TaskReviewerTest, BulkFixSkipsConcurrentlyModifiedTasks) {
    io.keys = {'f', 'q'};
    auto tasks = svc.fetch("", session.sort_mode);
    backend.touch("b");
    reviewer.review(tasks);

    EXPECT_TRUE(backend.imports.empty());
    EXPECT_EQ(io.count("Skipped: modified elsewhere."), 1u);
    EXPECT_EQ(io.count("Press any key to refresh."), 0u);
}

TEST_F(TaskReviewerTest, EndOfInputLeavesReview) {
    run({'r'});
    EXPECT_TRUE(backend.imports.empty());
}

class ShellTest : public TaskReviewerTest {};

TEST_F(ShellTest, KeysExtendAndClearFilter) {
    io.keys = {'p', 'h'};
    EXPECT_EQ(tr::shell_step(svc, keys, io, session, ""), " project:home");
    io.keys = {'a', 'b'};
    EXPECT_EQ(tr::shell_step(svc, keys, io, session, "project:home"), "project:home +@bob");
    io.keys = {'t', 'd'};
    EXPECT_EQ(tr::shell_step(svc, keys, io, session, "x"), "x +docs");
    io.keys = {'d'};
    EXPECT_EQ(tr::shell_step(svc, keys, io, session, "x"), "x _end");
    io.keys = {'s'};
    io.lines = {"  bike  "};
    EXPECT_EQ(tr::shell_step(svc, keys, io, session, "x"), "x bike");
    io.keys = {'c'};
    EXPECT_EQ(tr::shell_step(svc, keys, io, session, "x +docs"), "");
    io.keys = {'q'};
    EXPECT_FALSE(tr::shell_step(svc, keys, io, session, "x").has_value());
}

TEST_F(ShellTest, EnterReviewsMatchingTasks) {
    io.keys = {tr::ENTER, 'q', 'q'};
    tr::run_shell(svc, keys, io, session, "project:home");

    const size_t before = 1; // seeding fetch in SetUp
    ASSERT_EQ(backend.exports.size(), before + 1);
    EXPECT_EQ(backend.exports.back(), (std::vector<std::string>{"project:home"}));
    EXPECT_EQ(io.count("Found 2 tasks."), 1u);
}

TEST_F(ShellTest, EnterWithEmptyFilterDoesNothing) {
    io.keys = {tr::ENTER, 'q'};
    tr::run_shell(svc, keys, io, session, "   ");
    EXPECT_EQ(backend.exports.size(), 1u);
}

TEST_F(ShellTest, NewTaskTakesProjectAndAssigneeFromFilter) {
    io.keys = {'n', 'q'};
    io.lines = {"Buy milk"};
    tr::run_shell(svc, keys, io, session, "project:home +@bob");

    ASSERT_EQ(backend.imports.size(), 1u);
    auto sent = nlohmann::json::parse(backend.imports[0]);
    EXPECT_EQ(sent["description"], "Buy milk");
    EXPECT_EQ(sent["project"], "home");
    EXPECT_EQ(sent["status"], "pending");
    EXPECT_TRUE(has_tag(sent, "@bob"));
    EXPECT_TRUE(has_tag(sent, "green"));
    EXPECT_FALSE(sent.contains("uuid"));
}

TEST_F(ShellTest, NewTaskPicksMissingFieldsAndSkipsBlankDescription) {
    io.keys = {'n', 'w', 'a', 'n', 'w', 'a', 'q'};
    io.lines = {"Draft agenda", "   "};
    tr::run_shell(svc, keys, io, session, "");

    ASSERT_EQ(backend.imports.size(), 1u);
    auto sent = nlohmann::json::parse(backend.imports[0]);
    EXPECT_EQ(sent["project"], "work");
    EXPECT_TRUE(has_tag(sent, "@alice"));
}
