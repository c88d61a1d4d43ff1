#include <algorithm>

#include <gtest/gtest.h>

#include "task_edits.hpp"

using namespace std::chrono_literals;

namespace {

tr::Task sample() {
    tr::Task t;
    t.uuid = "u-1";
    t.description = "Fix the fence";
    t.project = "home";
    t.entry = "20240101T090000Z";
    t.modified = "20240101T090000Z";
    t.tags = {"garden", "@alice", "red"};
    return t;
}

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

const tr::TimePoint kNow = *tr::parse_stamp("20240601T120000Z");

} // namespace

TEST(TaskEditsTest, AssigneeReplacesPreviousAndKeepsOtherLabels) {
    tr::Task t = tr::with_assignee(sample(), "bob");
    EXPECT_TRUE(contains(t.tags, "@bob"));
    EXPECT_FALSE(contains(t.tags, "@alice"));
    EXPECT_TRUE(contains(t.tags, "garden"));
    EXPECT_TRUE(contains(t.tags, "red"));
    EXPECT_EQ(t.assignee_tag(), "@bob");
}

TEST(TaskEditsTest, AssigneeStripsDuplicateAssignees) {
    tr::Task base = sample();
    base.tags.push_back("@carol");
    tr::Task t = tr::with_assignee(base, "bob");
    EXPECT_EQ(std::count_if(t.tags.begin(), t.tags.end(),
                            [](const std::string& s) { return s[0] == '@'; }),
              1);
}

TEST(TaskEditsTest, ColorReplacesEveryPriorColor) {
    tr::Task base = sample();
    base.tags.push_back("blue");
    tr::Task t = tr::with_color(base, "green");
    EXPECT_FALSE(contains(t.tags, "red"));
    EXPECT_FALSE(contains(t.tags, "blue"));
    EXPECT_EQ(t.color_tag(), "green");
    EXPECT_TRUE(contains(t.tags, "@alice"));
}

TEST(TaskEditsTest, TagToggleAddsThenRemoves) {
    tr::Task added = tr::with_tag_toggled(sample(), "errand");
    EXPECT_TRUE(contains(added.tags, "errand"));
    tr::Task removed = tr::with_tag_toggled(added, "errand");
    EXPECT_FALSE(contains(removed.tags, "errand"));
    EXPECT_EQ(removed.tags, sample().tags);
}

TEST(TaskEditsTest, EditsLeaveOriginalUntouched) {
    const tr::Task original = sample();
    tr::with_project(original, "work");
    tr::with_color(original, "blue");
    EXPECT_EQ(original.project, "home");
    EXPECT_EQ(original.color_tag(), "red");
}

TEST(TaskEditsTest, BlankDescriptionIsNotAnEdit) {
    EXPECT_FALSE(tr::with_description(sample(), "   \t").has_value());
    auto t = tr::with_description(sample(), "  Paint the fence \n");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->description, "Paint the fence");
}

TEST(TaskEditsTest, ReviewingOpenTaskStampsMarker) {
    auto t = tr::marked_reviewed(sample(), kNow, "r:me");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->reviewed, "20240601T120000Z");
    EXPECT_FALSE(contains(t->tags, "r:me"));
    EXPECT_TRUE(t->is_reviewed(kNow + 1h, "r:me"));

    EXPECT_FALSE(tr::marked_reviewed(*t, kNow + 1h, "r:me").has_value());
    EXPECT_TRUE(tr::marked_reviewed(*t, kNow + 25h, "r:me").has_value());
}

TEST(TaskEditsTest, ReviewingCompletedTaskAddsReviewerTag) {
    tr::Task base = sample();
    base.status = tr::TaskStatus::Completed;
    base.end = "20240530T100000Z";
    auto t = tr::marked_reviewed(base, kNow, "r:me");
    ASSERT_TRUE(t.has_value());
    EXPECT_TRUE(contains(t->tags, "r:me"));
    EXPECT_FALSE(t->reviewed.has_value());
    EXPECT_FALSE(tr::marked_reviewed(*t, kNow, "r:me").has_value());
}

TEST(TaskEditsTest, DoneStampsEndOnlyWhenMissing) {
    tr::Task t = tr::marked_done(sample(), kNow);
    EXPECT_EQ(t.status, tr::TaskStatus::Completed);
    EXPECT_EQ(t.end, "20240601T120000Z");

    tr::Task again = tr::marked_done(t, kNow + 5h);
    EXPECT_EQ(again.end, "20240601T120000Z");
}

TEST(TaskEditsTest, DisputeIsIdempotent) {
    auto t = tr::marked_disputed(sample());
    ASSERT_TRUE(t.has_value());
    EXPECT_TRUE(t->is_disputed());
    EXPECT_FALSE(tr::marked_disputed(*t).has_value());
}

TEST(TaskEditsTest, DeleteOnlyChangesStatus) {
    tr::Task t = tr::marked_deleted(sample());
    EXPECT_EQ(t.status, tr::TaskStatus::Deleted);
    EXPECT_EQ(t.tags, sample().tags);
    EXPECT_FALSE(t.end.has_value());
}
