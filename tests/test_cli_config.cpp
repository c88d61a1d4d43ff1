#include <cstdlib>
#include <fstream>

#include <gtest/gtest.h>

#include "cli/review_session.hpp"
#include "cli_config.hpp"

namespace fs = std::filesystem;

class CliConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("taskreview_cfg_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(dir_);
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
};

TEST_F(CliConfigTest, WrittenConfigLoadsBack) {
    CliConfig written;
    written.task_command = "/opt/bin/task";
    written.review_tag = "r:tester";
    written.review_window_hours = 48;
    written.listing_rows = 10;
    written.default_sort = "color";
    const std::string path = (dir_ / "config.yaml").string();
    ASSERT_TRUE(write_config_to_file(written, path));

    CliConfig loaded;
    load_or_create_config(path, loaded);
    EXPECT_EQ(loaded.task_command, "/opt/bin/task");
    EXPECT_EQ(loaded.review_tag, "r:tester");
    EXPECT_EQ(loaded.review_window_hours, 48);
    EXPECT_EQ(loaded.listing_rows, 10);
    EXPECT_EQ(loaded.default_sort, "color");
    EXPECT_FALSE(loaded.loaded_config_path.empty());
}

TEST_F(CliConfigTest, UnparsableConfigKeepsDefaults) {
    const fs::path path = dir_ / "bad.yaml";
    {
        std::ofstream out(path);
        out << "listing_rows: [oops\n";
    }
    CliConfig config;
    load_or_create_config(path.string(), config);
    EXPECT_EQ(config.listing_rows, 30);
    EXPECT_EQ(config.task_command, "task");
}

TEST_F(CliConfigTest, ExpandHomeUsesHomeVariable) {
    const char* old = std::getenv("HOME");
    std::string saved = old ? old : "";
    setenv("HOME", "/home/tester", 1);
    EXPECT_EQ(expand_home("~/.taskreview_keys.yaml"), fs::path("/home/tester/.taskreview_keys.yaml"));
    EXPECT_EQ(expand_home("/etc/keys.yaml"), fs::path("/etc/keys.yaml"));
    if (old) setenv("HOME", saved.c_str(), 1); else unsetenv("HOME");
}

TEST_F(CliConfigTest, SessionFallsBackOnInvalidValues) {
    CliConfig config;
    config.review_tag = "";
    config.review_window_hours = -3;
    config.default_sort = "size";
    config.default_color = "purple";
    tr::ReviewSession session = tr::make_session(config);
    EXPECT_EQ(session.review_window, std::chrono::hours(24));
    EXPECT_EQ(session.sort_mode, tr::SortMode::Urgency);
    EXPECT_EQ(session.default_color, "green");
    EXPECT_EQ(session.review_tag.rfind("r:", 0), 0u);
}
