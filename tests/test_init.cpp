#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "init.hpp"

namespace fs = std::filesystem;

class InitTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / "termsearch_init_test";
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override { fs::remove_all(dir_); }

    std::string read(const fs::path& p) {
        std::ifstream in(p);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    fs::path dir_;
};

TEST_F(InitTest, WritesWidgetAndSourcesIt) {
    install_zsh_widget(dir_.string());

    EXPECT_EQ(read(dir_ / "termsearch.zsh"), ZSH_WIDGET_SCRIPT);
    EXPECT_EQ(read(dir_ / ".zshrc"), "source " + (dir_ / "termsearch.zsh").string() + "\n");
}

TEST_F(InitTest, RunningTwiceDoesNotDuplicateSourceLine) {
    {
        std::ofstream rc(dir_ / ".zshrc");
        rc << "export EDITOR=vim\n";
    }
    install_zsh_widget(dir_.string());
    install_zsh_widget(dir_.string());

    std::string rc = read(dir_ / ".zshrc");
    EXPECT_EQ(rc, "export EDITOR=vim\nsource " + (dir_ / "termsearch.zsh").string() + "\n");
}

TEST_F(InitTest, AppendLineOnceReportsExistingContent) {
    fs::path file = dir_ / "rc";
    EXPECT_TRUE(append_line_once(file.string(), "hello"));
    EXPECT_FALSE(append_line_once(file.string(), "hello"));
}

TEST(InitScriptTest, BindsCtrlR) {
    std::string script = ZSH_WIDGET_SCRIPT;
    EXPECT_NE(script.find("bindkey '^R' termsearch-search"), std::string::npos);
    EXPECT_NE(script.find("termsearch search -o"), std::string::npos);
}

TEST(InitConfigDirTest, PrefersZdotdir) {
    setenv("ZDOTDIR", "/tmp/zdot", 1);
    EXPECT_EQ(get_zsh_config_dir(), "/tmp/zdot");
    unsetenv("ZDOTDIR");
}
