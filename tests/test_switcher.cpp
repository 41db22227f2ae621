#include <gtest/gtest.h>

#include "jswitch/env_store.hpp"
#include "jswitch/switch_log.hpp"
#include "jswitch/switcher.hpp"
#include "testing.hpp"

#include <filesystem>
#include <sstream>

namespace {

using jswitch::EnvScope;
using jswitch::ErrorKind;
using jswitch::RunState;

constexpr std::time_t kFixedTime = 1700000000;

class SwitcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        base_ = tmp_.MakeDir("java");
        for (const char* v : {"17", "21", "8"}) tmp_.MakeDir(std::string("java/") + v);

        auto store = std::make_unique<jswitch::MemoryEnvironmentStore>();
        store_ = store.get();
        owned_store_ = std::move(store);

        ASSERT_TRUE(store_->SetVariable(EnvScope::Machine, "PATH", base_ + "/8/bin:/usr/bin").ok);
        ASSERT_TRUE(store_->SetVariable(EnvScope::Machine, "JAVA_HOME", base_ + "/8").ok);

        opt_.mutator.path_variable = "PATH";
        opt_.mutator.rules = jswitch::PathRules{':', '/', false};
        opt_.clock = [] { return kFixedTime; };
    }

    // The switcher owns the store; it is kept for the whole test so store_ stays valid.
    jswitch::Switcher& MakeSwitcher(const std::string& input) {
        in_.str(input);
        switcher_ = std::make_unique<jswitch::Switcher>(std::move(owned_store_), in_, out_, opt_);
        return *switcher_;
    }

    jswitch::RunReport RunWith(const std::string& input, const jswitch::Config& cfg) {
        return MakeSwitcher(input).RunWithConfig(cfg);
    }

    jswitch::Config MakeConfig() const {
        jswitch::Config cfg;
        cfg.base_directory = base_;
        return cfg;
    }

    std::string Var(const std::string& name) {
        std::optional<std::string> v;
        EXPECT_TRUE(store_->GetVariable(EnvScope::Machine, name, v).ok);
        return v.value_or("<unset>");
    }

    testutil::TemporaryDirectory tmp_;
    std::string base_;
    jswitch::MemoryEnvironmentStore* store_ = nullptr;
    std::unique_ptr<jswitch::IEnvironmentStore> owned_store_;
    jswitch::SwitchOptions opt_;
    std::istringstream in_;
    std::ostringstream out_;
    std::unique_ptr<jswitch::Switcher> switcher_;
};

TEST_F(SwitcherTest, SwitchesToChosenIndex) {
    auto report = RunWith("2\n", MakeConfig());

    ASSERT_TRUE(report.ok()) << report.result.msg;
    EXPECT_EQ(report.state, RunState::Done);
    EXPECT_EQ(report.ExitCode(), 0);
    ASSERT_TRUE(report.selection.has_value());
    EXPECT_EQ(*report.selection, base_ + "/21");

    EXPECT_EQ(Var("JAVA_HOME"), base_ + "/21");
    EXPECT_EQ(Var("PATH"), base_ + "/21/bin:/usr/bin");

    const std::string out = out_.str();
    EXPECT_NE(out.find("  1) 17\n  2) 21\n  3) 8\n"), std::string::npos);
    EXPECT_NE(out.find("new terminal"), std::string::npos);
}

TEST_F(SwitcherTest, EachIndexWritesThatCandidate) {
    const char* sorted[] = {"17", "21", "8"};
    for (int i = 1; i <= 3; ++i) {
        auto store = std::make_unique<jswitch::MemoryEnvironmentStore>();
        auto* raw = store.get();
        ASSERT_TRUE(raw->SetVariable(EnvScope::Machine, "PATH", "/usr/bin").ok);

        std::istringstream in(std::to_string(i) + "\n");
        std::ostringstream out;
        jswitch::Switcher switcher(std::move(store), in, out, opt_);
        auto report = switcher.RunWithConfig(MakeConfig());
        ASSERT_TRUE(report.ok()) << report.result.msg;

        const std::string expected = base_ + "/" + sorted[i - 1];
        std::optional<std::string> home, path;
        ASSERT_TRUE(raw->GetVariable(EnvScope::Machine, "JAVA_HOME", home).ok);
        ASSERT_TRUE(raw->GetVariable(EnvScope::Machine, "PATH", path).ok);
        EXPECT_EQ(home.value_or(""), expected);
        EXPECT_EQ(path.value_or(""), expected + "/bin:/usr/bin");
    }
}

TEST_F(SwitcherTest, EmptyInputUsesDefaultAndMarksIt) {
    auto cfg = MakeConfig();
    cfg.default_version = "21";
    auto report = RunWith("\n", cfg);

    ASSERT_TRUE(report.ok()) << report.result.msg;
    EXPECT_EQ(Var("JAVA_HOME"), base_ + "/21");
    EXPECT_NE(out_.str().find("2) 21 (default)"), std::string::npos);
}

TEST_F(SwitcherTest, InvalidSelectionStopsBeforeAnyWrite) {
    auto report = RunWith("4\n", MakeConfig());

    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.result.kind, ErrorKind::InvalidSelection);
    EXPECT_EQ(report.state, RunState::Listed);
    EXPECT_EQ(report.ExitCode(), jswitch::kExitSelection);
    EXPECT_EQ(Var("JAVA_HOME"), base_ + "/8");
}

TEST_F(SwitcherTest, NoSelectionAndNoDefault) {
    auto report = RunWith("", MakeConfig());
    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.result.kind, ErrorKind::NoSelectionAndNoDefault);
    EXPECT_FALSE(report.selection.has_value());
}

TEST_F(SwitcherTest, MissingBaseDirectoryStopsAtLoaded) {
    auto cfg = MakeConfig();
    cfg.base_directory = base_ + "/nowhere";
    auto report = RunWith("1\n", cfg);

    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.result.kind, ErrorKind::BaseDirectoryNotFound);
    EXPECT_EQ(report.state, RunState::Loaded);
    EXPECT_EQ(report.ExitCode(), jswitch::kExitDiscovery);
}

TEST_F(SwitcherTest, HomeWriteFailureLeavesPathAlone) {
    store_->FailWritesTo("JAVA_HOME");
    auto report = RunWith("1\n", MakeConfig());

    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.result.kind, ErrorKind::EnvironmentWritePermissionDenied);
    EXPECT_EQ(report.state, RunState::Selected);
    EXPECT_FALSE(report.inconsistent);
    EXPECT_EQ(Var("PATH"), base_ + "/8/bin:/usr/bin");
}

TEST_F(SwitcherTest, PathWriteFailureIsReportedAsInconsistent) {
    store_->FailWritesTo("PATH");
    auto report = RunWith("1\n", MakeConfig());

    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.state, RunState::HomeSet);
    EXPECT_TRUE(report.inconsistent);
    EXPECT_FALSE(report.restore.has_value());
    EXPECT_EQ(report.ExitCode(), jswitch::kExitPartialUpdate);
    EXPECT_EQ(Var("JAVA_HOME"), base_ + "/17");
    EXPECT_EQ(Var("PATH"), base_ + "/8/bin:/usr/bin");
}

TEST_F(SwitcherTest, RestoreOnFailurePutsHomeBack) {
    opt_.restore_on_failure = true;
    store_->FailWritesTo("PATH");
    auto report = RunWith("1\n", MakeConfig());

    ASSERT_FALSE(report.ok());
    ASSERT_TRUE(report.restore.has_value());
    EXPECT_TRUE(report.restore->ok);
    EXPECT_FALSE(report.inconsistent);
    EXPECT_EQ(report.state, RunState::Selected);
    EXPECT_EQ(report.ExitCode(), jswitch::kExitEnvironment);
    EXPECT_EQ(Var("JAVA_HOME"), base_ + "/8");
}

TEST_F(SwitcherTest, AppendsSwitchLog) {
    auto cfg = MakeConfig();
    cfg.log_directory = tmp_.Path() + "/logs/nested";
    auto report = RunWith("3\n", cfg);

    ASSERT_TRUE(report.ok()) << report.result.msg;
    EXPECT_TRUE(report.warnings.empty());

    const std::string log = testutil::ReadFile(*cfg.log_directory + "/java-switcher.log");
    EXPECT_EQ(log, jswitch::FormatSwitchLogLine(kFixedTime, base_ + "/8") + "\n");
}

TEST_F(SwitcherTest, LogFailureIsOnlyAWarning) {
    auto cfg = MakeConfig();
    cfg.log_directory = tmp_.WriteFile("not-a-dir", "");
    auto report = RunWith("1\n", cfg);

    ASSERT_TRUE(report.ok()) << report.result.msg;
    EXPECT_EQ(report.state, RunState::Done);
    EXPECT_EQ(report.ExitCode(), 0);
    ASSERT_EQ(report.warnings.size(), 1u);
    EXPECT_EQ(report.warnings[0].kind, ErrorKind::LogWriteFailed);
    EXPECT_EQ(Var("JAVA_HOME"), base_ + "/17");
}

TEST_F(SwitcherTest, RunLoadsConfigFile) {
    auto path = tmp_.WriteFile("config/config.json", "{\"JavaBase\": \"" + base_ + "\", \"DefaultVersion\": \"8\"}");
    auto report = MakeSwitcher("\n").Run(path);

    ASSERT_TRUE(report.ok()) << report.result.msg;
    EXPECT_EQ(Var("JAVA_HOME"), base_ + "/8");
    EXPECT_EQ(Var("PATH"), base_ + "/8/bin:/usr/bin");
}

TEST_F(SwitcherTest, MissingConfigStopsAtStart) {
    auto report = MakeSwitcher("").Run(tmp_.Path() + "/absent.json");

    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.result.kind, ErrorKind::ConfigNotFound);
    EXPECT_EQ(report.state, RunState::Start);
    EXPECT_EQ(report.ExitCode(), jswitch::kExitConfig);
}

TEST(SwitchLogTest, LineFormat) {
    const std::string line = jswitch::FormatSwitchLogLine(kFixedTime, "/opt/java/21");
    // yyyy-MM-dd HH:mm:ss | JAVA_HOME set to <path>
    ASSERT_EQ(line.size(), 19u + std::string(" | JAVA_HOME set to /opt/java/21").size());
    EXPECT_EQ(line[4], '-');
    EXPECT_EQ(line[10], ' ');
    EXPECT_EQ(line[13], ':');
    EXPECT_EQ(line.substr(19), " | JAVA_HOME set to /opt/java/21");
}

TEST(SwitchLogTest, AppendsOneLinePerCall) {
    testutil::TemporaryDirectory tmp;
    ASSERT_TRUE(jswitch::AppendSwitchLog(tmp.Path(), "/a", kFixedTime).ok);
    ASSERT_TRUE(jswitch::AppendSwitchLog(tmp.Path(), "/b", kFixedTime).ok);

    const std::string log = testutil::ReadFile(tmp.Path() + "/java-switcher.log");
    EXPECT_EQ(log,
              jswitch::FormatSwitchLogLine(kFixedTime, "/a") + "\n" +
              jswitch::FormatSwitchLogLine(kFixedTime, "/b") + "\n");
}

} // namespace
