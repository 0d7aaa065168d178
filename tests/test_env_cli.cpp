#include <gtest/gtest.h>
#include "temp_dir.hpp"
#include <cli/env_cli.hpp>
#include <core/errors.hpp>
#include <filesystem>
#include <fstream>
#include <cstdlib>

namespace fs = std::filesystem;

// ── Argument parsing ────────────────────────────────────────

TEST(EnvCLIParseTest, AliasOnly) {
    auto opts = EnvCLI::parse_args({"test"});
    EXPECT_EQ(opts.alias, "test");
    EXPECT_TRUE(opts.cluster_id.empty());
    EXPECT_FALSE(opts.reset);
    EXPECT_FALSE(opts.temporary);
}

TEST(EnvCLIParseTest, ShortAndLongValuedFlags) {
    auto opts = EnvCLI::parse_args({"-c", "abc123", "--external-id", "ext", "--base-domain=example.com"});
    EXPECT_EQ(opts.cluster_id, "abc123");
    EXPECT_EQ(opts.external_id, "ext");
    EXPECT_EQ(opts.base_domain, "example.com");
    EXPECT_TRUE(opts.alias.empty());
}

TEST(EnvCLIParseTest, IndividualClusterLogin) {
    auto opts = EnvCLI::parse_args({"dev", "-u", "testuser", "--password=s3cr=t", "-a", "https://api.test.com:6443"});
    EXPECT_EQ(opts.alias, "dev");
    EXPECT_EQ(opts.username, "testuser");
    EXPECT_EQ(opts.password, "s3cr=t");
    EXPECT_EQ(opts.url, "https://api.test.com:6443");
}

TEST(EnvCLIParseTest, Switches) {
    auto opts = EnvCLI::parse_args({"--reset", "-t", "-e", "-v", "-k", "/tmp/kc", "work"});
    EXPECT_TRUE(opts.reset);
    EXPECT_TRUE(opts.temporary);
    EXPECT_TRUE(opts.export_kubeconfig);
    EXPECT_TRUE(opts.verbose);
    EXPECT_FALSE(opts.remove);
    EXPECT_EQ(opts.kubeconfig, "/tmp/kc");
    EXPECT_EQ(opts.alias, "work");

    EXPECT_TRUE(EnvCLI::parse_args({"-d", "work"}).remove);
}

TEST(EnvCLIParseTest, UsageErrors) {
    EXPECT_THROW(EnvCLI::parse_args({"--bogus"}), UsageError);
    EXPECT_THROW(EnvCLI::parse_args({"-c"}), UsageError);
    EXPECT_THROW(EnvCLI::parse_args({"one", "two"}), UsageError);
    EXPECT_THROW(EnvCLI::parse_args({"--reset=yes"}), UsageError);
}

// ── Run ─────────────────────────────────────────────────────

class EnvCLIRunTest : public ::testing::Test {
protected:
    fs::path test_dir;
    std::string saved_home;
    std::string saved_root;
    bool had_home = false;
    bool had_root = false;

    void SetUp() override {
        test_dir = unique_temp_dir("ocenv_cli_test");
        fs::remove_all(test_dir);
        fs::create_directories(test_dir / "home");

        if (const char* h = std::getenv("HOME")) { had_home = true; saved_home = h; }
        if (const char* r = std::getenv("OCENV_ROOT")) { had_root = true; saved_root = r; }
        setenv("HOME", (test_dir / "home").c_str(), 1);
        setenv("OCENV_ROOT", (test_dir / "envs").c_str(), 1);
    }

    void TearDown() override {
        if (had_home) setenv("HOME", saved_home.c_str(), 1); else unsetenv("HOME");
        if (had_root) setenv("OCENV_ROOT", saved_root.c_str(), 1); else unsetenv("OCENV_ROOT");
        fs::remove_all(test_dir);
    }
};

TEST_F(EnvCLIRunTest, ExportCreatesWorkspaceAndPrintsLine) {
    auto opts = EnvCLI::parse_args({"-c", "test-cluster", "-e"});

    testing::internal::CaptureStdout();
    int code = EnvCLI().run(opts);
    std::string out = testing::internal::GetCapturedStdout();

    EXPECT_EQ(code, 0);
    auto root = test_dir / "envs" / "test-cluster";
    EXPECT_NE(out.find("export KUBECONFIG=" + (root / "kubeconfig.json").string()), std::string::npos);
    EXPECT_TRUE(fs::exists(root / ".ocenv"));
    EXPECT_TRUE(fs::exists(root / "bin" / "ocl"));
}

TEST_F(EnvCLIRunTest, DeleteRemovesWorkspace) {
    auto root = test_dir / "envs" / "work";
    fs::create_directories(root / "bin");
    std::ofstream(root / ".ocenv") << "KUBECONFIG=x\n";

    testing::internal::CaptureStdout();
    int code = EnvCLI().run(EnvCLI::parse_args({"-d", "work"}));
    testing::internal::GetCapturedStdout();

    EXPECT_EQ(code, 0);
    EXPECT_FALSE(fs::exists(root));
}

TEST_F(EnvCLIRunTest, FailedTemporarySetupRemovesWorkspace) {
    auto opts = EnvCLI::parse_args({"-t", "-k", (test_dir / "missing-kubeconfig").string(), "scratch"});
    EXPECT_THROW(EnvCLI().run(opts), SetupError);
    EXPECT_FALSE(fs::exists(test_dir / "envs" / "scratch"));
}

TEST_F(EnvCLIRunTest, FailedSetupKeepsPersistentWorkspace) {
    auto opts = EnvCLI::parse_args({"-k", (test_dir / "missing-kubeconfig").string(), "kept"});
    EXPECT_THROW(EnvCLI().run(opts), SetupError);
    EXPECT_TRUE(fs::exists(test_dir / "envs" / "kept" / ".ocenv"));
}

TEST_F(EnvCLIRunTest, MissingAliasFails) {
    EXPECT_THROW(EnvCLI().run(EnvCLI::parse_args({})), SetupError);
}

TEST_F(EnvCLIRunTest, MalformedConfigFails) {
    fs::create_directories(test_dir / "home" / ".config" / "ocenv");
    std::ofstream(test_dir / "home" / ".config" / "ocenv" / "config.yaml") << "shell: [unclosed\n";

    testing::internal::CaptureStderr();
    int code = EnvCLI().run(EnvCLI::parse_args({"work"}));
    testing::internal::GetCapturedStderr();

    EXPECT_EQ(code, 1);
    EXPECT_FALSE(fs::exists(test_dir / "envs" / "work"));
}
