#include <gtest/gtest.h>
#include "temp_dir.hpp"
#include <core/config.hpp>
#include <platform/platform.hpp>
#include <filesystem>
#include <fstream>
#include <cstdlib>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        unsetenv("OCENV_ROOT");
        test_dir = unique_temp_dir("ocenv_config_test");
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    fs::path write_config(const std::string& content) {
        auto path = test_dir / "config.yaml";
        std::ofstream(path) << content;
        return path;
    }
};

TEST_F(ConfigTest, MissingFileYieldsDefaults) {
    auto result = Config::load_file(test_dir / "nope.yaml");
    ASSERT_TRUE(result.is_ok());
    const auto& config = result.value;
    EXPECT_EQ(config.envs_root(), platform::home_dir() / "ocenv");
    EXPECT_EQ(config.shell(), "");
    EXPECT_EQ(config.tools().ocm, "ocm");
    EXPECT_EQ(config.tools().oc, "oc");
    EXPECT_EQ(config.tools().login_script, "");
    EXPECT_EQ(config.prometheus().ns, "openshift-monitoring");
    EXPECT_EQ(config.prometheus().port, 9091);
    EXPECT_FALSE(config.verbose());
}

TEST_F(ConfigTest, ParsesAllKeys) {
    auto path = write_config(
        "envs_root: /srv/envs\n"
        "shell: /bin/zsh\n"
        "browser: firefox\n"
        "ocm_binary: /opt/ocm\n"
        "oc_binary: kubectl\n"
        "login_script: /opt/login.sh\n"
        "verbose: true\n"
        "prometheus:\n"
        "  namespace: monitoring\n"
        "  service: prom\n"
        "  port: 9999\n"
        "  local_port: 8080\n");

    auto result = Config::load_file(path);
    ASSERT_TRUE(result.is_ok()) << result.error;
    const auto& config = result.value;
    EXPECT_EQ(config.envs_root(), fs::path("/srv/envs"));
    EXPECT_EQ(config.shell(), "/bin/zsh");
    EXPECT_EQ(config.browser(), "firefox");
    EXPECT_EQ(config.tools().ocm, "/opt/ocm");
    EXPECT_EQ(config.tools().oc, "kubectl");
    EXPECT_EQ(config.tools().login_script, "/opt/login.sh");
    EXPECT_TRUE(config.verbose());
    EXPECT_EQ(config.prometheus().ns, "monitoring");
    EXPECT_EQ(config.prometheus().service, "prom");
    EXPECT_EQ(config.prometheus().port, 9999);
    EXPECT_EQ(config.prometheus().local_port, 8080);
}

TEST_F(ConfigTest, TildeExpandsToHome) {
    auto path = write_config("envs_root: ~/clusters\n");
    auto result = Config::load_file(path);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value.envs_root(), platform::home_dir() / "clusters");
}

TEST_F(ConfigTest, EnvironmentVariableOverridesRoot) {
    setenv("OCENV_ROOT", "/tmp/ocenv-override", 1);
    auto path = write_config("envs_root: /srv/envs\n");
    auto result = Config::load_file(path);
    unsetenv("OCENV_ROOT");
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value.envs_root(), fs::path("/tmp/ocenv-override"));
}

TEST_F(ConfigTest, MalformedYamlIsAnError) {
    auto path = write_config("prometheus: [unclosed\n");
    auto result = Config::load_file(path);
    EXPECT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("config.yaml"), std::string::npos);
}
