#include <gtest/gtest.h>
#include <core/credentials.hpp>
#include <core/errors.hpp>

TEST(Credentials, NoLoginDataResolvesToNothing) {
    EnvOptions opts;
    opts.alias = "test-env";
    EXPECT_FALSE(resolve_credentials(opts).has_value());
    EXPECT_EQ(mode_name(resolve_credentials(opts)), "none");
}

TEST(Credentials, ClusterIdSelectsTokenMode) {
    EnvOptions opts;
    opts.cluster_id = "test-cluster";
    opts.external_id = "ext-1";
    opts.base_domain = "example.com";
    auto creds = resolve_credentials(opts);
    ASSERT_TRUE(creds.has_value());
    const auto* token = std::get_if<TokenLogin>(&*creds);
    ASSERT_NE(token, nullptr);
    EXPECT_EQ(token->cluster_id, "test-cluster");
    EXPECT_EQ(token->external_id, "ext-1");
    EXPECT_EQ(token->base_domain, "example.com");
    EXPECT_EQ(cluster_id_of(creds), "test-cluster");
}

TEST(Credentials, ClusterIdBeatsEverythingElse) {
    EnvOptions opts;
    opts.cluster_id = "test-cluster";
    opts.kubeconfig = "/tmp/kc";
    opts.username = "testuser";
    opts.password = "testpass";
    auto creds = resolve_credentials(opts);
    ASSERT_TRUE(creds.has_value());
    EXPECT_TRUE(std::holds_alternative<TokenLogin>(*creds));
}

TEST(Credentials, KubeconfigBeatsUsername) {
    EnvOptions opts;
    opts.kubeconfig = "/tmp/kc";
    opts.username = "testuser";
    auto creds = resolve_credentials(opts);
    ASSERT_TRUE(creds.has_value());
    ASSERT_TRUE(std::holds_alternative<KubeconfigLogin>(*creds));
    EXPECT_EQ(std::get<KubeconfigLogin>(*creds).source, "/tmp/kc");
    EXPECT_EQ(cluster_id_of(creds), "");
}

TEST(Credentials, UsernameWithUrlSelectsUserMode) {
    EnvOptions opts;
    opts.username = "testuser";
    opts.url = "https://api.test.com:6443";
    auto creds = resolve_credentials(opts);
    ASSERT_TRUE(creds.has_value());
    const auto* user = std::get_if<UserLogin>(&*creds);
    ASSERT_NE(user, nullptr);
    EXPECT_EQ(user->username(), "testuser");
    EXPECT_EQ(user->url(), "https://api.test.com:6443");
    EXPECT_FALSE(user->password().has_value());
    EXPECT_EQ(mode_name(creds), "user");
}

TEST(Credentials, UsernameWithoutUrlIsAContractViolation) {
    EnvOptions opts;
    opts.username = "testuser";
    EXPECT_THROW(resolve_credentials(opts), ContractViolation);
}

TEST(Credentials, UserLoginCannotBeBuiltWithoutUrl) {
    EXPECT_THROW(UserLogin("", "testuser"), ContractViolation);
    EXPECT_THROW(UserLogin("", "testuser", std::string("testpass")), ContractViolation);
}

TEST(Credentials, EmptyPasswordIsNoPassword) {
    UserLogin login("https://api.test.com:6443", "testuser", std::string(""));
    EXPECT_FALSE(login.password().has_value());
}
