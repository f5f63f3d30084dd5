#include <gtest/gtest.h>
#include "auth/CliTokenIssuer.hpp"
#include "auth/TokenError.hpp"
#include "cli/AzCli.hpp"
#include "support/FakeCommandRunner.hpp"

#include <algorithm>

using namespace lv::cli;
using namespace lv::cloud;
using lv::test::FakeCommandRunner;

namespace {

bool hasPair(const std::vector<std::string>& argv, const std::string& flag, const std::string& value) {
    const auto it = std::ranges::find(argv, flag);
    return it != argv.end() && std::next(it) != argv.end() && *std::next(it) == value;
}

lv::model::Resource containerApp() {
    lv::model::Resource r;
    r.kind = lv::model::ResourceKind::ContainerApp;
    r.name = "ca-api";
    r.resourceGroup = "rg-api";
    r.subscriptionId = "sub-1";
    return r;
}

}

class AzCliTest : public ::testing::Test {
protected:
    FakeCommandRunner runner;
    AzCli az{runner, "/usr/bin/az"};
};

TEST_F(AzCliTest, VersionIsFirstLine) {
    runner.push(0, "azure-cli                         2.61.0\n\ncore 2.61.0\n");
    const auto v = az.version();
    ASSERT_TRUE(v.ok());
    EXPECT_EQ(v.value(), "azure-cli                         2.61.0");
    EXPECT_EQ(runner.calls.front().front(), "/usr/bin/az");
}

TEST_F(AzCliTest, NotLoggedInWhenAccountShowFails) {
    runner.push(1, "", "ERROR: Please run 'az login' to setup account.");
    EXPECT_FALSE(az.isLoggedIn());
}

TEST_F(AzCliTest, ListAccountsParsesJson) {
    runner.push(0, R"([{"id":"s1","name":"dev","tenantId":"t1","user":{"name":"u","type":"user"}}])");
    const auto accounts = az.listAccounts();
    ASSERT_TRUE(accounts.ok());
    ASSERT_EQ(accounts.value().size(), 1u);
    EXPECT_EQ(accounts.value()[0].owner(), "u");
    EXPECT_TRUE(std::ranges::find(runner.calls.front(), "--all") != runner.calls.front().end());
}

TEST_F(AzCliTest, ListAccountsGarbageIsError) {
    runner.push(0, "not json");
    const auto accounts = az.listAccounts();
    ASSERT_FALSE(accounts.ok());
    EXPECT_EQ(accounts.error().kind, ErrorKind::Unknown);
}

TEST_F(AzCliTest, ListAccountsFailureIsClassified) {
    runner.push(1, "", "AADSTS70043: The refresh token has expired");
    const auto accounts = az.listAccounts();
    ASSERT_FALSE(accounts.ok());
    EXPECT_EQ(accounts.error().kind, ErrorKind::NotAuthenticated);
}

TEST_F(AzCliTest, AccessTokenPrefersEpochExpiry) {
    runner.push(0, R"({"accessToken":"eyJ0","expiresOn":"2030-01-01 00:00:00.000000","expires_on":1900000000,"tenant":"t1"})");
    const auto token = az.getAccessToken("https://vault.azure.net/.default", "t1");
    EXPECT_EQ(token.accessToken, "eyJ0");
    EXPECT_EQ(std::chrono::system_clock::to_time_t(token.expiresOn), 1900000000);

    const auto& argv = runner.calls.front();
    EXPECT_TRUE(hasPair(argv, "--resource", "https://vault.azure.net"));
    EXPECT_TRUE(hasPair(argv, "--tenant", "t1"));
}

TEST_F(AzCliTest, AccessTokenWithoutTenantOmitsFlag) {
    runner.push(0, R"({"accessToken":"x","expires_on":"1900000000"})");
    az.getAccessToken("https://management.azure.com/.default");
    EXPECT_TRUE(std::ranges::find(runner.calls.front(), "--tenant") == runner.calls.front().end());
}

TEST_F(AzCliTest, AccessTokenFailureThrowsTokenError) {
    runner.push(1, "", "ERROR: Please run 'az login' to setup account.");
    try {
        az.getAccessToken("https://vault.azure.net/.default", "t1");
        FAIL() << "expected TokenError";
    } catch (const lv::auth::TokenError& e) {
        EXPECT_EQ(e.error().kind, ErrorKind::NotAuthenticated);
    }
}

TEST_F(AzCliTest, CliIssuerForwardsTenantAndScope) {
    runner.push(0, R"({"accessToken":"abc","expires_on":1900000000})");
    lv::auth::CliTokenIssuer issuer(az);
    EXPECT_EQ(issuer.issue("t7", "https://management.azure.com/.default").accessToken, "abc");
    EXPECT_TRUE(hasPair(runner.calls.front(), "--tenant", "t7"));
    EXPECT_TRUE(hasPair(runner.calls.front(), "--resource", "https://management.azure.com"));
}

TEST_F(AzCliTest, ContainerAppSetMergesOneSecret) {
    runner.push(0, "");
    ASSERT_TRUE(az.setContainerAppSecret(containerApp(), "redis", "p=w").success);

    const auto& argv = runner.calls.front();
    EXPECT_TRUE(hasPair(argv, "secret", "set"));
    EXPECT_TRUE(hasPair(argv, "--name", "ca-api"));
    EXPECT_TRUE(hasPair(argv, "--resource-group", "rg-api"));
    EXPECT_TRUE(hasPair(argv, "--subscription", "sub-1"));
    EXPECT_TRUE(hasPair(argv, "--secrets", "redis=p=w"));
}

TEST_F(AzCliTest, ContainerAppRemoveFailureIsClassified) {
    runner.push(1, "", "(AuthorizationFailed) does not have authorization");
    const auto r = az.removeContainerAppSecret(containerApp(), "redis");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error.kind, ErrorKind::AccessDenied);
    EXPECT_TRUE(hasPair(runner.calls.front(), "--secret-names", "redis"));
}

TEST(AzCliStaticTest, ResourceFromScope) {
    EXPECT_EQ(AzCli::resourceFromScope("https://vault.azure.net/.default"), "https://vault.azure.net");
    EXPECT_EQ(AzCli::resourceFromScope("https://vault.azure.net"), "https://vault.azure.net");
}

TEST(AzCliStaticTest, LocateRejectsMissingConfiguredPath) {
    EXPECT_FALSE(AzCli::locate("/definitely/not/here/az").has_value());
}
