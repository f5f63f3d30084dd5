#include <gtest/gtest.h>
#include "model/Account.hpp"
#include "model/Resource.hpp"
#include "model/Secret.hpp"

#include <nlohmann/json.hpp>

using namespace lv::model;
using json = nlohmann::json;

TEST(AccountModelTest, ParsesAzAccountList) {
    const auto j = json::parse(R"([
        {"id":"s1","name":"dev-app","isDefault":true,"state":"Enabled","tenantId":"t1",
         "user":{"name":"alice@contoso.com","type":"user"}},
        {"id":"s2","name":"ops","state":"Enabled","tenantId":"t2"}
    ])");
    const auto accounts = accounts_from_json(j);
    ASSERT_EQ(accounts.size(), 2u);
    EXPECT_TRUE(accounts[0].isDefault);
    EXPECT_EQ(accounts[0].owner(), "alice@contoso.com");
    EXPECT_EQ(accounts[1].owner(), "t2");
}

TEST(AccountModelTest, RejectsNonArray) {
    EXPECT_THROW(accounts_from_json(json::object()), std::runtime_error);
}

TEST(AccountModelTest, OwnersAndSubscriptions) {
    std::vector<Account> accounts(3);
    accounts[0] = {"s1", "zeta", false, "Enabled", "t", {"bob", "user"}};
    accounts[1] = {"s2", "alpha", false, "Enabled", "t", {"alice", "user"}};
    accounts[2] = {"s3", "beta", false, "Enabled", "t", {"bob", "user"}};

    EXPECT_EQ(uniqueOwners(accounts), (std::vector<std::string>{"bob", "alice"}));

    const auto bobs = subscriptionsForOwner(accounts, "bob");
    ASSERT_EQ(bobs.size(), 2u);
    EXPECT_EQ(bobs[0].name, "beta");
    EXPECT_EQ(bobs[1].name, "zeta");
}

TEST(ResourceModelTest, ParsesKeyVaultRow) {
    const auto j = json::parse(R"({
        "id":"/subscriptions/sub-1/resourceGroups/RG-Core/providers/Microsoft.KeyVault/vaults/kv-core",
        "name":"kv-core","location":"westeurope",
        "properties":{"vaultUri":"https://kv-core.vault.azure.net/","tenantId":"t9"}
    })");
    const auto r = resource_from_json(j, ResourceKind::KeyVault, "");
    EXPECT_EQ(r.subscriptionId, "sub-1");
    EXPECT_EQ(r.resourceGroup, "RG-Core");
    EXPECT_EQ(r.vaultUri, "https://kv-core.vault.azure.net/");
    EXPECT_EQ(r.tenantId, "t9");
    EXPECT_EQ(r.key(), "kv/kv-core");
}

TEST(ResourceModelTest, ResourceGroupIsCaseInsensitive) {
    EXPECT_EQ(resourceGroupFromId("/subscriptions/x/resourcegroups/rg1/providers/a/b/c"), "rg1");
    EXPECT_EQ(resourceGroupFromId("/subscriptions/x"), "");
}

TEST(ResourceModelTest, VaultsSortBeforeApps) {
    std::vector<Resource> rs(3);
    rs[0].kind = ResourceKind::ContainerApp; rs[0].name = "a-app";
    rs[1].kind = ResourceKind::KeyVault; rs[1].name = "z-vault";
    rs[2].kind = ResourceKind::KeyVault; rs[2].name = "b-vault";
    sortResources(rs);
    EXPECT_EQ(rs[0].name, "b-vault");
    EXPECT_EQ(rs[1].name, "z-vault");
    EXPECT_EQ(rs[2].name, "a-app");
}

TEST(SecretModelTest, KeyVaultListingRow) {
    const auto j = json::parse(R"({
        "id":"https://kv.vault.azure.net/secrets/db-password",
        "contentType":"text/plain",
        "attributes":{"enabled":true,"created":1700000000,"updated":1700000100}
    })");
    const auto s = keyvault_secret_meta_from_json(j);
    EXPECT_EQ(s.name, "db-password");
    EXPECT_FALSE(s.value.has_value());
    EXPECT_EQ(s.enabled, std::optional<bool>(true));
    EXPECT_EQ(s.updated, std::optional<std::time_t>(1700000100));
    EXPECT_FALSE(s.expires.has_value());
}

TEST(SecretModelTest, KeyVaultValueWithVersion) {
    const auto j = json::parse(R"({
        "id":"https://kv.vault.azure.net/secrets/api-key/4387e9f3d6e14c459867679a90fd0f79",
        "value":"s3cr3t","attributes":{"exp":1800000000}
    })");
    const auto v = keyvault_secret_value_from_json(j);
    EXPECT_EQ(v.name, "api-key");
    EXPECT_EQ(v.value, "s3cr3t");
    EXPECT_EQ(v.expires, std::optional<std::time_t>(1800000000));
}

TEST(SecretModelTest, ContainerAppRowCarriesValue) {
    const auto s = containerapp_secret_from_json(json::parse(R"({"name":"redis","value":"pw"})"));
    EXPECT_EQ(s.name, "redis");
    EXPECT_EQ(s.value, std::optional<std::string>("pw"));
}

TEST(SecretModelTest, FilterIsCaseInsensitiveSubstring) {
    std::vector<SecretMeta> secrets(3);
    secrets[0].name = "DB-Password";
    secrets[1].name = "api-key";
    secrets[2].name = "db-user";

    const auto hits = filterSecrets(secrets, "db");
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].name, "DB-Password");
    EXPECT_EQ(hits[1].name, "db-user");
    EXPECT_EQ(filterSecrets(secrets, "").size(), 3u);
    EXPECT_TRUE(filterSecrets(secrets, "zzz").empty());
}
