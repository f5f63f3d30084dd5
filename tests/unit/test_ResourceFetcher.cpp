#include <gtest/gtest.h>
#include "cache/TTLCache.hpp"
#include "cache/keys.hpp"
#include "cloud/ResourceFetcher.hpp"
#include "support/FakeResourceSource.hpp"

#include <chrono>
#include <thread>

using namespace lv::cloud;
using namespace lv::model;
using lv::test::FakeResourceSource;
using lv::test::makeAccount;
using lv::test::makeApp;
using lv::test::makeVault;

class ResourceFetcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        source.accounts = {makeAccount("sub-1", "dev-payments")};
        source.resources["sub-1"] = {vault, app};
        source.values[vault.key()] = {{"db-password", "hunter2"}, {"api-key", "abc"}};
        source.values[app.key()] = {{"redis", "r3d1s"}};
    }

    Resource vault = makeVault("kv-payments", "sub-1");
    Resource app = makeApp("ca-payments", "sub-1");
    FakeResourceSource source;
    lv::cache::TTLCache cache;
    ResourceFetcher fetcher{cache, source};
};

TEST_F(ResourceFetcherTest, SecondReadComesFromCache) {
    const auto first = fetcher.accounts();
    ASSERT_TRUE(first.ok());
    EXPECT_FALSE(first.fromCache());

    const auto second = fetcher.accounts();
    ASSERT_TRUE(second.ok());
    EXPECT_TRUE(second.fromCache());
    EXPECT_EQ(source.accountCalls.load(), 1);
    EXPECT_TRUE(fetcher.areAccountsCached());
}

TEST_F(ResourceFetcherTest, FailuresAreNotCached) {
    source.accountError = Error{ErrorKind::NetworkOrThrottling, "timed out"};
    EXPECT_FALSE(fetcher.accounts().ok());
    EXPECT_FALSE(fetcher.areAccountsCached());

    source.accountError.reset();
    EXPECT_TRUE(fetcher.accounts().ok());
    EXPECT_EQ(source.accountCalls.load(), 2);
}

TEST_F(ResourceFetcherTest, ResourcesCachedPerSubscription) {
    const auto sub = makeAccount("sub-1", "dev-payments");
    EXPECT_FALSE(fetcher.areResourcesCached("sub-1"));
    ASSERT_TRUE(fetcher.resources(sub).ok());
    EXPECT_TRUE(fetcher.areResourcesCached("sub-1"));
    EXPECT_FALSE(fetcher.areResourcesCached("sub-2"));

    fetcher.invalidateResources("sub-1");
    EXPECT_FALSE(fetcher.areResourcesCached("sub-1"));
}

TEST_F(ResourceFetcherTest, ResourcesMergeBothProvidersSorted) {
    const auto r = fetcher.resources(makeAccount("sub-1", "dev-payments"));
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(r.value().size(), 2u);
    EXPECT_EQ(r.value()[0].name, "kv-payments");
    EXPECT_EQ(r.value()[1].name, "ca-payments");
    EXPECT_FALSE(r.partialError().has_value());
    EXPECT_EQ(source.resourceCalls.load(), 2);
}

TEST_F(ResourceFetcherTest, OneProviderFailingReturnsOtherWithPartialError) {
    const auto sub = makeAccount("sub-1", "dev-payments");
    source.providerErrors.insert_or_assign({"sub-1", ResourceKind::KeyVault},
                                           Error{ErrorKind::NetworkOrThrottling, "HTTP 429: too many requests"});

    const auto partial = fetcher.resources(sub);
    ASSERT_TRUE(partial.ok());
    ASSERT_EQ(partial.value().size(), 1u);
    EXPECT_EQ(partial.value()[0].name, "ca-payments");
    EXPECT_FALSE(partial.fromCache());
    ASSERT_TRUE(partial.partialError().has_value());
    EXPECT_EQ(partial.partialError()->kind, ErrorKind::NetworkOrThrottling);
    EXPECT_NE(partial.partialError()->message.find("Key Vault"), std::string::npos);
    EXPECT_FALSE(fetcher.areResourcesCached("sub-1"));
    EXPECT_FALSE(fetcher.cachedResources("sub-1").has_value());

    // the failed half is fetched again once the provider recovers; the other half comes from cache
    source.providerErrors.clear();
    const auto recovered = fetcher.resources(sub);
    ASSERT_TRUE(recovered.ok());
    EXPECT_EQ(recovered.value().size(), 2u);
    EXPECT_FALSE(recovered.partialError().has_value());
    EXPECT_EQ(source.resourceCalls.load(), 3);
    EXPECT_TRUE(fetcher.areResourcesCached("sub-1"));
}

TEST_F(ResourceFetcherTest, BothProvidersFailingIsAnError) {
    source.resourceErrors.insert_or_assign("sub-1", Error{ErrorKind::AccessDenied, "Forbidden"});
    const auto r = fetcher.resources(makeAccount("sub-1", "dev-payments"));
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().kind, ErrorKind::AccessDenied);
}

TEST_F(ResourceFetcherTest, CachedReadersNeverCallTheSource) {
    EXPECT_FALSE(fetcher.cachedAccounts().has_value());
    EXPECT_FALSE(fetcher.cachedResources("sub-1").has_value());
    EXPECT_FALSE(fetcher.cachedSecrets(vault).has_value());
    EXPECT_EQ(source.accountCalls.load(), 0);
    EXPECT_EQ(source.resourceCalls.load(), 0);
    EXPECT_EQ(source.secretCalls.load(), 0);

    ASSERT_TRUE(fetcher.resources(makeAccount("sub-1", "dev-payments")).ok());
    const auto cached = fetcher.cachedResources("sub-1");
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(cached->size(), 2u);
    EXPECT_EQ(source.resourceCalls.load(), 2);
}

TEST_F(ResourceFetcherTest, ConcurrentResourceLoadsShareOneFetch) {
    const auto sub = makeAccount("sub-1", "dev-payments");
    source.closeGate("sub-1");

    std::thread first([&] { EXPECT_TRUE(fetcher.resources(sub).ok()); });
    std::thread second([&] { EXPECT_TRUE(fetcher.resources(sub).ok()); });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    source.openGate("sub-1");
    first.join();
    second.join();

    EXPECT_EQ(source.resourceCalls.load(), 2); // one call per provider
}

TEST_F(ResourceFetcherTest, KeyVaultValueFetchedOnce) {
    const auto v = fetcher.secretValue(vault, "db-password");
    ASSERT_TRUE(v.ok());
    EXPECT_EQ(v.value().value, "hunter2");
    EXPECT_TRUE(fetcher.secretValue(vault, "db-password").fromCache());
    EXPECT_EQ(source.valueCalls.load(), 1);
}

TEST_F(ResourceFetcherTest, MissingKeyVaultSecretIsNotFound) {
    const auto v = fetcher.secretValue(vault, "nope");
    ASSERT_FALSE(v.ok());
    EXPECT_EQ(v.error().kind, ErrorKind::NotFound);
    EXPECT_FALSE(fetcher.cachedSecretValue(vault, "nope").has_value());
}

TEST_F(ResourceFetcherTest, ContainerAppListingCachesValues) {
    ASSERT_TRUE(fetcher.secrets(app).ok());
    const auto cached = fetcher.cachedSecretValue(app, "redis");
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(cached->value, "r3d1s");

    const auto v = fetcher.secretValue(app, "redis");
    ASSERT_TRUE(v.ok());
    EXPECT_TRUE(v.fromCache());
    EXPECT_EQ(source.valueCalls.load(), 0);
    EXPECT_EQ(source.secretCalls.load(), 1);
}

TEST_F(ResourceFetcherTest, ContainerAppValueWithoutListingLoadsListing) {
    const auto v = fetcher.secretValue(app, "redis");
    ASSERT_TRUE(v.ok());
    EXPECT_EQ(v.value().value, "r3d1s");
    EXPECT_EQ(source.secretCalls.load(), 1);

    const auto missing = fetcher.secretValue(app, "nope");
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error().kind, ErrorKind::NotFound);
}

TEST_F(ResourceFetcherTest, KeyVaultListingCarriesNoValues) {
    const auto list = fetcher.secrets(vault);
    ASSERT_TRUE(list.ok());
    ASSERT_EQ(list.value().size(), 2u);
    for (const auto& s : list.value()) EXPECT_FALSE(s.value.has_value());
    EXPECT_FALSE(fetcher.cachedSecretValue(vault, "api-key").has_value());
}

TEST_F(ResourceFetcherTest, SuccessfulMutationInvalidatesListingAndValues) {
    ASSERT_TRUE(fetcher.secrets(vault).ok());
    ASSERT_TRUE(fetcher.secretValue(vault, "api-key").ok());

    const auto r = fetcher.apply(SecretMutation::set(vault, "api-key", "xyz"));
    ASSERT_TRUE(r.success);
    EXPECT_FALSE(fetcher.areSecretsCached(vault));
    EXPECT_FALSE(fetcher.cachedSecretValue(vault, "api-key").has_value());

    EXPECT_EQ(fetcher.secretValue(vault, "api-key").value().value, "xyz");
}

TEST_F(ResourceFetcherTest, FailedMutationKeepsCache) {
    ASSERT_TRUE(fetcher.secrets(vault).ok());
    source.mutationError = Error{ErrorKind::AccessDenied, "Forbidden"};

    const auto r = fetcher.apply(SecretMutation::remove(vault, "api-key"));
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error.kind, ErrorKind::AccessDenied);
    EXPECT_TRUE(fetcher.areSecretsCached(vault));
}

TEST_F(ResourceFetcherTest, MutationLeavesOtherResourcesCached) {
    const auto other = makeVault("kv-payments-2", "sub-1");
    source.values[other.key()] = {{"x", "1"}};
    ASSERT_TRUE(fetcher.secrets(other).ok());
    ASSERT_TRUE(fetcher.secretValue(other, "x").ok());

    ASSERT_TRUE(fetcher.apply(SecretMutation::create(vault, "new", "v")).success);
    EXPECT_TRUE(fetcher.areSecretsCached(other));
    EXPECT_TRUE(fetcher.cachedSecretValue(other, "x").has_value());
}

TEST_F(ResourceFetcherTest, ClearDropsEverything) {
    ASSERT_TRUE(fetcher.accounts().ok());
    ASSERT_TRUE(fetcher.secrets(vault).ok());
    fetcher.clear();
    EXPECT_FALSE(fetcher.areAccountsCached());
    EXPECT_FALSE(fetcher.areSecretsCached(vault));
}

TEST(CacheKeysTest, KindPrefixKeepsNamesApart) {
    const auto vault = makeVault("shared", "s");
    const auto app = makeApp("shared", "s");
    EXPECT_NE(lv::cache::keys::secrets(vault), lv::cache::keys::secrets(app));
    EXPECT_EQ(lv::cache::keys::secretValue(vault, "a"), "secretvalue:kv/shared:a");
    EXPECT_EQ(lv::cache::keys::resources("sub-1", ResourceKind::KeyVault), "vaults:sub-1");
    EXPECT_EQ(lv::cache::keys::resources("sub-1", ResourceKind::ContainerApp), "containerapps:sub-1");
}
