#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>

#include "core/engine_bootstrap.h"
#include "test_support.h"

using namespace wcache;
using namespace wcache::test;
namespace fs = std::filesystem;

namespace {

const std::string kLargePayload = "large-v3 test weights";
const std::string kMediumPayload = "medium test weights";
const std::string kSmallPayload = "small test weights";

MemoryProvider fixedMemory(uint64_t ram_mib, uint64_t swap_mib = 0) {
    return [ram_mib, swap_mib]() {
        return MemoryInfo{ram_mib * 1024 * 1024, swap_mib * 1024 * 1024};
    };
}

class EngineBootstrapTest : public ::testing::Test {
protected:
    EngineBootstrapTest()
        : catalog(catalogWithPayloads({{ModelId::LargeV3, kLargePayload},
                                       {ModelId::Medium, kMediumPayload},
                                       {ModelId::Small, kSmallPayload}})) {}

    void useTransport(ScriptedTransport::Handler handler) {
        transport = std::make_shared<ScriptedTransport>(std::move(handler));
        cache = std::make_unique<ModelCacheManager>(temp.path / "models", transport);
        cache->setBackoff(std::chrono::milliseconds(0));
    }

    void place(ModelId id, const std::string& content) {
        fs::create_directories(cache->cacheDir());
        writeFile(cache->modelPath(catalog.entryFor(id)), content);
    }

    std::unique_ptr<EngineBootstrap> makeBootstrap(MemoryProvider memory) {
        return std::make_unique<EngineBootstrap>(*cache, catalog, std::move(memory), 0.75, 2);
    }

    TempDir temp;
    ModelCatalog catalog;
    std::shared_ptr<ScriptedTransport> transport;
    std::unique_ptr<ModelCacheManager> cache;
};

}  // namespace

TEST(BootstrapStateTest, NamesAreStable) {
    EXPECT_STREQ(to_string(BootstrapState::Init), "init");
    EXPECT_STREQ(to_string(BootstrapState::MemoryChecked), "memory_checked");
    EXPECT_STREQ(to_string(BootstrapState::Downgraded), "downgraded");
    EXPECT_STREQ(to_string(BootstrapState::Validated), "validated");
    EXPECT_STREQ(to_string(BootstrapState::Ready), "ready");
    EXPECT_STREQ(to_string(BootstrapState::Failed), "failed");
}

TEST_F(EngineBootstrapTest, DowngradesLargeToMediumWhenBudgetIsShort) {
    useTransport(serving(kMediumPayload));
    place(ModelId::Medium, kMediumPayload);
    auto bootstrap = makeBootstrap(fixedMemory(4000));

    auto result = bootstrap->bootstrap(ModelId::LargeV3);

    ASSERT_TRUE(result.ok()) << result.error.message;
    EXPECT_EQ(result.data->entry.id, ModelId::Medium);
    EXPECT_EQ(result.data->requested, ModelId::LargeV3);
    EXPECT_TRUE(result.data->downgraded);
    EXPECT_EQ(result.data->path, cache->modelPath(catalog.entryFor(ModelId::Medium)));
    EXPECT_EQ(bootstrap->state(), BootstrapState::Ready);
    const std::vector<BootstrapState> expected{BootstrapState::Init, BootstrapState::MemoryChecked,
                                               BootstrapState::Downgraded, BootstrapState::Validated,
                                               BootstrapState::Ready};
    EXPECT_EQ(bootstrap->history(), expected);
    EXPECT_EQ(transport->calls(), 0);
}

TEST_F(EngineBootstrapTest, KeepsRequestedTierWhenItFits) {
    useTransport(serving(kSmallPayload));
    place(ModelId::Small, kSmallPayload);
    auto bootstrap = makeBootstrap(fixedMemory(8192, 2048));

    auto result = bootstrap->bootstrap(ModelId::Small);

    ASSERT_TRUE(result.ok()) << result.error.message;
    EXPECT_EQ(result.data->entry.id, ModelId::Small);
    EXPECT_FALSE(result.data->downgraded);
    const std::vector<BootstrapState> expected{BootstrapState::Init, BootstrapState::MemoryChecked,
                                               BootstrapState::Validated, BootstrapState::Ready};
    EXPECT_EQ(bootstrap->history(), expected);
}

TEST_F(EngineBootstrapTest, SwapCountsTowardsTheBudget) {
    useTransport(serving(kLargePayload));
    place(ModelId::LargeV3, kLargePayload);
    // 3000 MiB RAM alone gives 2250 MiB; with 3000 MiB swap it is 4500.
    auto bootstrap = makeBootstrap(fixedMemory(3000, 3000));

    auto result = bootstrap->bootstrap(ModelId::LargeV3);

    ASSERT_TRUE(result.ok()) << result.error.message;
    EXPECT_EQ(result.data->entry.id, ModelId::LargeV3);
    EXPECT_FALSE(result.data->downgraded);
}

TEST_F(EngineBootstrapTest, InsufficientMemoryWhenSmallestTierDoesNotFit) {
    useTransport(serving(kSmallPayload));
    place(ModelId::Small, kSmallPayload);
    auto bootstrap = makeBootstrap(fixedMemory(1000));

    auto result = bootstrap->bootstrap(ModelId::LargeV3);

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error.kind, CacheErrorKind::InsufficientMemory);
    ASSERT_TRUE(result.error.model.has_value());
    EXPECT_EQ(*result.error.model, ModelId::Small);
    EXPECT_EQ(bootstrap->state(), BootstrapState::Failed);
    EXPECT_FALSE(bootstrap->active().has_value());
    EXPECT_EQ(bootstrap->history().back(), BootstrapState::Failed);
}

TEST_F(EngineBootstrapTest, MissingModelIsReportedWithoutDownloading) {
    useTransport(serving(kSmallPayload));
    auto bootstrap = makeBootstrap(fixedMemory(16384));

    auto result = bootstrap->bootstrap(ModelId::Small);

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error.kind, CacheErrorKind::ModelNotFound);
    EXPECT_EQ(transport->calls(), 0);
    EXPECT_EQ(bootstrap->state(), BootstrapState::Failed);
}

TEST_F(EngineBootstrapTest, CorruptModelIsDownloadedAgain) {
    useTransport(serving(kSmallPayload));
    place(ModelId::Small, std::string(kSmallPayload.size(), '#'));
    auto bootstrap = makeBootstrap(fixedMemory(16384));

    auto result = bootstrap->bootstrap(ModelId::Small);

    ASSERT_TRUE(result.ok()) << result.error.message;
    EXPECT_EQ(transport->calls(), 1);
    EXPECT_EQ(readFile(result.data->path), kSmallPayload);
    EXPECT_TRUE(cache->isAvailable(catalog.entryFor(ModelId::Small), true));
}

TEST_F(EngineBootstrapTest, FailedRecoveryReportsDownloadFailed) {
    useTransport(failingWith(FetchStatus::TransportError));
    place(ModelId::Small, "truncated");
    auto bootstrap = makeBootstrap(fixedMemory(16384));

    auto result = bootstrap->bootstrap(ModelId::Small);

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error.kind, CacheErrorKind::DownloadFailed);
    EXPECT_EQ(result.error.cause, CacheErrorKind::NetworkError);
    EXPECT_EQ(transport->calls(), 3);
    EXPECT_EQ(bootstrap->state(), BootstrapState::Failed);
}

TEST_F(EngineBootstrapTest, SwitchModelSkipsMemoryCheck) {
    useTransport(serving(kLargePayload));
    place(ModelId::LargeV3, kLargePayload);
    auto bootstrap = makeBootstrap(fixedMemory(1000));

    auto result = bootstrap->switchModel(ModelId::LargeV3);

    ASSERT_TRUE(result.ok()) << result.error.message;
    EXPECT_EQ(result.data->entry.id, ModelId::LargeV3);
    EXPECT_FALSE(result.data->downgraded);
    const std::vector<BootstrapState> expected{BootstrapState::Init, BootstrapState::Validated,
                                               BootstrapState::Ready};
    EXPECT_EQ(bootstrap->history(), expected);
}

TEST_F(EngineBootstrapTest, FailedSwitchKeepsPreviousSelection) {
    useTransport(serving(kSmallPayload));
    place(ModelId::Small, kSmallPayload);
    auto bootstrap = makeBootstrap(fixedMemory(16384));

    ASSERT_TRUE(bootstrap->bootstrap(ModelId::Small).ok());
    auto switched = bootstrap->switchModel(ModelId::Medium);

    ASSERT_FALSE(switched.ok());
    EXPECT_EQ(switched.error.kind, CacheErrorKind::ModelNotFound);
    ASSERT_TRUE(bootstrap->active().has_value());
    EXPECT_EQ(bootstrap->active()->entry.id, ModelId::Small);
    EXPECT_EQ(bootstrap->state(), BootstrapState::Failed);
}

TEST_F(EngineBootstrapTest, UnknownMemoryTotalSkipsBudget) {
    useTransport(serving(kLargePayload));
    place(ModelId::LargeV3, kLargePayload);
    auto bootstrap = makeBootstrap([]() { return MemoryInfo{}; });

    auto result = bootstrap->bootstrap(ModelId::LargeV3);

    ASSERT_TRUE(result.ok()) << result.error.message;
    EXPECT_EQ(result.data->entry.id, ModelId::LargeV3);
    EXPECT_FALSE(result.data->downgraded);
}

TEST_F(EngineBootstrapTest, AsyncBootstrapDeliversResult) {
    useTransport(serving(kMediumPayload));
    place(ModelId::Medium, kMediumPayload);
    auto bootstrap = makeBootstrap(fixedMemory(4000));

    auto future = bootstrap->bootstrapAsync(ModelId::LargeV3);
    auto result = future.get();

    ASSERT_TRUE(result.ok()) << result.error.message;
    EXPECT_EQ(result.data->entry.id, ModelId::Medium);

    auto switched = bootstrap->switchModelAsync(ModelId::Medium).get();
    ASSERT_TRUE(switched.ok());
    EXPECT_FALSE(switched.data->downgraded);
}

TEST_F(EngineBootstrapTest, EnsureReadyHonoursMemoryFlag) {
    useTransport(serving(kLargePayload));
    place(ModelId::LargeV3, kLargePayload);
    place(ModelId::Medium, kMediumPayload);
    auto bootstrap = makeBootstrap(fixedMemory(4000));

    auto checked = bootstrap->ensureReady(ModelId::LargeV3);
    ASSERT_TRUE(checked.ok());
    EXPECT_EQ(checked.data->entry.id, ModelId::Medium);

    auto unchecked = bootstrap->ensureReady(ModelId::LargeV3, false);
    ASSERT_TRUE(unchecked.ok());
    EXPECT_EQ(unchecked.data->entry.id, ModelId::LargeV3);
}

TEST_F(EngineBootstrapTest, TierQueriesReflectCacheContents) {
    useTransport(serving(kSmallPayload));
    auto bootstrap = makeBootstrap(fixedMemory(16384));
    EXPECT_FALSE(bootstrap->isTierAvailable(ModelId::Small));
    EXPECT_TRUE(bootstrap->cachedTiers().empty());

    place(ModelId::Small, kSmallPayload);
    place(ModelId::Medium, "wrong size");

    EXPECT_TRUE(bootstrap->isTierAvailable(ModelId::Small));
    EXPECT_FALSE(bootstrap->isTierAvailable(ModelId::Medium));
    EXPECT_EQ(bootstrap->cachedTiers(), (std::set<ModelId>{ModelId::Small, ModelId::Medium}));
}
