#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>

#include "cli/command_context.h"
#include "cli/commands.h"
#include "test_support.h"

using namespace wcache;
using namespace wcache::cli;
using namespace wcache::test;
namespace fs = std::filesystem;

namespace {

class CliCommandsTest : public ::testing::Test {
protected:
    CommandContext makeContext(ScriptedTransport::Handler handler, const std::string& catalog_file = "") {
        transport = std::make_shared<ScriptedTransport>(std::move(handler));
        CacheConfig config;
        config.models_dir = (temp.path / "models").string();
        config.max_retries = 1;
        config.backoff = std::chrono::milliseconds(0);
        config.catalog_file = catalog_file;
        std::string error;
        auto ctx = makeCommandContext(config, transport, nullptr, &error);
        if (!ctx) throw std::runtime_error(error);
        return std::move(*ctx);
    }

    // Catalog file pinning tiny to a small payload.
    std::string writeTinyCatalog(const std::string& payload) {
        const auto path = temp.path / "catalog.json";
        nlohmann::json doc = {
            {"base_url", "http://models.test"},
            {"git_ref", "main"},
            {"models", {{{"id", "tiny"}, {"sha256", sha256_text(payload)}, {"size", payload.size()}}}},
        };
        writeFile(path, doc.dump());
        return path.string();
    }

    TempDir temp;
    std::shared_ptr<ScriptedTransport> transport;
};

const std::string kPayload = "tiny model bytes for command tests";

}  // namespace

TEST_F(CliCommandsTest, LoadCatalogDefaultsToBuiltin) {
    CacheConfig config;
    std::string error;
    auto catalog = loadCatalog(config, &error);
    ASSERT_TRUE(catalog.has_value()) << error;
    EXPECT_EQ(catalog->entryFor(ModelId::Small).remote_url,
              ModelCatalog::builtin().entryFor(ModelId::Small).remote_url);
}

TEST_F(CliCommandsTest, LoadCatalogRetargetsCustomBaseUrl) {
    CacheConfig config;
    config.base_url = "http://127.0.0.1:9000";
    auto catalog = loadCatalog(config);
    ASSERT_TRUE(catalog.has_value());
    EXPECT_EQ(catalog->entryFor(ModelId::Tiny).remote_url.rfind("http://127.0.0.1:9000/", 0), 0u);
}

TEST_F(CliCommandsTest, LoadCatalogAppliesBaseUrlToCatalogFile) {
    CacheConfig config;
    config.catalog_file = writeTinyCatalog(kPayload);
    config.base_url = "http://127.0.0.1:9000";
    std::string error;
    auto catalog = loadCatalog(config, &error);
    ASSERT_TRUE(catalog.has_value()) << error;
    EXPECT_EQ(catalog->entryFor(ModelId::Tiny).expected_sha256, sha256_text(kPayload));
    EXPECT_EQ(catalog->entryFor(ModelId::Tiny).remote_url,
              "http://127.0.0.1:9000/ggerganov/whisper.cpp/resolve/main/ggml-tiny.bin");
}

TEST_F(CliCommandsTest, LoadCatalogReportsBadFile) {
    CacheConfig config;
    config.catalog_file = (temp.path / "missing.json").string();
    std::string error;
    EXPECT_FALSE(loadCatalog(config, &error).has_value());
    EXPECT_NE(error.find("missing.json"), std::string::npos);
}

TEST_F(CliCommandsTest, PullDownloadsAndPrintsPath) {
    auto ctx = makeContext(serving(kPayload), writeTinyCatalog(kPayload));

    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    const int code = commands::pull(PullOptions{"tiny", std::nullopt}, ctx);
    const std::string out = testing::internal::GetCapturedStdout();
    testing::internal::GetCapturedStderr();

    EXPECT_EQ(code, 0);
    EXPECT_NE(out.find("ggml-tiny.bin"), std::string::npos);
    EXPECT_EQ(readFile(temp.path / "models" / "ggml-tiny.bin"), kPayload);
    ASSERT_EQ(transport->urls().size(), 1u);
    EXPECT_EQ(transport->urls()[0], "http://models.test/ggerganov/whisper.cpp/resolve/main/ggml-tiny.bin");
}

TEST_F(CliCommandsTest, PullFailureExitsOneWithRetries) {
    auto ctx = makeContext(failingWith(FetchStatus::TransportError), writeTinyCatalog(kPayload));

    testing::internal::CaptureStderr();
    const int code = commands::pull(PullOptions{"tiny", 2}, ctx);
    const std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(code, 1);
    EXPECT_EQ(transport->calls(), 3);
    EXPECT_NE(err.find("failed after retries"), std::string::npos);
}

TEST_F(CliCommandsTest, UnknownModelIsUsageError) {
    auto ctx = makeContext(serving(kPayload));

    testing::internal::CaptureStderr();
    const int code = commands::pull(PullOptions{"gigantic", std::nullopt}, ctx);
    const std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(code, 2);
    EXPECT_NE(err.find("unknown model 'gigantic'"), std::string::npos);
    EXPECT_NE(err.find("large-v3-turbo"), std::string::npos);
    EXPECT_EQ(transport->calls(), 0);
}

TEST_F(CliCommandsTest, StatusAndVerifyReportState) {
    auto ctx = makeContext(serving(kPayload), writeTinyCatalog(kPayload));

    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    EXPECT_EQ(commands::status(StatusOptions{"tiny", false}, ctx), 1);
    const std::string missing_err = testing::internal::GetCapturedStderr();
    const std::string missing_out = testing::internal::GetCapturedStdout();
    EXPECT_NE(missing_out.find("tiny: missing"), std::string::npos);
    EXPECT_NE(missing_err.find("wcache pull tiny"), std::string::npos);

    fs::create_directories(temp.path / "models");
    std::string tampered = kPayload;
    tampered[0] = '?';
    writeFile(temp.path / "models" / "ggml-tiny.bin", tampered);

    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    EXPECT_EQ(commands::status(StatusOptions{"tiny", false}, ctx), 0);
    EXPECT_EQ(commands::verify(ModelOptions{"tiny"}, ctx), 1);
    testing::internal::GetCapturedStderr();
    const std::string out = testing::internal::GetCapturedStdout();
    EXPECT_NE(out.find("tiny: present, size ok"), std::string::npos);
    EXPECT_NE(out.find("tiny: invalid"), std::string::npos);

    writeFile(temp.path / "models" / "ggml-tiny.bin", kPayload);
    testing::internal::CaptureStdout();
    EXPECT_EQ(commands::verify(ModelOptions{"tiny"}, ctx), 0);
    EXPECT_NE(testing::internal::GetCapturedStdout().find("tiny: valid"), std::string::npos);
}

TEST_F(CliCommandsTest, ListMarksCachedModels) {
    auto ctx = makeContext(serving(kPayload));
    fs::create_directories(temp.path / "models");
    writeFile(temp.path / "models" / "ggml-base.en.bin", "x");

    testing::internal::CaptureStdout();
    EXPECT_EQ(commands::list(ctx), 0);
    const std::string out = testing::internal::GetCapturedStdout();

    EXPECT_NE(out.find("NAME"), std::string::npos);
    const auto line_start = out.find("base.en ");
    ASSERT_NE(line_start, std::string::npos);
    const std::string line = out.substr(line_start, out.find('\n', line_start) - line_start);
    EXPECT_NE(line.find("yes"), std::string::npos);
    EXPECT_NE(out.find("cache: " + (temp.path / "models").string()), std::string::npos);
}

TEST_F(CliCommandsTest, EnsureWithoutMemoryCheckValidatesFile) {
    auto ctx = makeContext(serving(kPayload), writeTinyCatalog(kPayload));
    fs::create_directories(temp.path / "models");
    writeFile(temp.path / "models" / "ggml-tiny.bin", kPayload);

    testing::internal::CaptureStdout();
    const int code = commands::ensure(EnsureOptions{"tiny", false}, ctx);
    const std::string out = testing::internal::GetCapturedStdout();

    EXPECT_EQ(code, 0);
    EXPECT_NE(out.find("tiny ready: "), std::string::npos);
}

TEST_F(CliCommandsTest, EnsureMissingModelFails) {
    auto ctx = makeContext(serving(kPayload), writeTinyCatalog(kPayload));

    testing::internal::CaptureStderr();
    const int code = commands::ensure(EnsureOptions{"tiny", false}, ctx);
    const std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(code, 1);
    EXPECT_NE(err.find("missing from the cache"), std::string::npos);
    EXPECT_EQ(transport->calls(), 0);
}

TEST_F(CliCommandsTest, RmAndClean) {
    auto ctx = makeContext(serving(kPayload));
    fs::create_directories(temp.path / "models");
    writeFile(temp.path / "models" / "ggml-small.bin", "x");
    writeFile(temp.path / "models" / "ggml-medium.bin.tmp", "partial");

    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    EXPECT_EQ(commands::rm(ModelOptions{"small"}, ctx), 0);
    EXPECT_EQ(commands::rm(ModelOptions{"small"}, ctx), 1);
    EXPECT_EQ(commands::clean(ctx), 0);
    const std::string err = testing::internal::GetCapturedStderr();
    const std::string out = testing::internal::GetCapturedStdout();

    EXPECT_NE(out.find("deleted 'small'"), std::string::npos);
    EXPECT_NE(err.find("'small' is not cached"), std::string::npos);
    EXPECT_NE(out.find("removed 1 orphaned temp file"), std::string::npos);
    EXPECT_FALSE(fs::exists(temp.path / "models" / "ggml-medium.bin.tmp"));
}

TEST_F(CliCommandsTest, UrlPrintsRemoteUrl) {
    auto ctx = makeContext(serving(kPayload));

    testing::internal::CaptureStdout();
    EXPECT_EQ(commands::url(ModelOptions{"medium.en"}, ctx), 0);
    const std::string out = testing::internal::GetCapturedStdout();

    EXPECT_EQ(out, ModelCatalog::builtin().entryFor(ModelId::MediumEn).remote_url + "\n");
}

TEST_F(CliCommandsTest, CatalogRefreshWritesOutputFile) {
    nlohmann::json listing = nlohmann::json::array(
        {{{"type", "file"}, {"path", "ggml-tiny.bin"}, {"lfs", {{"oid", sha256_text("t")}, {"size", 9}}}}});
    auto ctx = makeContext(serving(listing.dump()));
    const auto output = temp.path / "refreshed.json";

    testing::internal::CaptureStderr();
    const int code = commands::catalog(CatalogOptions{"refresh", "deadbeef", output.string()}, ctx);
    testing::internal::GetCapturedStderr();

    ASSERT_EQ(code, 0);
    ASSERT_EQ(transport->urls().size(), 1u);
    EXPECT_NE(transport->urls()[0].find("/tree/deadbeef"), std::string::npos);
    auto doc = nlohmann::json::parse(readFile(output));
    EXPECT_EQ(doc["git_ref"], "deadbeef");
    EXPECT_EQ(doc["models"][0]["sha256"], sha256_text("t"));
}
