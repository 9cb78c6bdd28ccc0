#include "assetfetch/download_manager.hpp"
#include "assetfetch/errors.hpp"
#include "assetfetch/reporter.hpp"
#include "assetfetch/sha256.hpp"

#include "fake_transport.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using namespace assetfetch;
using assetfetch::testing::FakeResponse;
using assetfetch::testing::FakeTransport;
using assetfetch::testing::TempDir;
using assetfetch::testing::readFile;

namespace {

constexpr const char* kBase = "https://assets.test";

std::string locatorFor(const std::string& remote) {
    return std::string(kBase) + "/" + remote;
}

} // namespace

class DownloadManagerTest : public ::testing::Test {
protected:
    SchedulerOptions options(std::size_t pool_size = 10) const {
        SchedulerOptions opts;
        opts.pool_size = pool_size;
        opts.destination_dir = dir_.path();
        return opts;
    }

    TempDir dir_;
    FakeTransport transport_;
};

TEST_F(DownloadManagerTest, ScenarioA_MatchingContent) {
    const Manifest manifest({{"a.bin", "a_remote", sha256Hex("hello")}}, kBase);
    transport_.respond(locatorFor("a_remote"), FakeResponse{"hello"});

    DownloadManager manager(manifest, transport_, options());
    const auto summary = manager.run();

    ASSERT_EQ(summary.outcomes.size(), 1u);
    EXPECT_EQ(summary.outcomes[0].status, OutcomeStatus::Success);
    EXPECT_EQ(readFile(dir_.path() / "a.bin"), "hello");
    EXPECT_EQ(exitCodeFor(summary), 0);
}

TEST_F(DownloadManagerTest, ScenarioB_MismatchedContentIsKept) {
    const Manifest manifest({{"a.bin", "a_remote", sha256Hex("hello")}}, kBase);
    transport_.respond(locatorFor("a_remote"), FakeResponse{"world"});

    DownloadManager manager(manifest, transport_, options());
    const auto summary = manager.run();

    ASSERT_EQ(summary.outcomes.size(), 1u);
    EXPECT_EQ(summary.outcomes[0].status, OutcomeStatus::DigestMismatch);
    EXPECT_EQ(readFile(dir_.path() / "a.bin"), "world");
    EXPECT_EQ(summary.failed_task_names, std::set<std::string>{"a.bin"});
    EXPECT_EQ(exitCodeFor(summary), 1);
}

TEST_F(DownloadManagerTest, ScenarioC_OneFailureDoesNotStopSiblings) {
    const Manifest manifest({{"a.bin", "a_remote", std::nullopt},
                             {"b.bin", "b_remote", std::nullopt},
                             {"c.bin", "c_remote", sha256Hex("ccc")}},
                            kBase);
    transport_.respond(locatorFor("a_remote"), FakeResponse{"aaa"});
    transport_.respond(locatorFor("b_remote"), FakeResponse{"", "Connection refused"});
    transport_.respond(locatorFor("c_remote"), FakeResponse{"ccc"});

    DownloadManager manager(manifest, transport_, options(2));
    const auto summary = manager.run();

    ASSERT_EQ(summary.outcomes.size(), 3u);
    EXPECT_EQ(summary.outcomes[0].status, OutcomeStatus::Success);
    EXPECT_EQ(summary.outcomes[1].status, OutcomeStatus::NetworkFailure);
    EXPECT_EQ(summary.outcomes[1].error_detail, "Connection refused");
    EXPECT_EQ(summary.outcomes[2].status, OutcomeStatus::Success);
    EXPECT_EQ(summary.failed_task_names, std::set<std::string>{"b.bin"});
    EXPECT_EQ(summary.succeededCount(), 2u);
    EXPECT_NE(exitCodeFor(summary), 0);
    EXPECT_EQ(readFile(dir_.path() / "a.bin"), "aaa");
    EXPECT_EQ(readFile(dir_.path() / "c.bin"), "ccc");
}

TEST_F(DownloadManagerTest, ScenarioD_EmptyManifest) {
    const Manifest manifest;

    DownloadManager manager(manifest, transport_, options());
    const auto summary = manager.run();

    EXPECT_TRUE(summary.outcomes.empty());
    EXPECT_EQ(summary.succeededCount(), 0u);
    EXPECT_EQ(summary.failedCount(), 0u);
    EXPECT_EQ(exitCodeFor(summary), 0);
    EXPECT_EQ(transport_.openCalls(), 0);
}

TEST_F(DownloadManagerTest, OutcomesFollowManifestOrderNotCompletionOrder) {
    std::vector<ManifestEntry> entries;
    for (int i = 0; i < 12; ++i) {
        const auto name = "f" + std::to_string(i);
        entries.push_back({name + ".bin", name, std::nullopt});
        // Earlier entries are held open longer, so they finish last.
        FakeResponse response{name};
        response.hold_open = std::chrono::milliseconds{(12 - i) * 15};
        transport_.respond(locatorFor(name), response);
    }
    const Manifest manifest(entries, kBase);

    DownloadManager manager(manifest, transport_, options(4));
    std::vector<std::string> completion_order;
    manager.setOutcomeCallback([&completion_order](const DownloadOutcome& outcome) {
        completion_order.push_back(outcome.task->local_path);
    });
    const auto summary = manager.run();

    ASSERT_EQ(summary.outcomes.size(), manifest.size());
    ASSERT_EQ(completion_order.size(), manifest.size());

    std::vector<std::string> manifest_order;
    for (const auto& task : manifest) {
        manifest_order.push_back(task.local_path);
    }
    // f3 starts alongside f0 but is held 45ms less, so it finishes first.
    EXPECT_NE(completion_order, manifest_order);
    const auto position = [&completion_order](const std::string& name) {
        return std::find(completion_order.begin(), completion_order.end(), name) - completion_order.begin();
    };
    EXPECT_LT(position("f3.bin"), position("f0.bin"));

    for (std::size_t i = 0; i < manifest.size(); ++i) {
        EXPECT_EQ(summary.outcomes[i].task, &manifest.tasks()[i]);
        EXPECT_EQ(summary.outcomes[i].status, OutcomeStatus::Success);
    }
    EXPECT_TRUE(summary.allSucceeded());
}

TEST_F(DownloadManagerTest, NeverExceedsPoolSizeOpenStreams) {
    std::vector<ManifestEntry> entries;
    for (int i = 0; i < 24; ++i) {
        const auto name = "t" + std::to_string(i);
        entries.push_back({name, name, std::nullopt});
        FakeResponse response{std::string(1000, 'x')};
        response.hold_open = std::chrono::milliseconds{10};
        response.max_read = 100;
        transport_.respond(locatorFor(name), response);
    }
    const Manifest manifest(entries, kBase);

    DownloadManager manager(manifest, transport_, options(3));
    const auto summary = manager.run();

    EXPECT_EQ(summary.outcomes.size(), 24u);
    EXPECT_TRUE(summary.allSucceeded());
    EXPECT_LE(transport_.maxConcurrentStreams(), 3);
    EXPECT_GE(transport_.maxConcurrentStreams(), 1);
    EXPECT_EQ(transport_.openStreams(), 0);
    EXPECT_EQ(transport_.openCalls(), 24);
}

TEST_F(DownloadManagerTest, RunsTasksInParallel) {
    std::vector<ManifestEntry> entries;
    for (int i = 0; i < 8; ++i) {
        const auto name = "p" + std::to_string(i);
        entries.push_back({name, name, std::nullopt});
        FakeResponse response{"x"};
        response.hold_open = std::chrono::milliseconds{100};
        transport_.respond(locatorFor(name), response);
    }
    const Manifest manifest(entries, kBase);

    DownloadManager manager(manifest, transport_, options(8));
    const auto summary = manager.run();

    EXPECT_TRUE(summary.allSucceeded());
    EXPECT_GT(transport_.maxConcurrentStreams(), 1);
}

TEST_F(DownloadManagerTest, UnexpectedExceptionIsCapturedPerTask) {
    const Manifest manifest({{"odd.bin", "odd", std::nullopt}, {"ok.bin", "ok", std::nullopt}}, kBase);
    FakeResponse odd;
    odd.throw_foreign = true;
    transport_.respond(locatorFor("odd"), odd);
    transport_.respond(locatorFor("ok"), FakeResponse{"fine"});

    DownloadManager manager(manifest, transport_, options(1));
    const auto summary = manager.run();

    ASSERT_EQ(summary.outcomes.size(), 2u);
    EXPECT_EQ(summary.outcomes[0].status, OutcomeStatus::NetworkFailure);
    EXPECT_FALSE(summary.outcomes[0].error_detail.empty());
    EXPECT_EQ(summary.outcomes[1].status, OutcomeStatus::Success);
}

TEST_F(DownloadManagerTest, ThrowingCallbackDoesNotStopOtherTasks) {
    const Manifest manifest({{"a.bin", "a", std::nullopt}, {"b.bin", "b", std::nullopt},
                             {"c.bin", "c", std::nullopt}},
                            kBase);
    transport_.respond(locatorFor("a"), FakeResponse{"a"});
    transport_.respond(locatorFor("b"), FakeResponse{"b"});
    transport_.respond(locatorFor("c"), FakeResponse{"c"});

    DownloadManager manager(manifest, transport_, options(2));
    int calls = 0;
    manager.setOutcomeCallback([&calls](const DownloadOutcome& outcome) {
        ++calls;
        if (outcome.task->local_path == "a.bin") {
            throw 7;
        }
        throw std::runtime_error("callback failed");
    });
    const auto summary = manager.run();

    EXPECT_EQ(calls, 3);
    ASSERT_EQ(summary.outcomes.size(), 3u);
    EXPECT_TRUE(summary.allSucceeded());
}

TEST_F(DownloadManagerTest, ExactlyOneOutcomePerTaskWithMixedResults) {
    std::vector<ManifestEntry> entries;
    for (int i = 0; i < 30; ++i) {
        const auto name = "m" + std::to_string(i);
        const std::string body = "payload-" + std::to_string(i);
        switch (i % 3) {
            case 0:
                entries.push_back({name, name, sha256Hex(body)});
                transport_.respond(locatorFor(name), FakeResponse{body});
                break;
            case 1:
                entries.push_back({name, name, sha256Hex("other")});
                transport_.respond(locatorFor(name), FakeResponse{body});
                break;
            default:
                // no response registered: the fake answers 404
                entries.push_back({name, name, std::nullopt});
                break;
        }
    }
    const Manifest manifest(entries, kBase);

    DownloadManager manager(manifest, transport_, options(5));
    const auto summary = manager.run();

    ASSERT_EQ(summary.outcomes.size(), 30u);
    for (std::size_t i = 0; i < summary.outcomes.size(); ++i) {
        const auto& outcome = summary.outcomes[i];
        EXPECT_EQ(outcome.task->local_path, "m" + std::to_string(i));
        const auto expected = i % 3 == 0 ? OutcomeStatus::Success
                            : i % 3 == 1 ? OutcomeStatus::DigestMismatch
                                         : OutcomeStatus::NetworkFailure;
        EXPECT_EQ(outcome.status, expected) << outcome.task->local_path;
        EXPECT_EQ(outcome.error_detail.empty(), outcome.succeeded());
    }
    EXPECT_EQ(summary.failedCount(), 20u);
}

TEST_F(DownloadManagerTest, PassesTransportOptionsToEveryTask) {
    const Manifest manifest({{"a.bin", "a_remote", std::nullopt}}, kBase);
    transport_.respond(locatorFor("a_remote"), FakeResponse{"a"});

    auto opts = options();
    opts.transport.connect_timeout = std::chrono::milliseconds{2500};
    DownloadManager manager(manifest, transport_, opts);
    (void)manager.run();

    EXPECT_EQ(transport_.lastOptions().connect_timeout, std::chrono::milliseconds{2500});
}

TEST_F(DownloadManagerTest, ZeroPoolSizeIsRejected) {
    const Manifest manifest;
    EXPECT_THROW({ DownloadManager manager(manifest, transport_, options(0)); }, ConfigurationError);
}

TEST_F(DownloadManagerTest, DefaultTimeoutIsTenSeconds) {
    const SchedulerOptions defaults;
    EXPECT_EQ(defaults.pool_size, 10u);
    EXPECT_EQ(defaults.transport.connect_timeout, std::chrono::seconds{10});
    EXPECT_EQ(defaults.transport.read_timeout, std::chrono::seconds{10});
    EXPECT_EQ(defaults.verifier.chunk_size, 64u * 1024u);
}
