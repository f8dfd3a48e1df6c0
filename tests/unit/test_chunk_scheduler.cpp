#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>
#include <gtest/gtest.h>

#include "filelink/source/chunk_source.h"
#include "filelink/stream/chunk_scheduler.h"

namespace net = boost::asio;
using filelink::core::Error;
using filelink::core::ErrorCode;
using filelink::source::ObjectHandle;
using filelink::source::SourceLimits;
using filelink::stream::Chunk;
using filelink::stream::ChunkScheduler;
using filelink::stream::SchedulerOptions;
using filelink::stream::ServingWindow;

namespace {

std::string MakeData(std::size_t size) {
    std::string data(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<char>((i * 31 + i / 4096) % 251);
    }
    return data;
}

/// In-memory source whose behaviour per call is controlled by a hook.
class ScriptedSource : public filelink::source::ChunkSource {
public:
    using Hook = std::function<std::optional<Error>(std::uint64_t offset, int attempt)>;

    ScriptedSource(std::string data, SourceLimits limits, Hook hook = nullptr)
        : data_(std::move(data)), limits_(limits), hook_(std::move(hook)) {}

    SourceLimits limits() const override { return limits_; }

    filelink::core::Result<std::string> Read(const ObjectHandle&, std::uint64_t offset,
                                             std::uint64_t length) override {
        int attempt = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            attempt = attempts_[offset]++;
        }
        calls_.fetch_add(1);
        if (hook_) {
            if (auto error = hook_(offset, attempt)) {
                return *error;
            }
        }
        if (offset >= data_.size()) {
            return std::string();
        }
        return data_.substr(static_cast<std::size_t>(offset), static_cast<std::size_t>(length));
    }

    int calls() const { return calls_.load(); }
    int attempts_at(std::uint64_t offset) {
        std::lock_guard<std::mutex> lock(mutex_);
        return attempts_[offset];
    }

private:
    std::string data_;
    SourceLimits limits_;
    Hook hook_;
    std::atomic<int> calls_{0};
    std::mutex mutex_;
    std::map<std::uint64_t, int> attempts_;
};

/// Requests chunks one after another until the last (or an error) arrives.
class Collector {
public:
    explicit Collector(std::shared_ptr<ChunkScheduler> scheduler)
        : scheduler_(std::move(scheduler)) {}

    void Next() {
        scheduler_->NextChunk([this](Chunk chunk) {
            const bool done = chunk.last || !chunk.ok();
            chunks_.push_back(std::move(chunk));
            if (!done) {
                Next();
            }
        });
    }

    const std::vector<Chunk>& chunks() const { return chunks_; }

    std::string Joined() const {
        std::string out;
        for (const auto& chunk : chunks_) {
            out += chunk.bytes;
        }
        return out;
    }

private:
    std::shared_ptr<ChunkScheduler> scheduler_;
    std::vector<Chunk> chunks_;
};

class ChunkSchedulerTest : public ::testing::Test {
protected:
    std::shared_ptr<ChunkScheduler> Make(std::shared_ptr<ScriptedSource> source,
                                         std::uint64_t size, ServingWindow window,
                                         SchedulerOptions options) {
        return std::make_shared<ChunkScheduler>(ioc_.get_executor(), pool_.get_executor(),
                                                std::move(source), ObjectHandle(1, "obj", size),
                                                window, options);
    }

    static SchedulerOptions Options(std::uint64_t chunk_size, std::size_t width,
                                    std::size_t capacity) {
        SchedulerOptions options;
        options.chunk_size = chunk_size;
        options.prefetch_width = width;
        options.buffer_capacity = capacity;
        options.read_timeout = std::chrono::milliseconds(2000);
        options.max_retries = 3;
        options.retry_backoff = std::chrono::milliseconds(1);
        return options;
    }

    net::io_context ioc_;
    net::thread_pool pool_{8};
};

}  // namespace

TEST_F(ChunkSchedulerTest, DeliversWholeWindowInOrder) {
    const auto data = MakeData(10 * 4096 + 123);
    auto source = std::make_shared<ScriptedSource>(data, SourceLimits{4096, 4096});
    auto scheduler = Make(source, data.size(), ServingWindow{0, data.size()},
                          Options(8192, 4, 8));

    Collector collector(scheduler);
    scheduler->Start();
    collector.Next();
    ioc_.run();

    ASSERT_EQ(collector.chunks().size(), scheduler->chunk_count());
    EXPECT_TRUE(collector.chunks().back().last);
    EXPECT_EQ(collector.Joined(), data);
    // 8 KiB chunks through 4 KiB calls: two backend calls per full chunk.
    EXPECT_EQ(scheduler->backend_calls(), 11u);
}

TEST_F(ChunkSchedulerTest, UnalignedWindowYieldsExactSlice) {
    const auto data = MakeData(64 * 1024);
    auto source = std::make_shared<ScriptedSource>(data, SourceLimits{4096, 1024});
    const ServingWindow window{1500, 40001};
    auto scheduler = Make(source, data.size(), window, Options(8192, 3, 5));

    Collector collector(scheduler);
    scheduler->Start();
    collector.Next();
    ioc_.run();

    EXPECT_EQ(collector.Joined(), data.substr(1500, 40001 - 1500));
    EXPECT_EQ(collector.chunks().front().offset, 1500u);
    EXPECT_EQ(collector.chunks()[1].offset, 8192u);
}

TEST_F(ChunkSchedulerTest, OrderHoldsWhenBackendCompletesInReverse) {
    constexpr std::uint64_t kChunk = 4096;
    constexpr std::uint64_t kChunks = 8;
    const auto data = MakeData(kChunk * kChunks);
    auto source = std::make_shared<ScriptedSource>(
        data, SourceLimits{kChunk, kChunk}, [](std::uint64_t offset, int) {
            // Earlier chunks take longer, so completions arrive highest offset first.
            const auto index = static_cast<int>(offset / kChunk);
            std::this_thread::sleep_for(
                std::chrono::milliseconds(10 * (static_cast<int>(kChunks) - index)));
            return std::optional<Error>();
        });
    auto scheduler = Make(source, data.size(), ServingWindow{0, data.size()},
                          Options(kChunk, kChunks, kChunks));

    Collector collector(scheduler);
    scheduler->Start();
    collector.Next();
    ioc_.run();

    ASSERT_EQ(collector.chunks().size(), kChunks);
    for (std::size_t i = 1; i < collector.chunks().size(); ++i) {
        EXPECT_GT(collector.chunks()[i].offset, collector.chunks()[i - 1].offset);
        EXPECT_EQ(collector.chunks()[i].sequence, i);
    }
    EXPECT_EQ(collector.Joined(), data);
}

TEST_F(ChunkSchedulerTest, IdleConsumerBoundsFetchesByCapacity) {
    constexpr std::size_t kCapacity = 3;
    const auto data = MakeData(20 * 4096);
    auto source = std::make_shared<ScriptedSource>(data, SourceLimits{4096, 4096});
    auto scheduler = Make(source, data.size(), ServingWindow{0, data.size()},
                          Options(4096, 10, kCapacity));

    scheduler->Start();
    ioc_.run_for(std::chrono::milliseconds(300));

    EXPECT_EQ(source->calls(), static_cast<int>(kCapacity));
    EXPECT_EQ(scheduler->in_flight(), 0u);

    // Releasing one chunk frees exactly one slot.
    std::optional<Chunk> received;
    scheduler->NextChunk([&received](Chunk chunk) { received = std::move(chunk); });
    ioc_.restart();
    ioc_.run_for(std::chrono::milliseconds(300));

    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(received->sequence, 0u);
    EXPECT_EQ(source->calls(), static_cast<int>(kCapacity) + 1);
    scheduler->Cancel();
}

TEST_F(ChunkSchedulerTest, TransientFailureIsRetried) {
    const auto data = MakeData(4 * 4096);
    auto source = std::make_shared<ScriptedSource>(
        data, SourceLimits{4096, 4096}, [](std::uint64_t offset, int attempt) {
            if (offset == 8192 && attempt < 2) {
                return std::optional<Error>(Error{ErrorCode::kIoError, "flaky"});
            }
            return std::optional<Error>();
        });
    auto scheduler = Make(source, data.size(), ServingWindow{0, data.size()},
                          Options(4096, 2, 4));

    Collector collector(scheduler);
    scheduler->Start();
    collector.Next();
    ioc_.run();

    ASSERT_EQ(collector.chunks().size(), 4u);
    for (const auto& chunk : collector.chunks()) {
        EXPECT_TRUE(chunk.ok());
    }
    EXPECT_EQ(collector.Joined(), data);
    EXPECT_EQ(source->attempts_at(8192), 3);
}

TEST_F(ChunkSchedulerTest, PersistentFailureEndsWithErrorChunk) {
    const auto data = MakeData(6 * 4096);
    auto source = std::make_shared<ScriptedSource>(
        data, SourceLimits{4096, 4096}, [](std::uint64_t offset, int) {
            if (offset == 2 * 4096) {
                return std::optional<Error>(Error{ErrorCode::kUnavailable, "origin down"});
            }
            return std::optional<Error>();
        });
    auto options = Options(4096, 2, 4);
    options.max_retries = 1;
    auto scheduler = Make(source, data.size(), ServingWindow{0, data.size()}, options);

    Collector collector(scheduler);
    scheduler->Start();
    collector.Next();
    ioc_.run();

    ASSERT_EQ(collector.chunks().size(), 3u);
    EXPECT_TRUE(collector.chunks()[0].ok());
    EXPECT_TRUE(collector.chunks()[1].ok());
    const auto& failed = collector.chunks()[2];
    EXPECT_FALSE(failed.ok());
    EXPECT_TRUE(failed.last);
    EXPECT_EQ(failed.sequence, 2u);
    EXPECT_EQ(source->attempts_at(2 * 4096), 2);
}

TEST_F(ChunkSchedulerTest, TimedOutAttemptIsRetried) {
    const auto data = MakeData(2 * 4096);
    auto source = std::make_shared<ScriptedSource>(
        data, SourceLimits{4096, 4096}, [](std::uint64_t offset, int attempt) {
            if (offset == 0 && attempt == 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(300));
            }
            return std::optional<Error>();
        });
    auto options = Options(4096, 2, 2);
    options.read_timeout = std::chrono::milliseconds(50);
    auto scheduler = Make(source, data.size(), ServingWindow{0, data.size()}, options);

    Collector collector(scheduler);
    scheduler->Start();
    collector.Next();
    ioc_.run();

    ASSERT_EQ(collector.chunks().size(), 2u);
    EXPECT_TRUE(collector.chunks()[0].ok());
    EXPECT_EQ(collector.Joined(), data);
    EXPECT_GE(source->attempts_at(0), 2);
}

TEST_F(ChunkSchedulerTest, CancelStopsIssuingReads) {
    const auto data = MakeData(50 * 4096);
    auto source = std::make_shared<ScriptedSource>(
        data, SourceLimits{4096, 4096}, [](std::uint64_t, int) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            return std::optional<Error>();
        });
    auto scheduler = Make(source, data.size(), ServingWindow{0, data.size()},
                          Options(4096, 2, 2));

    int delivered = 0;
    scheduler->Start();
    scheduler->NextChunk([&delivered, scheduler](Chunk) {
        ++delivered;
        scheduler->Cancel();
    });
    ioc_.run_for(std::chrono::milliseconds(300));

    EXPECT_EQ(delivered, 1);
    EXPECT_TRUE(scheduler->cancelled());
    EXPECT_EQ(scheduler->in_flight(), 0u);
    EXPECT_LE(source->calls(), 4);

    // A cancelled scheduler never calls back again.
    scheduler->NextChunk([&delivered](Chunk) { ++delivered; });
    ioc_.restart();
    ioc_.run_for(std::chrono::milliseconds(50));
    EXPECT_EQ(delivered, 1);
}
