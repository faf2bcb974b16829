// =============================================================================
// pooled-writer - Stream Tests
// =============================================================================
// Ordering, backpressure, finalization and failure behaviour of Stream over a
// shared Pool.
// =============================================================================

#include "pw/stream/stream.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <numeric>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "pw/codec/bgzf.h"
#include "test_utils.h"

namespace pw::stream {
namespace {

using namespace std::chrono_literals;

class StreamTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto pool = pool::Pool::create({4, 0});
        ASSERT_TRUE(pool.has_value());
        pool_ = std::move(*pool);
        buffer_ = std::make_shared<ByteBuffer>();
        counters_ = std::make_shared<test::CountingSink::Counters>();
    }

    void TearDown() override { pool_->shutdown(); }

    std::unique_ptr<io::Sink> countingSink() {
        return std::make_unique<test::CountingSink>(buffer_, counters_);
    }

    static StreamConfig rawConfig(std::size_t blockSize, std::size_t maxInFlight = 8) {
        StreamConfig config;
        config.blockSize = blockSize;
        config.maxInFlight = maxInFlight;
        config.compressor.kind = codec::CodecKind::kRaw;
        return config;
    }

    std::string output() const { return test::toString(*buffer_); }

    std::shared_ptr<pool::Pool> pool_;
    std::shared_ptr<ByteBuffer> buffer_;
    std::shared_ptr<test::CountingSink::Counters> counters_;
};

// =============================================================================
// Construction
// =============================================================================

TEST_F(StreamTest, ResolvesDefaultBlockSize) {
    Stream bgzf(pool_, countingSink(), StreamConfig{});
    EXPECT_EQ(bgzf.config().blockSize, codec::bgzf::kMaxPayloadSize);
    EXPECT_EQ(bgzf.config().compressor.kind, codec::CodecKind::kBgzf);

    StreamConfig gzipConfig;
    gzipConfig.compressor.kind = codec::CodecKind::kGzip;
    Stream gzip(pool_, std::make_unique<io::MemorySink>(std::make_shared<ByteBuffer>()),
                gzipConfig);
    EXPECT_EQ(gzip.config().blockSize, kDefaultBlockSize);
    EXPECT_NE(bgzf.id(), gzip.id());
}

TEST_F(StreamTest, RejectsInvalidConfiguration) {
    EXPECT_THROW({ Stream s(pool_, countingSink(), rawConfig(4, 0)); }, UsageError);
    EXPECT_THROW({ Stream s(nullptr, countingSink(), rawConfig(4)); }, UsageError);
    EXPECT_THROW({ Stream s(pool_, nullptr, rawConfig(4)); }, UsageError);

    auto noInFlight = Stream::open(pool_, countingSink(), rawConfig(4, 0));
    ASSERT_FALSE(noInFlight.has_value());
    EXPECT_EQ(noInFlight.error().code(), ErrorCode::kInvalidArgument);

    StreamConfig oversized;
    oversized.blockSize = codec::bgzf::kMaxPayloadSize + 1;
    auto tooBig = Stream::open(pool_, countingSink(), oversized);
    ASSERT_FALSE(tooBig.has_value());
    EXPECT_EQ(tooBig.error().code(), ErrorCode::kInvalidArgument);

    auto tooManyInFlight =
        Stream::open(pool_, countingSink(), rawConfig(4, kMaxInFlightLimit + 1));
    ASSERT_FALSE(tooManyInFlight.has_value());
    EXPECT_EQ(tooManyInFlight.error().code(), ErrorCode::kInvalidArgument);
    EXPECT_THROW({ Stream s(pool_, countingSink(), rawConfig(4, std::size_t{1} << 40)); },
                 UsageError);
    EXPECT_TRUE(rawConfig(4, kMaxInFlightLimit).validate().has_value());

    StreamConfig badLevel;
    badLevel.compressor = {codec::CodecKind::kZstd, 40};
    EXPECT_FALSE(Stream::open(pool_, countingSink(), badLevel).has_value());

    EXPECT_EQ(pool_->attachedStreams(), 0u);
}

// =============================================================================
// Ordering
// =============================================================================

TEST_F(StreamTest, SplitsIntoBlocksAndReassembles) {
    Stream out(pool_, countingSink(), rawConfig(4));
    ASSERT_TRUE(out.write("ABCDEFGH").has_value());
    ASSERT_TRUE(out.close().has_value());

    EXPECT_EQ(output(), "ABCDEFGH");
    // Two full blocks plus the (empty) final block.
    EXPECT_EQ(out.stats().blocksSubmitted, 3u);
    EXPECT_EQ(out.stats().bytesWritten, 8u);
    EXPECT_EQ(out.state(), StreamState::kClosed);
}

TEST_F(StreamTest, SmallWritesAccumulateAcrossCalls) {
    Stream out(pool_, countingSink(), rawConfig(5));
    for (char c : std::string("the quick brown fox")) {
        ASSERT_TRUE(out.write(std::string(1, c)).has_value());
    }
    ASSERT_TRUE(out.close().has_value());
    EXPECT_EQ(output(), "the quick brown fox");
}

TEST_F(StreamTest, OrderHoldsWhenLaterBlocksFinishFirst) {
    constexpr int kBlocks = 16;
    // Block i sleeps (kBlocks - i) ms, so completions arrive roughly reversed.
    auto inverted = std::make_shared<test::ScriptedCompressor>([](ByteSpan payload) {
        std::this_thread::sleep_for(std::chrono::milliseconds(kBlocks - payload[0]));
        return test::passthrough(payload);
    });

    Stream out(pool_, countingSink(), inverted, rawConfig(1, kBlocks));
    ByteBuffer data(kBlocks);
    std::iota(data.begin(), data.end(), std::uint8_t{0});
    ASSERT_TRUE(out.write(data).has_value());
    ASSERT_TRUE(out.close().has_value());

    EXPECT_EQ(*buffer_, data);
}

// =============================================================================
// Backpressure
// =============================================================================

TEST_F(StreamTest, WriteBlocksAtMaxInFlight) {
    auto gated = std::make_shared<test::GatedCompressor>();
    Stream out(pool_, countingSink(), gated, rawConfig(1, 2));

    std::atomic<bool> writeReturned{false};
    std::thread writer([&] {
        EXPECT_TRUE(out.write("abc").has_value());
        writeReturned = true;
    });

    ASSERT_TRUE(gated->waitForStarted(2, 5s));
    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(writeReturned.load());
    EXPECT_EQ(out.inFlight(), 2u);
    EXPECT_EQ(gated->started(), 2u);

    gated->open();
    writer.join();
    EXPECT_TRUE(writeReturned.load());
    EXPECT_LE(out.inFlight(), 2u);

    ASSERT_TRUE(out.close().has_value());
    EXPECT_EQ(output(), "abc");
    EXPECT_EQ(out.inFlight(), 0u);
}

TEST_F(StreamTest, InFlightNeverExceedsBound) {
    constexpr std::size_t kMaxInFlight = 3;
    auto slow = std::make_shared<test::ScriptedCompressor>([](ByteSpan payload) {
        std::this_thread::sleep_for(200us);
        return test::passthrough(payload);
    });
    Stream out(pool_, countingSink(), slow, rawConfig(8, kMaxInFlight));

    std::atomic<bool> done{false};
    std::atomic<std::size_t> peak{0};
    std::thread observer([&] {
        while (!done.load()) {
            const auto now = out.inFlight();
            peak.store(std::max(peak.load(), now));
            std::this_thread::yield();
        }
    });

    const std::string payload(8 * 200, 'p');
    EXPECT_TRUE(out.write(payload).has_value());
    EXPECT_TRUE(out.close().has_value());
    done = true;
    observer.join();

    EXPECT_LE(peak.load(), kMaxInFlight);
    EXPECT_EQ(output(), payload);
}

// =============================================================================
// Thread Bound
// =============================================================================

TEST(StreamPoolTest, ManyStreamsNeverExceedPoolThreads) {
    constexpr std::size_t kThreads = 2;
    constexpr std::size_t kStreams = 6;
    auto pool = *pool::Pool::create({kThreads, 0});
    auto tracker = std::make_shared<test::PeakTrackingCompressor>(300us);

    std::vector<std::shared_ptr<ByteBuffer>> buffers;
    std::vector<std::unique_ptr<Stream>> streams;
    for (std::size_t i = 0; i < kStreams; ++i) {
        buffers.push_back(std::make_shared<ByteBuffer>());
        StreamConfig config;
        config.blockSize = 16;
        config.maxInFlight = 4;
        streams.push_back(std::make_unique<Stream>(
            pool, std::make_unique<io::MemorySink>(buffers.back()), tracker, config));
    }

    std::vector<std::thread> writers;
    for (std::size_t i = 0; i < kStreams; ++i) {
        writers.emplace_back([&, i] {
            const std::string text(16 * 20, static_cast<char>('a' + i));
            EXPECT_TRUE(streams[i]->write(text).has_value());
            EXPECT_TRUE(streams[i]->close().has_value());
        });
    }
    for (auto& t : writers) {
        t.join();
    }

    EXPECT_LE(tracker->peak(), kThreads);
    for (std::size_t i = 0; i < kStreams; ++i) {
        EXPECT_EQ(test::toString(*buffers[i]), std::string(16 * 20, static_cast<char>('a' + i)));
    }
    pool->shutdown();
}

// =============================================================================
// Finalization
// =============================================================================

TEST_F(StreamTest, CloseAppendsTrailerExactlyOnce) {
    auto withTrailer =
        std::make_shared<test::ScriptedCompressor>(test::passthrough, test::toBytes("<EOF>"));
    Stream out(pool_, countingSink(), withTrailer, rawConfig(4));

    ASSERT_TRUE(out.write("ABCD").has_value());
    ASSERT_TRUE(out.flush().has_value());
    EXPECT_EQ(output(), "ABCD");
    EXPECT_EQ(counters_->flushes.load(), 1);

    ASSERT_TRUE(out.write("EF").has_value());
    ASSERT_TRUE(out.close().has_value());
    EXPECT_EQ(output(), "ABCDEF<EOF>");
    EXPECT_EQ(counters_->closes.load(), 1);
    EXPECT_EQ(out.inFlight(), 0u);
}

TEST_F(StreamTest, FlushSubmitsPartialBlock) {
    Stream out(pool_, countingSink(), rawConfig(8));

    ASSERT_TRUE(out.write("abc").has_value());
    EXPECT_TRUE(buffer_->empty());
    ASSERT_TRUE(out.flush().has_value());
    EXPECT_EQ(output(), "abc");
    EXPECT_EQ(out.inFlight(), 0u);
    EXPECT_EQ(out.state(), StreamState::kOpen);
    EXPECT_EQ(out.stats().blocksSubmitted, 1u);
    EXPECT_EQ(counters_->flushes.load(), 1);
    EXPECT_EQ(counters_->closes.load(), 0);

    // Nothing buffered: flushes the sink again without submitting a block.
    const auto submittedBefore = pool_->stats().tasksSubmitted;
    ASSERT_TRUE(out.flush().has_value());
    EXPECT_EQ(out.stats().blocksSubmitted, 1u);
    EXPECT_EQ(pool_->stats().tasksSubmitted, submittedBefore);
    EXPECT_EQ(counters_->flushes.load(), 2);

    ASSERT_TRUE(out.write("defgh").has_value());
    ASSERT_TRUE(out.close().has_value());
    EXPECT_EQ(output(), "abcdefgh");
    // The partial block from flush() plus the final block.
    EXPECT_EQ(out.stats().blocksSubmitted, 2u);
    EXPECT_EQ(counters_->closes.load(), 1);
}

TEST_F(StreamTest, EmptyStreamStillGetsTrailer) {
    StreamConfig config;
    Stream out(pool_, countingSink(), config);
    ASSERT_TRUE(out.close().has_value());

    ASSERT_EQ(buffer_->size(), codec::bgzf::kEofMarker.size());
    EXPECT_TRUE(std::equal(buffer_->begin(), buffer_->end(), codec::bgzf::kEofMarker.begin()));
}

TEST_F(StreamTest, OperationsAfterCloseReturnClosed) {
    Stream out(pool_, countingSink(), rawConfig(4));
    ASSERT_TRUE(out.write("data").has_value());
    ASSERT_TRUE(out.close().has_value());

    auto write = out.write("more");
    ASSERT_FALSE(write.has_value());
    EXPECT_EQ(write.error().code(), ErrorCode::kClosed);

    auto flush = out.flush();
    ASSERT_FALSE(flush.has_value());
    EXPECT_EQ(flush.error().code(), ErrorCode::kClosed);

    auto again = out.close();
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code(), ErrorCode::kClosed);

    EXPECT_EQ(counters_->closes.load(), 1);
    EXPECT_EQ(output(), "data");
}

TEST_F(StreamTest, DestructorClosesOpenStream) {
    {
        Stream out(pool_, countingSink(), rawConfig(4));
        ASSERT_TRUE(out.write("tail").has_value());
        ASSERT_TRUE(out.write("!").has_value());
        EXPECT_EQ(pool_->attachedStreams(), 1u);
    }
    EXPECT_EQ(output(), "tail!");
    EXPECT_EQ(counters_->closes.load(), 1);
    EXPECT_EQ(pool_->attachedStreams(), 0u);
}

TEST_F(StreamTest, AbortSkipsTrailerAndClosesSink) {
    auto withTrailer =
        std::make_shared<test::ScriptedCompressor>(test::passthrough, test::toBytes("<EOF>"));
    {
        Stream out(pool_, countingSink(), withTrailer, rawConfig(4));
        ASSERT_TRUE(out.write("abcdefghij").has_value());
        out.abort();

        EXPECT_EQ(counters_->closes.load(), 1);
        EXPECT_EQ(out.state(), StreamState::kErrored);
        EXPECT_EQ(pool_->attachedStreams(), 0u);

        auto written = out.write("more");
        ASSERT_FALSE(written.has_value());
        EXPECT_EQ(written.error().code(), ErrorCode::kClosed);
        auto closed = out.close();
        ASSERT_FALSE(closed.has_value());
        EXPECT_EQ(closed.error().code(), ErrorCode::kClosed);

        out.abort();
    }
    EXPECT_EQ(counters_->closes.load(), 1);
    EXPECT_FALSE(output().ends_with("<EOF>"));
    EXPECT_TRUE(std::string("abcdefgh").starts_with(output()));
}

TEST_F(StreamTest, MovedStreamKeepsWorking) {
    Stream first(pool_, countingSink(), rawConfig(2));
    ASSERT_TRUE(first.write("ab").has_value());
    Stream second(std::move(first));
    ASSERT_TRUE(second.write("cd").has_value());
    ASSERT_TRUE(second.close().has_value());
    EXPECT_EQ(output(), "abcd");
}

// =============================================================================
// Failures
// =============================================================================

TEST_F(StreamTest, CompressionFailureIsStickyAndKeepsPrefix) {
    auto failOnX =
        std::make_shared<test::ScriptedCompressor>([](ByteSpan payload) -> Result<ByteBuffer> {
            if (!payload.empty() && payload[0] == 'X') {
                return makeError<ByteBuffer>(ErrorCode::kCompressionError, "cannot compress X");
            }
            return test::passthrough(payload);
        });
    Stream out(pool_, countingSink(), failOnX, rawConfig(1, 4));

    auto written = out.write("abXcd");
    auto flushed = out.flush();
    ASSERT_FALSE(flushed.has_value());
    const Error first = written ? flushed.error() : written.error();
    EXPECT_EQ(first.code(), ErrorCode::kCompressionError);
    EXPECT_EQ(out.state(), StreamState::kErrored);

    // Every block before the failure and nothing after it.
    EXPECT_EQ(output(), "ab");

    const auto submittedBefore = pool_->stats().tasksSubmitted;
    auto laterWrite = out.write("zzzz");
    ASSERT_FALSE(laterWrite.has_value());
    EXPECT_EQ(laterWrite.error(), first);
    ASSERT_FALSE(out.flush().has_value());
    EXPECT_EQ(out.flush().error(), first);
    auto closed = out.close();
    ASSERT_FALSE(closed.has_value());
    EXPECT_EQ(closed.error(), first);
    EXPECT_EQ(pool_->stats().tasksSubmitted, submittedBefore);

    EXPECT_EQ(output(), "ab");
    EXPECT_EQ(counters_->closes.load(), 1);
}

TEST_F(StreamTest, WorkerExceptionBecomesChannelClosed) {
    auto throwing = std::make_shared<test::ScriptedCompressor>(
        [](ByteSpan) -> Result<ByteBuffer> { throw std::runtime_error("worker blew up"); });
    Stream out(pool_, countingSink(), throwing, rawConfig(4));

    ASSERT_TRUE(out.write("abc").has_value());
    auto flushed = out.flush();
    ASSERT_FALSE(flushed.has_value());
    EXPECT_EQ(flushed.error().code(), ErrorCode::kChannelClosed);
    EXPECT_EQ(out.close().error(), flushed.error());
}

TEST_F(StreamTest, SinkFailureIsStickyIOError) {
    auto failing = std::make_unique<test::FailingSink>(buffer_, 1);
    auto closes = failing->closeCounter();
    Stream out(pool_, std::move(failing), rawConfig(2));

    auto written = out.write("aabbcc");
    auto flushed = out.flush();
    ASSERT_FALSE(flushed.has_value());
    const Error first = written ? flushed.error() : written.error();
    EXPECT_EQ(first.code(), ErrorCode::kIOError);
    EXPECT_EQ(output(), "aa");

    EXPECT_EQ(out.write("dd").error(), first);
    EXPECT_EQ(out.close().error(), first);
    EXPECT_EQ(closes->load(), 1);
}

TEST_F(StreamTest, SubmitAfterPoolShutdownFails) {
    auto pool = *pool::Pool::create({1, 0});
    pool->shutdown();

    Stream out(pool, countingSink(), rawConfig(4));
    auto written = out.write("ABCDEFGH");
    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error().code(), ErrorCode::kPoolShutdown);
    EXPECT_EQ(out.close().error(), written.error());
    EXPECT_TRUE(buffer_->empty());
}

TEST_F(StreamTest, PoolShutdownStillDeliversAcceptedBlocks) {
    auto pool = *pool::Pool::create({2, 0});
    Stream out(pool, countingSink(), rawConfig(4));
    ASSERT_TRUE(out.write("ABCDEF").has_value());

    pool->shutdown();

    auto closed = out.close();
    ASSERT_FALSE(closed.has_value());
    EXPECT_EQ(closed.error().code(), ErrorCode::kPoolShutdown);
    EXPECT_EQ(output(), "ABCD");
    EXPECT_EQ(counters_->closes.load(), 1);
}

// =============================================================================
// Real Codecs
// =============================================================================

TEST(StreamCodecTest, TwentyBgzfStreamsShareOnePool) {
    constexpr std::size_t kStreams = 20;
    auto pool = *pool::Pool::create({4, 0});

    std::mt19937 rng(1234);
    std::vector<ByteBuffer> inputs(kStreams);
    std::vector<std::shared_ptr<ByteBuffer>> outputs;
    std::vector<std::unique_ptr<Stream>> streams;
    for (std::size_t i = 0; i < kStreams; ++i) {
        // Compressible but not trivial: short random words.
        std::uniform_int_distribution<int> letter('a', 'h');
        inputs[i].resize(100000 + i * 1000);
        for (auto& b : inputs[i]) {
            b = static_cast<std::uint8_t>(letter(rng));
        }
        outputs.push_back(std::make_shared<ByteBuffer>());
        StreamConfig config;
        config.maxInFlight = 4;
        streams.push_back(std::make_unique<Stream>(
            pool, std::make_unique<io::MemorySink>(outputs.back()), config));
    }

    // Interleave writes of varying size across every stream from one thread.
    std::vector<std::size_t> offsets(kStreams, 0);
    std::uniform_int_distribution<std::size_t> chunk(1, 9000);
    bool pending = true;
    while (pending) {
        pending = false;
        for (std::size_t i = 0; i < kStreams; ++i) {
            if (offsets[i] >= inputs[i].size()) {
                continue;
            }
            const auto n = std::min(chunk(rng), inputs[i].size() - offsets[i]);
            ASSERT_TRUE(streams[i]->write(ByteSpan(inputs[i].data() + offsets[i], n)).has_value());
            offsets[i] += n;
            pending = true;
        }
    }
    for (auto& s : streams) {
        ASSERT_TRUE(s->close().has_value());
    }

    for (std::size_t i = 0; i < kStreams; ++i) {
        const auto& out = *outputs[i];
        ASSERT_GE(out.size(), codec::bgzf::kEofMarker.size());
        EXPECT_TRUE(std::equal(codec::bgzf::kEofMarker.begin(), codec::bgzf::kEofMarker.end(),
                               out.end() - codec::bgzf::kEofMarker.size()));
        auto decoded = test::gunzipAll(out);
        ASSERT_TRUE(decoded.has_value()) << "stream " << i;
        EXPECT_EQ(*decoded, inputs[i]) << "stream " << i;
    }
    pool->shutdown();
}

}  // namespace
}  // namespace pw::stream
