// =============================================================================
// pooled-writer - Stream Property Tests
// =============================================================================
// Property-based tests for ordered output under arbitrary write chunking,
// block geometry, pool size and failure position.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

#include "pw/stream/stream.h"
#include "test_utils.h"

namespace pw::stream::test {

// =============================================================================
// RapidCheck Generators
// =============================================================================

namespace gen {

/// @brief Payload with long runs so the compressing codecs actually compress.
[[nodiscard]] rc::Gen<ByteBuffer> payload(std::size_t maxSize) {
    return rc::gen::mapcat(rc::gen::inRange<std::size_t>(0, maxSize + 1), [](std::size_t size) {
        return rc::gen::container<ByteBuffer>(
            size, rc::gen::map(rc::gen::inRange(0, 6),
                               [](int v) { return static_cast<std::uint8_t>('A' + v); }));
    });
}

/// @brief Cut `total` bytes into write sizes, each between 1 and maxChunk.
[[nodiscard]] std::vector<std::size_t> chunking(std::size_t total, std::size_t maxChunk) {
    std::vector<std::size_t> sizes;
    while (total > 0) {
        const auto n = *rc::gen::inRange<std::size_t>(1, std::min(total, maxChunk) + 1);
        sizes.push_back(n);
        total -= n;
    }
    return sizes;
}

[[nodiscard]] rc::Gen<codec::CodecKind> codecKind() {
    return rc::gen::element(codec::CodecKind::kRaw, codec::CodecKind::kGzip,
                            codec::CodecKind::kBgzf, codec::CodecKind::kZstd);
}

}  // namespace gen

std::shared_ptr<pool::Pool> makePool(std::size_t threads) {
    auto pool = pool::Pool::create({threads, 0});
    RC_ASSERT(pool.has_value());
    return std::move(*pool);
}

// =============================================================================
// Property Tests
// =============================================================================

/// @brief Decoding the sink contents yields exactly the bytes written.
RC_GTEST_PROP(StreamProperty, RoundTripAnyChunking, ()) {
    const auto kind = *gen::codecKind();
    const auto data = *gen::payload(20000);
    const auto blockSize = *rc::gen::inRange<std::size_t>(1, 4097);
    const auto maxInFlight = *rc::gen::inRange<std::size_t>(1, 9);
    const auto threads = *rc::gen::inRange<std::size_t>(1, 5);
    const auto sizes = gen::chunking(data.size(), 3000);

    auto pool = makePool(threads);
    auto buffer = std::make_shared<ByteBuffer>();

    StreamConfig config;
    config.blockSize = blockSize;
    config.maxInFlight = maxInFlight;
    config.compressor.kind = kind;
    {
        Stream out(pool, std::make_unique<io::MemorySink>(buffer), config);
        std::size_t offset = 0;
        for (auto n : sizes) {
            RC_ASSERT(out.write(ByteSpan(data.data() + offset, n)).has_value());
            offset += n;
        }
        RC_ASSERT(out.close().has_value());
        RC_ASSERT(out.stats().bytesWritten == data.size());
        RC_ASSERT(out.inFlight() == 0u);
    }
    pool->shutdown();

    auto decoded = pw::test::decodeAll(kind, *buffer);
    RC_ASSERT(decoded.has_value());
    RC_ASSERT(*decoded == data);
}

/// @brief Output order is submission order whatever order workers finish in.
RC_GTEST_PROP(StreamProperty, OrderIndependentOfCompletionOrder, ()) {
    const auto blockCount = *rc::gen::inRange<std::size_t>(1, 40);
    const auto maxInFlight = *rc::gen::inRange<std::size_t>(1, 12);
    const auto threads = *rc::gen::inRange<std::size_t>(1, 6);

    // First byte of each block picks its artificial latency.
    ByteBuffer data;
    for (std::size_t i = 0; i < blockCount; ++i) {
        data.push_back(*rc::gen::inRange<std::uint8_t>(0, 8));
        data.push_back(static_cast<std::uint8_t>(i));
    }

    auto jittery = std::make_shared<pw::test::ScriptedCompressor>([](ByteSpan block) {
        std::this_thread::sleep_for(std::chrono::microseconds(block[0] * 250));
        return pw::test::passthrough(block);
    });

    auto pool = makePool(threads);
    auto buffer = std::make_shared<ByteBuffer>();
    StreamConfig config;
    config.blockSize = 2;
    config.maxInFlight = maxInFlight;
    {
        Stream out(pool, std::make_unique<io::MemorySink>(buffer), jittery, config);
        RC_ASSERT(out.write(data).has_value());
        RC_ASSERT(out.close().has_value());
    }
    pool->shutdown();

    RC_ASSERT(*buffer == data);
}

/// @brief A failing block leaves exactly the blocks before it in the sink.
RC_GTEST_PROP(StreamProperty, FailureKeepsExactPrefix, ()) {
    const auto blockCount = *rc::gen::inRange<std::size_t>(1, 30);
    const auto failAt = *rc::gen::inRange<std::size_t>(0, blockCount);
    const auto maxInFlight = *rc::gen::inRange<std::size_t>(1, 8);
    const auto threads = *rc::gen::inRange<std::size_t>(1, 5);

    ByteBuffer data;
    for (std::size_t i = 0; i < blockCount; ++i) {
        data.push_back(i == failAt ? 'F' : 'k');
        data.push_back(static_cast<std::uint8_t>(i));
    }

    auto failing =
        std::make_shared<pw::test::ScriptedCompressor>([](ByteSpan block) -> Result<ByteBuffer> {
            if (!block.empty() && block[0] == 'F') {
                return makeError<ByteBuffer>(ErrorCode::kCompressionError, "forced failure");
            }
            return pw::test::passthrough(block);
        });

    auto pool = makePool(threads);
    auto buffer = std::make_shared<ByteBuffer>();
    StreamConfig config;
    config.blockSize = 2;
    config.maxInFlight = maxInFlight;
    {
        Stream out(pool, std::make_unique<io::MemorySink>(buffer), failing, config);
        auto written = out.write(data);
        auto closed = out.close();
        RC_ASSERT(!closed.has_value());
        RC_ASSERT(closed.error().code() == ErrorCode::kCompressionError);
        if (!written) {
            RC_ASSERT(written.error() == closed.error());
        }
        RC_ASSERT(out.state() == StreamState::kErrored);
    }
    pool->shutdown();

    const ByteBuffer prefix(data.begin(), data.begin() + static_cast<std::ptrdiff_t>(failAt * 2));
    RC_ASSERT(*buffer == prefix);
}

/// @brief Streams sharing one pool never see each other's bytes.
RC_GTEST_PROP(StreamProperty, StreamsSharingPoolStayIndependent, ()) {
    const auto streamCount = *rc::gen::inRange<std::size_t>(2, 8);
    const auto threads = *rc::gen::inRange<std::size_t>(1, 4);
    const auto kind = *gen::codecKind();

    auto pool = makePool(threads);
    std::vector<ByteBuffer> inputs;
    std::vector<std::shared_ptr<ByteBuffer>> outputs;
    std::vector<std::unique_ptr<Stream>> streams;
    for (std::size_t i = 0; i < streamCount; ++i) {
        inputs.push_back(*gen::payload(6000));
        outputs.push_back(std::make_shared<ByteBuffer>());
        StreamConfig config;
        config.blockSize = *rc::gen::inRange<std::size_t>(1, 2049);
        config.maxInFlight = *rc::gen::inRange<std::size_t>(1, 5);
        config.compressor.kind = kind;
        streams.push_back(std::make_unique<Stream>(
            pool, std::make_unique<io::MemorySink>(outputs.back()), config));
    }

    std::vector<std::thread> writers;
    std::vector<int> ok(streamCount, 0);
    for (std::size_t i = 0; i < streamCount; ++i) {
        writers.emplace_back([&, i] {
            const auto& in = inputs[i];
            std::size_t offset = 0;
            bool good = true;
            while (good && offset < in.size()) {
                const auto n = std::min<std::size_t>(777, in.size() - offset);
                good = streams[i]->write(ByteSpan(in.data() + offset, n)).has_value();
                offset += n;
            }
            ok[i] = good && streams[i]->close().has_value() ? 1 : 0;
        });
    }
    for (auto& t : writers) {
        t.join();
    }
    streams.clear();
    pool->shutdown();

    for (std::size_t i = 0; i < streamCount; ++i) {
        RC_ASSERT(ok[i] == 1);
        auto decoded = pw::test::decodeAll(kind, *outputs[i]);
        RC_ASSERT(decoded.has_value());
        RC_ASSERT(*decoded == inputs[i]);
    }
}

}  // namespace pw::stream::test
