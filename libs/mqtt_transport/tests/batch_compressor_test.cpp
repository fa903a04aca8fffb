// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "pubbatch/batch.hpp"
#include "pubbatch/batch_compressor.hpp"
#include "pubbatch/wire_codec.hpp"

#include <gtest/gtest.h>
#include <zstd.h>

#include <atomic>
#include <random>
#include <thread>

namespace pubbatch::test {

namespace {

std::vector<uint8_t> zstd_decompress(const std::vector<uint8_t>& frame) {
    unsigned long long size = ZSTD_getFrameContentSize(frame.data(), frame.size());
    EXPECT_NE(size, ZSTD_CONTENTSIZE_ERROR);
    EXPECT_NE(size, ZSTD_CONTENTSIZE_UNKNOWN);

    std::vector<uint8_t> out(static_cast<size_t>(size));
    size_t rc = ZSTD_decompress(out.data(), out.size(), frame.data(), frame.size());
    EXPECT_FALSE(ZSTD_isError(rc)) << ZSTD_getErrorName(rc);
    out.resize(rc);
    return out;
}

/// Repetitive JSON events sharing attributes, as the forwarder produces
std::vector<uint8_t> encoded_event_batch(size_t events) {
    Batch batch(1);
    for (size_t i = 0; i < events; ++i) {
        std::string event = R"({"message":"speed )" + std::to_string(40 + i % 7) +
                            R"( km/h","@timestamp":"2025-01-01T00:00:00.000Z"})";
        batch.append(MessageBuilder::build(event, Attributes{{"origin", "edge"}}));
    }
    return encode_batch("projects/p/topics/t", batch);
}

std::vector<uint8_t> random_bytes(size_t n) {
    std::mt19937 rng(42);
    std::uniform_int_distribution<int> byte(0, 255);
    std::vector<uint8_t> out(n);
    for (auto& b : out) {
        b = static_cast<uint8_t>(byte(rng));
    }
    return out;
}

CompressionOptions zstd_options(size_t min_batch_bytes) {
    CompressionOptions options;
    options.codec = Codec::Zstd;
    options.min_batch_bytes = min_batch_bytes;
    return options;
}

}  // namespace

// =============================================================================
// Codec names
// =============================================================================

TEST(CodecTest, NamesParseCaseInsensitively) {
    EXPECT_STREQ(to_string(Codec::Zstd), "zstd");
    EXPECT_STREQ(to_string(Codec::None), "none");

    EXPECT_EQ(codec_from_string("ZSTD"), Codec::Zstd);
    EXPECT_EQ(codec_from_string("None"), Codec::None);
    EXPECT_FALSE(codec_from_string("lz4").has_value());
    EXPECT_FALSE(codec_from_string("").has_value());
}

// =============================================================================
// Size threshold
// =============================================================================

TEST(BatchCompressorTest, LargeBatchCompressedToZstdFrame) {
    BatchCompressor compressor(zstd_options(512));
    ASSERT_TRUE(compressor.init());

    auto encoded = encoded_event_batch(200);
    CompressedBatch out = compressor.compress(encoded);

    EXPECT_EQ(out.codec, Codec::Zstd);
    EXPECT_EQ(out.encoded_size, encoded.size());
    EXPECT_LT(out.bytes.size(), encoded.size() / 2);
    EXPECT_EQ(zstd_decompress(out.bytes), encoded);
}

TEST(BatchCompressorTest, SmallBatchSentRaw) {
    BatchCompressor compressor(zstd_options(4096));
    ASSERT_TRUE(compressor.init());

    auto encoded = encoded_event_batch(1);
    ASSERT_LT(encoded.size(), 4096u);
    CompressedBatch out = compressor.compress(encoded);

    EXPECT_EQ(out.codec, Codec::None);
    EXPECT_EQ(out.bytes, encoded);
    // Raw request starts with the topic field, never the zstd magic
    EXPECT_EQ(out.bytes.front(), 0x0A);
    EXPECT_EQ(compressor.stats().batches_below_threshold, 1u);
    EXPECT_EQ(compressor.stats().batches_compressed, 0u);
}

TEST(BatchCompressorTest, IncompressibleBatchSentRaw) {
    BatchCompressor compressor(zstd_options(0));
    ASSERT_TRUE(compressor.init());

    auto noise = random_bytes(4096);
    CompressedBatch out = compressor.compress(noise);

    EXPECT_EQ(out.codec, Codec::None);
    EXPECT_EQ(out.bytes, noise);
    EXPECT_EQ(compressor.stats().batches_incompressible, 1u);
}

TEST(BatchCompressorTest, NoneCodecNeverCompresses) {
    CompressionOptions options;
    options.codec = Codec::None;
    options.min_batch_bytes = 0;
    BatchCompressor compressor(options);
    ASSERT_TRUE(compressor.init());

    auto encoded = encoded_event_batch(200);
    CompressedBatch out = compressor.compress(encoded);

    EXPECT_EQ(out.codec, Codec::None);
    EXPECT_EQ(out.bytes, encoded);
    EXPECT_DOUBLE_EQ(compressor.stats().ratio(), 1.0);
}

TEST(BatchCompressorTest, UninitializedSendsRaw) {
    BatchCompressor compressor(zstd_options(0));

    auto encoded = encoded_event_batch(50);
    CompressedBatch out = compressor.compress(encoded);
    EXPECT_EQ(out.codec, Codec::None);
    EXPECT_EQ(out.bytes, encoded);
}

// =============================================================================
// Stats
// =============================================================================

TEST(BatchCompressorTest, StatsCountEachBatch) {
    BatchCompressor compressor(zstd_options(1024));
    ASSERT_TRUE(compressor.init());

    auto large = encoded_event_batch(100);
    auto small = encoded_event_batch(1);
    compressor.compress(large);
    compressor.compress(large);
    compressor.compress(small);

    CompressionStats stats = compressor.stats();
    EXPECT_EQ(stats.batches_compressed, 2u);
    EXPECT_EQ(stats.batches_below_threshold, 1u);
    EXPECT_EQ(stats.bytes_in, large.size() * 2 + small.size());
    EXPECT_LT(stats.ratio(), 1.0);
}

TEST(BatchCompressorTest, SafeAcrossSenderThreads) {
    BatchCompressor compressor(zstd_options(0));
    ASSERT_TRUE(compressor.init());
    auto encoded = encoded_event_batch(100);

    std::vector<std::thread> senders;
    std::atomic<int> mismatches{0};
    for (int t = 0; t < 4; ++t) {
        senders.emplace_back([&] {
            for (int i = 0; i < 25; ++i) {
                if (zstd_decompress(compressor.compress(encoded).bytes) != encoded) {
                    ++mismatches;
                }
            }
        });
    }
    for (auto& s : senders) {
        s.join();
    }

    EXPECT_EQ(mismatches.load(), 0);
    EXPECT_EQ(compressor.stats().batches_compressed, 100u);
}

}  // namespace pubbatch::test
