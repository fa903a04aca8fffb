// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file batch_compressor.hpp
/// @brief Optional zstd compression of encoded PublishRequest batches
///
/// Small batches go out uncompressed: below min_batch_bytes the zstd frame
/// header costs more than it saves. A batch that does not shrink is also
/// sent raw. Receivers tell the two apart by the zstd frame magic
/// (28 B5 2F FD); an encoded PublishRequest always starts with the topic
/// field tag 0x0A.

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Forward declarations
struct ZSTD_CCtx_s;
typedef struct ZSTD_CCtx_s ZSTD_CCtx;

namespace pubbatch {

enum class Codec : uint8_t {
    None = 0,
    Zstd = 1
};

/// @return "none" or "zstd"
const char* to_string(Codec codec);

/// Parse a codec name ("zstd", "none"; case-insensitive)
std::optional<Codec> codec_from_string(const std::string& name);

struct CompressionOptions {
    Codec codec = Codec::Zstd;

    /// zstd level (1-19)
    int level = 3;

    /// Encoded batches smaller than this are sent uncompressed
    size_t min_batch_bytes = 512;
};

/// One batch ready for the wire
struct CompressedBatch {
    std::vector<uint8_t> bytes;

    /// Codec actually applied; None when the batch was left raw
    Codec codec = Codec::None;

    size_t encoded_size = 0;
};

/// Per-batch compression counters
struct CompressionStats {
    uint64_t batches_compressed = 0;
    uint64_t batches_below_threshold = 0;
    uint64_t batches_incompressible = 0;
    uint64_t bytes_in = 0;
    uint64_t bytes_out = 0;

    /// Wire bytes per encoded byte (1.0 when nothing was compressed)
    double ratio() const {
        return bytes_in > 0 ? static_cast<double>(bytes_out) / bytes_in : 1.0;
    }
};

/// Compresses encoded batches for MqttPublishTransport.
///
/// compress() is called from every publisher worker; the zstd context is
/// shared and guarded by a mutex.
class BatchCompressor {
public:
    explicit BatchCompressor(const CompressionOptions& options = {});
    ~BatchCompressor();

    BatchCompressor(const BatchCompressor&) = delete;
    BatchCompressor& operator=(const BatchCompressor&) = delete;

    /// Allocate the zstd context (no-op for Codec::None)
    /// @return false if the context could not be created or the level is rejected
    bool init();

    /// Compress one encoded batch, or pass it through raw
    CompressedBatch compress(std::vector<uint8_t> encoded);

    CompressionStats stats() const;

private:
    struct ContextDeleter {
        void operator()(ZSTD_CCtx* ctx) const;
    };

    /// Send raw; counter (if any) records why
    CompressedBatch passthrough(std::vector<uint8_t> encoded, uint64_t* counter);

    CompressionOptions options_;

    mutable std::mutex mutex_;
    std::unique_ptr<ZSTD_CCtx, ContextDeleter> ctx_;
    CompressionStats stats_;
};

}  // namespace pubbatch
