// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "pubbatch/batch_compressor.hpp"

#include <glog/logging.h>
#include <zstd.h>

#include <algorithm>
#include <cctype>
#include <utility>

namespace pubbatch {

const char* to_string(Codec codec) {
    switch (codec) {
        case Codec::None: return "none";
        case Codec::Zstd: return "zstd";
    }
    return "unknown";
}

std::optional<Codec> codec_from_string(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "zstd") return Codec::Zstd;
    if (lower == "none") return Codec::None;
    return std::nullopt;
}

void BatchCompressor::ContextDeleter::operator()(ZSTD_CCtx* ctx) const {
    ZSTD_freeCCtx(ctx);
}

BatchCompressor::BatchCompressor(const CompressionOptions& options)
    : options_(options) {
}

BatchCompressor::~BatchCompressor() = default;

bool BatchCompressor::init() {
    if (options_.codec == Codec::None) {
        return true;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (ctx_) {
        return true;
    }

    ctx_.reset(ZSTD_createCCtx());
    if (!ctx_) {
        LOG(ERROR) << "BatchCompressor: failed to create zstd context";
        return false;
    }

    size_t rc = ZSTD_CCtx_setParameter(ctx_.get(), ZSTD_c_compressionLevel, options_.level);
    if (ZSTD_isError(rc)) {
        LOG(ERROR) << "BatchCompressor: zstd level " << options_.level << " rejected: "
                   << ZSTD_getErrorName(rc);
        ctx_.reset();
        return false;
    }
    return true;
}

CompressedBatch BatchCompressor::compress(std::vector<uint8_t> encoded) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (options_.codec == Codec::None) {
        return passthrough(std::move(encoded), nullptr);
    }
    if (encoded.size() < options_.min_batch_bytes) {
        return passthrough(std::move(encoded), &stats_.batches_below_threshold);
    }
    if (!ctx_) {
        LOG_EVERY_N(WARNING, 100) << "BatchCompressor not initialized, sending batch uncompressed";
        return passthrough(std::move(encoded), &stats_.batches_incompressible);
    }

    std::vector<uint8_t> frame(ZSTD_compressBound(encoded.size()));
    size_t written = ZSTD_compress2(ctx_.get(), frame.data(), frame.size(),
                                    encoded.data(), encoded.size());
    if (ZSTD_isError(written)) {
        LOG_EVERY_N(WARNING, 100) << "zstd compression failed: " << ZSTD_getErrorName(written);
        return passthrough(std::move(encoded), &stats_.batches_incompressible);
    }
    if (written >= encoded.size()) {
        return passthrough(std::move(encoded), &stats_.batches_incompressible);
    }

    frame.resize(written);

    CompressedBatch out;
    out.encoded_size = encoded.size();
    out.codec = Codec::Zstd;
    out.bytes = std::move(frame);

    stats_.batches_compressed++;
    stats_.bytes_in += out.encoded_size;
    stats_.bytes_out += out.bytes.size();
    return out;
}

CompressedBatch BatchCompressor::passthrough(std::vector<uint8_t> encoded, uint64_t* counter) {
    if (counter) {
        (*counter)++;
    }
    stats_.bytes_in += encoded.size();
    stats_.bytes_out += encoded.size();

    CompressedBatch out;
    out.encoded_size = encoded.size();
    out.bytes = std::move(encoded);
    return out;
}

CompressionStats BatchCompressor::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

}  // namespace pubbatch
