#pragma once

// ============================================================
// compress.hpp -- zstd streaming wrappers for sync v2 transfers
// ============================================================

#include "platform.hpp"
#include "errors.hpp"
#include <vector>
#include <string>

#include "zstd.h"

namespace compress {

// Compression level 1 = fastest
static constexpr int ZSTD_LEVEL = 1;

inline void check(size_t rc, const char* what) {
    if (ZSTD_isError(rc)) {
        throw FastAdbError(std::string("ZSTD ") + what + " error: " + ZSTD_getErrorName(rc));
    }
}

// Streaming compressor; output is appended to the caller's buffer so a
// sync DATA frame can be cut from it at any boundary.
class StreamCompressor {
public:
    explicit StreamCompressor(int level = ZSTD_LEVEL) {
        ctx_ = ZSTD_createCCtx();
        if (!ctx_) throw FastAdbError("ZSTD_createCCtx failed");
        check(ZSTD_CCtx_setParameter(ctx_, ZSTD_c_compressionLevel, level), "setParameter");
        scratch_.resize(ZSTD_CStreamOutSize());
    }

    ~StreamCompressor() {
        if (ctx_) ZSTD_freeCCtx(ctx_);
    }

    StreamCompressor(const StreamCompressor&) = delete;
    StreamCompressor& operator=(const StreamCompressor&) = delete;

    void write(const void* src, size_t len, std::vector<u8>& out) {
        ZSTD_inBuffer in{src, len, 0};
        while (in.pos < in.size) {
            ZSTD_outBuffer ob{scratch_.data(), scratch_.size(), 0};
            check(ZSTD_compressStream2(ctx_, &ob, &in, ZSTD_e_continue), "compress");
            out.insert(out.end(), scratch_.begin(), scratch_.begin() + (long)ob.pos);
        }
    }

    // Flush the epilogue; the compressor is done afterwards
    void finish(std::vector<u8>& out) {
        ZSTD_inBuffer in{nullptr, 0, 0};
        size_t remaining;
        do {
            ZSTD_outBuffer ob{scratch_.data(), scratch_.size(), 0};
            remaining = ZSTD_compressStream2(ctx_, &ob, &in, ZSTD_e_end);
            check(remaining, "compress");
            out.insert(out.end(), scratch_.begin(), scratch_.begin() + (long)ob.pos);
        } while (remaining != 0);
    }

private:
    ZSTD_CCtx*      ctx_;
    std::vector<u8> scratch_;
};

class StreamDecompressor {
public:
    StreamDecompressor() {
        ctx_ = ZSTD_createDCtx();
        if (!ctx_) throw FastAdbError("ZSTD_createDCtx failed");
        scratch_.resize(ZSTD_DStreamOutSize());
    }

    ~StreamDecompressor() {
        if (ctx_) ZSTD_freeDCtx(ctx_);
    }

    StreamDecompressor(const StreamDecompressor&) = delete;
    StreamDecompressor& operator=(const StreamDecompressor&) = delete;

    void write(const void* src, size_t len, std::vector<u8>& out) {
        ZSTD_inBuffer in{src, len, 0};
        // Loop until input is consumed and the output buffer was not filled,
        // otherwise zstd may still hold decoded bytes.
        bool full;
        do {
            ZSTD_outBuffer ob{scratch_.data(), scratch_.size(), 0};
            size_t rc = ZSTD_decompressStream(ctx_, &ob, &in);
            check(rc, "decompress");
            frame_done_ = (rc == 0);
            out.insert(out.end(), scratch_.begin(), scratch_.begin() + (long)ob.pos);
            full = (ob.pos == ob.size);
        } while (in.pos < in.size || full);
    }

    // True once a complete zstd frame has been decoded
    bool frame_done() const { return frame_done_; }

private:
    ZSTD_DCtx*      ctx_;
    std::vector<u8> scratch_;
    bool            frame_done_{false};
};

} // namespace compress
