#pragma once

#include "readable.hpp"
#include <zlib.h>

namespace meshlink {

// Block-wise gzip adapter over another Readable. Each refill reads one block
// from the source, runs it through zlib and buffers the output, so memory use
// stays bounded by the block size whatever the payload size.
//
// Single pass: once the source is exhausted the codec is finalised, the
// source is closed, and every later read returns empty.
class GzipStreamFilter : public Readable {
public:
    enum class Mode { COMPRESS, DECOMPRESS };

    GzipStreamFilter(std::unique_ptr<Readable> underlying, Mode mode,
                     std::size_t block_size = DEFAULT_BLOCK_SIZE);
    ~GzipStreamFilter() override;

    GzipStreamFilter(const GzipStreamFilter&) = delete;
    GzipStreamFilter& operator=(const GzipStreamFilter&) = delete;

    static std::unique_ptr<GzipStreamFilter> compress(std::unique_ptr<Readable> underlying,
                                                      std::size_t block_size = DEFAULT_BLOCK_SIZE);
    static std::unique_ptr<GzipStreamFilter> decompress(std::unique_ptr<Readable> underlying,
                                                        std::size_t block_size = DEFAULT_BLOCK_SIZE);

    // Throws CodecError when the block being decoded is malformed
    Bytes read(std::size_t max_bytes) override;
    void close() override;

    Mode mode() const { return mode_; }

private:
    void refill();
    void feed(const Bytes& block);
    void finish();
    void run_codec(int flush);
    std::size_t buffered() const { return buffer_.size() - buffer_pos_; }

    ScopedReader underlying_;
    Mode mode_;
    std::size_t block_size_;
    z_stream strm_{};
    bool codec_ready_ = false;
    bool finished_ = false;
    // Decompression: the current gzip member reached its trailer
    bool member_ended_ = false;
    bool seen_input_ = false;
    Bytes buffer_;
    std::size_t buffer_pos_ = 0;
};

}
