#include "gzip_stream.hpp"
#include "meshlink/errors.hpp"
#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>

namespace meshlink {

namespace {

// zlib windowBits: 15 plus 16 selects gzip framing, plus 32 auto-detects
// gzip or zlib headers when inflating
const int GZIP_WINDOW_BITS = 15 + 16;
const int AUTO_DETECT_WINDOW_BITS = 15 + 32;
const int COMPRESSION_LEVEL = 9;
const int MEM_LEVEL = 8;

std::string zlib_message(const z_stream& strm, int ret) {
    std::string msg = strm.msg ? strm.msg : zError(ret);
    return "gzip: " + msg + " (zlib code " + std::to_string(ret) + ")";
}

}

GzipStreamFilter::GzipStreamFilter(std::unique_ptr<Readable> underlying, Mode mode, std::size_t block_size)
    : underlying_(std::move(underlying)), mode_(mode), block_size_(block_size) {
    if (!underlying_) {
        throw std::invalid_argument("GzipStreamFilter: null source");
    }
    if (block_size_ == 0) {
        throw std::invalid_argument("GzipStreamFilter: block size must be positive");
    }

    int ret = (mode_ == Mode::COMPRESS)
        ? deflateInit2(&strm_, COMPRESSION_LEVEL, Z_DEFLATED, GZIP_WINDOW_BITS, MEM_LEVEL, Z_DEFAULT_STRATEGY)
        : inflateInit2(&strm_, AUTO_DETECT_WINDOW_BITS);
    if (ret != Z_OK) {
        throw CodecError(zlib_message(strm_, ret));
    }
    codec_ready_ = true;
}

GzipStreamFilter::~GzipStreamFilter() {
    if (codec_ready_) {
        if (mode_ == Mode::COMPRESS) {
            deflateEnd(&strm_);
        } else {
            inflateEnd(&strm_);
        }
    }
}

std::unique_ptr<GzipStreamFilter> GzipStreamFilter::compress(std::unique_ptr<Readable> underlying,
                                                             std::size_t block_size) {
    return std::make_unique<GzipStreamFilter>(std::move(underlying), Mode::COMPRESS, block_size);
}

std::unique_ptr<GzipStreamFilter> GzipStreamFilter::decompress(std::unique_ptr<Readable> underlying,
                                                               std::size_t block_size) {
    return std::make_unique<GzipStreamFilter>(std::move(underlying), Mode::DECOMPRESS, block_size);
}

Bytes GzipStreamFilter::read(std::size_t max_bytes) {
    while (buffered() < max_bytes && !finished_) {
        refill();
    }

    std::size_t count = std::min(max_bytes, buffered());
    Bytes out(buffer_.begin() + buffer_pos_, buffer_.begin() + buffer_pos_ + count);
    buffer_pos_ += count;

    if (buffer_pos_ == buffer_.size()) {
        buffer_.clear();
        buffer_pos_ = 0;
    } else if (buffer_pos_ >= block_size_) {
        buffer_.erase(buffer_.begin(), buffer_.begin() + buffer_pos_);
        buffer_pos_ = 0;
    }
    return out;
}

void GzipStreamFilter::close() {
    finished_ = true;
    buffer_.clear();
    buffer_pos_ = 0;
    underlying_.close();
}

void GzipStreamFilter::refill() {
    try {
        Bytes block = underlying_->read(block_size_);
        if (block.empty()) {
            finish();
        } else {
            feed(block);
        }
    } catch (const CodecError&) {
        // A broken codec state cannot be resumed
        finished_ = true;
        underlying_.close_quietly("GzipStreamFilter");
        throw;
    }
}

void GzipStreamFilter::feed(const Bytes& block) {
    seen_input_ = true;
    strm_.next_in = const_cast<Bytef*>(block.data());
    strm_.avail_in = static_cast<uInt>(block.size());
    run_codec(Z_NO_FLUSH);
}

void GzipStreamFilter::finish() {
    if (mode_ == Mode::COMPRESS) {
        strm_.next_in = Z_NULL;
        strm_.avail_in = 0;
        run_codec(Z_FINISH);
    } else if (seen_input_ && !member_ended_) {
        throw CodecError("gzip: compressed stream is truncated");
    }
    finished_ = true;
    underlying_.close_quietly("GzipStreamFilter");
}

void GzipStreamFilter::run_codec(int flush) {
    std::array<Bytef, 16 * 1024> out;

    while (true) {
        if (mode_ == Mode::DECOMPRESS && member_ended_) {
            if (strm_.avail_in == 0) {
                break;
            }
            // Another gzip member follows the one that just ended
            inflateReset(&strm_);
            member_ended_ = false;
        }

        strm_.next_out = out.data();
        strm_.avail_out = static_cast<uInt>(out.size());

        int ret = (mode_ == Mode::COMPRESS) ? deflate(&strm_, flush) : inflate(&strm_, Z_NO_FLUSH);
        switch (ret) {
            case Z_NEED_DICT:
            case Z_DATA_ERROR:
            case Z_MEM_ERROR:
            case Z_STREAM_ERROR:
                throw CodecError(zlib_message(strm_, ret == Z_NEED_DICT ? Z_DATA_ERROR : ret));
            default:
                break;
        }

        std::size_t produced = out.size() - strm_.avail_out;
        buffer_.insert(buffer_.end(), out.begin(), out.begin() + produced);

        if (mode_ == Mode::COMPRESS) {
            if (flush == Z_FINISH ? ret == Z_STREAM_END : strm_.avail_out != 0) {
                break;
            }
        } else {
            if (ret == Z_STREAM_END) {
                member_ended_ = true;
                continue;
            }
            if (ret == Z_BUF_ERROR || (strm_.avail_in == 0 && strm_.avail_out != 0)) {
                break;
            }
        }
    }
}

}
