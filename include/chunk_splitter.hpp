#pragma once

#include "payload_source.hpp"
#include <cstdint>
#include <memory>

namespace meshlink {

// Default size of one transferred chunk (75 MB)
const uint64_t DEFAULT_CHUNK_SIZE = 75ull * 1024 * 1024;

// The single forward-only position shared by a splitter and its chunk views.
// Exactly one chunk owns the cursor at a time; ownership moves strictly in
// chunk order.
class ChunkCursor {
public:
    explicit ChunkCursor(std::unique_ptr<BoundedReader> source);

    // Hands the cursor to chunk `number`, skipping whatever the previous
    // owner left unread
    void hand_over(uint32_t number, uint64_t budget);

    // Reads on behalf of chunk `number`; throws std::logic_error when that
    // chunk no longer owns the cursor
    Bytes read_for(uint32_t number, std::size_t max_bytes);

    uint64_t remaining_for(uint32_t number) const;
    uint32_t owner() const { return owner_; }
    uint64_t total_size() const { return total_size_; }

private:
    std::unique_ptr<BoundedReader> source_;
    uint64_t total_size_;
    uint32_t owner_ = 0;
    uint64_t owner_budget_ = 0;
};

// One chunk: a window [offset, offset + size) over the shared cursor
class ChunkView : public Readable {
public:
    ChunkView(std::shared_ptr<ChunkCursor> cursor, uint32_t number, uint64_t offset, uint64_t size);

    Bytes read(std::size_t max_bytes) override;
    std::optional<uint64_t> size() const override { return size_; }

    // 1-based, as numbered on the wire
    uint32_t number() const { return number_; }
    uint64_t offset() const { return offset_; }
    uint64_t remaining() const { return cursor_->remaining_for(number_); }

private:
    std::shared_ptr<ChunkCursor> cursor_;
    uint32_t number_;
    uint64_t offset_;
    uint64_t size_;
};

// Splits a payload of known length into max(1, ceil(total / chunk_size))
// sequential chunks. A zero-length payload still gives one empty chunk.
class ChunkSplitter {
public:
    ChunkSplitter(std::unique_ptr<BoundedReader> source, uint64_t chunk_size = DEFAULT_CHUNK_SIZE);

    uint32_t length() const { return chunk_count_; }
    uint64_t total_size() const { return cursor_->total_size(); }
    uint64_t chunk_size() const { return chunk_size_; }

    bool has_next() const { return next_number_ <= chunk_count_; }

    // The next chunk, or nullptr once all chunks were handed out. Calling
    // this supersedes the previously returned view.
    std::unique_ptr<ChunkView> next();

    static uint32_t chunk_count_for(uint64_t total_size, uint64_t chunk_size);

private:
    std::shared_ptr<ChunkCursor> cursor_;
    uint64_t chunk_size_;
    uint32_t chunk_count_;
    uint32_t next_number_ = 1;
};

}
