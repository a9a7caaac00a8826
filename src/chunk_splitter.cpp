#include "chunk_splitter.hpp"
#include "meshlink/errors.hpp"
#include <algorithm>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace meshlink {

// --- ChunkCursor ---
ChunkCursor::ChunkCursor(std::unique_ptr<BoundedReader> source)
    : source_(std::move(source)), total_size_(source_->remaining()) {}

void ChunkCursor::hand_over(uint32_t number, uint64_t budget) {
    if (owner_ != 0 && owner_budget_ > 0) {
        std::cerr << "[ChunkSplitter] WARNING: chunk " << owner_ << " was left with "
                  << owner_budget_ << " unread bytes; skipping them" << std::endl;
        source_->skip(owner_budget_);
    }
    owner_ = number;
    owner_budget_ = budget;
}

Bytes ChunkCursor::read_for(uint32_t number, std::size_t max_bytes) {
    if (number != owner_) {
        throw std::logic_error("Chunk " + std::to_string(number) +
                               " was read after chunk " + std::to_string(owner_) + " took over the cursor");
    }
    std::size_t want = static_cast<std::size_t>(std::min<uint64_t>(max_bytes, owner_budget_));
    if (want == 0) {
        return {};
    }
    Bytes data = source_->read(want);
    if (data.empty()) {
        // Only a closed source gets here; a short one already threw
        throw SourceShortfall(total_size_, owner_budget_);
    }
    owner_budget_ -= data.size();
    return data;
}

uint64_t ChunkCursor::remaining_for(uint32_t number) const {
    return number == owner_ ? owner_budget_ : 0;
}

// --- ChunkView ---
ChunkView::ChunkView(std::shared_ptr<ChunkCursor> cursor, uint32_t number, uint64_t offset, uint64_t size)
    : cursor_(std::move(cursor)), number_(number), offset_(offset), size_(size) {}

Bytes ChunkView::read(std::size_t max_bytes) {
    return cursor_->read_for(number_, max_bytes);
}

// --- ChunkSplitter ---
ChunkSplitter::ChunkSplitter(std::unique_ptr<BoundedReader> source, uint64_t chunk_size)
    : chunk_size_(chunk_size), chunk_count_(0) {
    if (chunk_size_ == 0) {
        throw std::invalid_argument("ChunkSplitter: chunk size must be positive");
    }
    if (!source) {
        throw std::invalid_argument("ChunkSplitter: null source");
    }
    cursor_ = std::make_shared<ChunkCursor>(std::move(source));
    chunk_count_ = chunk_count_for(cursor_->total_size(), chunk_size_);
}

uint32_t ChunkSplitter::chunk_count_for(uint64_t total_size, uint64_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("ChunkSplitter: chunk size must be positive");
    }
    uint64_t count = total_size / chunk_size + (total_size % chunk_size != 0 ? 1 : 0);
    count = std::max<uint64_t>(count, 1);
    if (count > std::numeric_limits<uint32_t>::max()) {
        throw std::invalid_argument("ChunkSplitter: payload needs more chunks than can be numbered");
    }
    return static_cast<uint32_t>(count);
}

std::unique_ptr<ChunkView> ChunkSplitter::next() {
    if (!has_next()) {
        return nullptr;
    }
    const uint32_t number = next_number_++;
    const uint64_t offset = static_cast<uint64_t>(number - 1) * chunk_size_;
    const uint64_t size = std::min(chunk_size_, total_size() - std::min(offset, total_size()));

    cursor_->hand_over(number, size);
    return std::make_unique<ChunkView>(cursor_, number, offset, size);
}

}
