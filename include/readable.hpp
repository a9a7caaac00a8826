#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace meshlink {

using Bytes = std::vector<uint8_t>;

// Block size used when a stream is drained or re-encoded (64 KB)
const std::size_t DEFAULT_BLOCK_SIZE = 64 * 1024;

// A forward-only byte source. An empty read result means the source is
// exhausted; it is never signalled with an exception.
class Readable {
public:
    virtual ~Readable() = default;

    // Reads up to max_bytes
    virtual Bytes read(std::size_t max_bytes) = 0;

    // Reads everything that is left
    virtual Bytes read_all();

    // Total length, if the source knows it without being read
    virtual std::optional<uint64_t> size() const { return std::nullopt; }

    virtual void close() {}
};

// Owns a Readable and closes it exactly once. Streams that wrap another
// stream hold one of these instead of managing close() themselves.
class ScopedReader {
public:
    ScopedReader() = default;
    explicit ScopedReader(std::unique_ptr<Readable> inner);
    ~ScopedReader();

    ScopedReader(ScopedReader&& other) noexcept;
    ScopedReader& operator=(ScopedReader&& other) noexcept;
    ScopedReader(const ScopedReader&) = delete;
    ScopedReader& operator=(const ScopedReader&) = delete;

    Readable* get() const { return inner_.get(); }
    Readable* operator->() const { return inner_.get(); }
    explicit operator bool() const { return inner_ != nullptr; }

    // Closes and drops the inner stream; errors from close() propagate
    void close();

    // Same as close(), but a failing close() is logged instead of thrown
    void close_quietly(const char* owner);

private:
    std::unique_ptr<Readable> inner_;
};

// Line iteration over any Readable
class LineReader {
public:
    explicit LineReader(Readable& source, std::size_t block_size = DEFAULT_BLOCK_SIZE);

    // Next line including its '\n'; the final line may lack one.
    // Empty once the source is exhausted.
    std::string read_line();
    std::vector<std::string> read_lines();

private:
    Readable& source_;
    std::size_t block_size_;
    std::string pending_;
    bool eof_ = false;
};

}
