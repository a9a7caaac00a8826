#pragma once

#include "readable.hpp"
#include <fstream>
#include <istream>
#include <string>

namespace meshlink {

// In-memory buffer
class MemoryReader : public Readable {
public:
    explicit MemoryReader(Bytes data);
    explicit MemoryReader(const std::string& data);

    Bytes read(std::size_t max_bytes) override;
    std::optional<uint64_t> size() const override { return data_.size(); }

    // Serve the buffer again from the start
    void rewind() { pos_ = 0; }

private:
    Bytes data_;
    std::size_t pos_ = 0;
};

// A file on disk; its length comes from seeking to the end
class FileReader : public Readable {
public:
    explicit FileReader(const std::string& path);

    Bytes read(std::size_t max_bytes) override;
    std::optional<uint64_t> size() const override { return file_size_; }
    void close() override;

private:
    std::ifstream file_;
    uint64_t file_size_ = 0;
};

// Any std::istream. The length is taken from the annotation when given,
// otherwise discovered by seeking; non-seekable streams report no length.
// The stream is not owned and must outlive the reader.
class IstreamReader : public Readable {
public:
    explicit IstreamReader(std::istream& in, std::optional<uint64_t> declared_length = std::nullopt);

    Bytes read(std::size_t max_bytes) override;
    std::optional<uint64_t> size() const override { return length_; }

private:
    std::istream& in_;
    std::optional<uint64_t> length_;
};

// Never reads past a declared total length, whatever the underlying source
// would yield. A source that ends before the declared length raises
// SourceShortfall.
class BoundedReader : public Readable {
public:
    // Throws UnsupportedSourceKind when neither declared_length nor
    // source->size() gives a length
    explicit BoundedReader(std::unique_ptr<Readable> source,
                           std::optional<uint64_t> declared_length = std::nullopt);

    Bytes read(std::size_t max_bytes) override;
    std::optional<uint64_t> size() const override { return length_; }
    void close() override;

    // Discards up to n bytes, returns how many were skipped
    uint64_t skip(uint64_t n);

    uint64_t remaining() const { return remaining_; }

private:
    ScopedReader source_;
    uint64_t length_;
    uint64_t remaining_;
};

// --- Payload construction for each supported source kind ---
std::unique_ptr<BoundedReader> payload_from_bytes(Bytes data);
std::unique_ptr<BoundedReader> payload_from_string(const std::string& data);
std::unique_ptr<BoundedReader> payload_from_file(const std::string& path);
std::unique_ptr<BoundedReader> payload_from_stream(std::istream& in,
                                                   std::optional<uint64_t> length = std::nullopt);
// Concatenation of streams with an explicit total length
std::unique_ptr<BoundedReader> payload_from_streams(std::vector<std::unique_ptr<Readable>> parts,
                                                    uint64_t total_length);

}
