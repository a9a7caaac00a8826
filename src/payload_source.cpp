#include "payload_source.hpp"
#include "stream_combiner.hpp"
#include "meshlink/errors.hpp"
#include <algorithm>
#include <iostream>

namespace meshlink {

// --- MemoryReader ---
MemoryReader::MemoryReader(Bytes data) : data_(std::move(data)) {}

MemoryReader::MemoryReader(const std::string& data) : data_(data.begin(), data.end()) {}

Bytes MemoryReader::read(std::size_t max_bytes) {
    std::size_t count = std::min(max_bytes, data_.size() - pos_);
    Bytes out(data_.begin() + pos_, data_.begin() + pos_ + count);
    pos_ += count;
    return out;
}

// --- FileReader ---
FileReader::FileReader(const std::string& path) {
    file_.open(path, std::ios::binary | std::ios::in);
    if (!file_) {
        throw std::runtime_error("FileReader: Could not open file: " + path);
    }

    file_.seekg(0, std::ios::end);
    std::streamoff end = file_.tellg();
    if (end < 0) {
        throw UnsupportedSourceKind("FileReader: Could not determine size of " + path);
    }
    file_size_ = static_cast<uint64_t>(end);
    file_.seekg(0, std::ios::beg);
}

Bytes FileReader::read(std::size_t max_bytes) {
    if (!file_.is_open() || max_bytes == 0) {
        return {};
    }
    Bytes buffer(max_bytes);
    file_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(max_bytes));
    std::streamsize bytes_read = file_.gcount();
    if (file_.bad()) {
        throw std::runtime_error("FileReader: read error");
    }
    buffer.resize(static_cast<std::size_t>(bytes_read));
    return buffer;
}

void FileReader::close() {
    if (file_.is_open()) {
        file_.close();
    }
}

// --- IstreamReader ---
IstreamReader::IstreamReader(std::istream& in, std::optional<uint64_t> declared_length)
    : in_(in), length_(declared_length) {
    if (length_) {
        return;
    }
    std::streampos start = in_.tellg();
    if (start == std::streampos(-1)) {
        in_.clear();
        return;
    }
    in_.seekg(0, std::ios::end);
    std::streampos end = in_.tellg();
    in_.seekg(start);
    if (end == std::streampos(-1) || !in_) {
        in_.clear();
        in_.seekg(start);
        return;
    }
    length_ = static_cast<uint64_t>(end - start);
}

Bytes IstreamReader::read(std::size_t max_bytes) {
    if (max_bytes == 0 || !in_) {
        return {};
    }
    Bytes buffer(max_bytes);
    in_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(max_bytes));
    buffer.resize(static_cast<std::size_t>(in_.gcount()));
    return buffer;
}

// --- BoundedReader ---
BoundedReader::BoundedReader(std::unique_ptr<Readable> source, std::optional<uint64_t> declared_length)
    : length_(0), remaining_(0) {
    if (!source) {
        throw std::invalid_argument("BoundedReader: null source");
    }
    std::optional<uint64_t> length = declared_length ? declared_length : source->size();
    if (!length) {
        throw UnsupportedSourceKind("Payload source has no determinable length");
    }
    length_ = *length;
    remaining_ = length_;
    source_ = ScopedReader(std::move(source));
}

Bytes BoundedReader::read(std::size_t max_bytes) {
    uint64_t want = std::min<uint64_t>(max_bytes, remaining_);
    Bytes out;
    if (want == 0 || !source_) {
        return out;
    }
    out.reserve(static_cast<std::size_t>(want));
    while (out.size() < want) {
        Bytes part = source_->read(static_cast<std::size_t>(want - out.size()));
        if (part.empty()) {
            const uint64_t missing = remaining_ - out.size();
            remaining_ = 0;
            std::cerr << "[BoundedReader] ERROR: source ended " << missing
                      << " bytes short of its declared length " << length_ << std::endl;
            throw SourceShortfall(length_, missing);
        }
        out.insert(out.end(), part.begin(), part.end());
    }
    remaining_ -= out.size();
    return out;
}

uint64_t BoundedReader::skip(uint64_t n) {
    uint64_t skipped = 0;
    while (skipped < n) {
        std::size_t step = static_cast<std::size_t>(std::min<uint64_t>(n - skipped, DEFAULT_BLOCK_SIZE));
        Bytes discarded = read(step);
        if (discarded.empty()) {
            break;
        }
        skipped += discarded.size();
    }
    return skipped;
}

void BoundedReader::close() {
    source_.close();
}

// --- Payload construction ---
std::unique_ptr<BoundedReader> payload_from_bytes(Bytes data) {
    return std::make_unique<BoundedReader>(std::make_unique<MemoryReader>(std::move(data)));
}

std::unique_ptr<BoundedReader> payload_from_string(const std::string& data) {
    return std::make_unique<BoundedReader>(std::make_unique<MemoryReader>(data));
}

std::unique_ptr<BoundedReader> payload_from_file(const std::string& path) {
    return std::make_unique<BoundedReader>(std::make_unique<FileReader>(path));
}

std::unique_ptr<BoundedReader> payload_from_stream(std::istream& in, std::optional<uint64_t> length) {
    return std::make_unique<BoundedReader>(std::make_unique<IstreamReader>(in, length));
}

std::unique_ptr<BoundedReader> payload_from_streams(std::vector<std::unique_ptr<Readable>> parts,
                                                    uint64_t total_length) {
    return std::make_unique<BoundedReader>(std::make_unique<StreamCombiner>(std::move(parts)),
                                           total_length);
}

}
