#include "readable.hpp"
#include <iostream>
#include <utility>

namespace meshlink {

Bytes Readable::read_all() {
    Bytes result;
    while (true) {
        Bytes block = read(DEFAULT_BLOCK_SIZE);
        if (block.empty()) {
            return result;
        }
        result.insert(result.end(), block.begin(), block.end());
    }
}

ScopedReader::ScopedReader(std::unique_ptr<Readable> inner) : inner_(std::move(inner)) {}

ScopedReader::~ScopedReader() {
    close_quietly("ScopedReader");
}

ScopedReader::ScopedReader(ScopedReader&& other) noexcept : inner_(std::move(other.inner_)) {}

ScopedReader& ScopedReader::operator=(ScopedReader&& other) noexcept {
    if (this != &other) {
        close_quietly("ScopedReader");
        inner_ = std::move(other.inner_);
    }
    return *this;
}

void ScopedReader::close() {
    if (!inner_) {
        return;
    }
    // Drop ownership first so a throwing close() is not retried
    std::unique_ptr<Readable> inner = std::move(inner_);
    inner->close();
}

void ScopedReader::close_quietly(const char* owner) {
    try {
        close();
    } catch (const std::exception& e) {
        std::cerr << "[" << owner << "] WARNING: error while closing stream: " << e.what() << std::endl;
    }
}

LineReader::LineReader(Readable& source, std::size_t block_size)
    : source_(source), block_size_(block_size) {}

std::string LineReader::read_line() {
    while (true) {
        std::size_t newline = pending_.find('\n');
        if (newline != std::string::npos) {
            std::string line = pending_.substr(0, newline + 1);
            pending_.erase(0, newline + 1);
            return line;
        }
        if (eof_) {
            std::string line;
            line.swap(pending_);
            return line;
        }
        Bytes block = source_.read(block_size_);
        if (block.empty()) {
            eof_ = true;
        } else {
            pending_.append(block.begin(), block.end());
        }
    }
}

std::vector<std::string> LineReader::read_lines() {
    std::vector<std::string> lines;
    for (std::string line = read_line(); !line.empty(); line = read_line()) {
        lines.push_back(std::move(line));
    }
    return lines;
}

}
