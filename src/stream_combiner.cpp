#include "stream_combiner.hpp"
#include <memory>

namespace meshlink {

StreamCombiner::StreamCombiner(std::vector<SourceFactory> sources) : sources_(std::move(sources)) {}

StreamCombiner::StreamCombiner(std::vector<std::unique_ptr<Readable>> sources) {
    sources_.reserve(sources.size());
    for (auto& source : sources) {
        // std::function needs a copyable callable, so park the reader in a shared_ptr
        auto holder = std::make_shared<std::unique_ptr<Readable>>(std::move(source));
        sources_.push_back([holder]() { return std::move(*holder); });
    }
}

StreamCombiner::~StreamCombiner() {
    current_.close_quietly("StreamCombiner");
}

bool StreamCombiner::advance() {
    current_.close_quietly("StreamCombiner");
    while (next_source_ < sources_.size()) {
        std::unique_ptr<Readable> next = sources_[next_source_++]();
        if (next) {
            current_ = ScopedReader(std::move(next));
            return true;
        }
    }
    done_ = true;
    return false;
}

Bytes StreamCombiner::read(std::size_t max_bytes) {
    Bytes out;
    while (!done_ && out.size() < max_bytes) {
        if (!current_ && !advance()) {
            break;
        }
        Bytes part = current_->read(max_bytes - out.size());
        if (part.empty()) {
            // Exhausted: drop it so the next pass opens the following source
            current_.close_quietly("StreamCombiner");
            continue;
        }
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

Bytes StreamCombiner::read_all() {
    Bytes out;
    while (!done_) {
        if (!current_ && !advance()) {
            break;
        }
        Bytes part = current_->read_all();
        current_.close_quietly("StreamCombiner");
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

void StreamCombiner::close() {
    current_.close_quietly("StreamCombiner");
    done_ = true;
}

}
