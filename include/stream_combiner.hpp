#pragma once

#include "readable.hpp"
#include <functional>
#include <vector>

namespace meshlink {

// Concatenates an ordered list of sources into one stream. Sources are
// opened lazily: source k+1 is not created until source k is exhausted, so a
// factory that performs a network request runs only when it is reached.
class StreamCombiner : public Readable {
public:
    using SourceFactory = std::function<std::unique_ptr<Readable>()>;

    explicit StreamCombiner(std::vector<SourceFactory> sources);
    explicit StreamCombiner(std::vector<std::unique_ptr<Readable>> sources);
    ~StreamCombiner() override;

    Bytes read(std::size_t max_bytes) override;
    Bytes read_all() override;

    // Releases the current source; sources not reached are never opened
    void close() override;

    // Number of sources opened so far
    std::size_t opened() const { return next_source_; }

private:
    bool advance();

    std::vector<SourceFactory> sources_;
    std::size_t next_source_ = 0;
    ScopedReader current_;
    bool done_ = false;
};

}
