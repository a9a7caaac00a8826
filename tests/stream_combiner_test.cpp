#include <algorithm>
#include <cassert>
#include <stdexcept>
#include <string>
#include <vector>

#include "payload_source.hpp"
#include "stream_combiner.hpp"

using meshlink::Bytes;
using meshlink::MemoryReader;
using meshlink::Readable;
using meshlink::StreamCombiner;

namespace {

std::string text(const Bytes& b) {
    return std::string(b.begin(), b.end());
}

class ThrowingClose : public Readable {
public:
    explicit ThrowingClose(std::string data) : inner_(data) {}
    Bytes read(std::size_t max_bytes) override { return inner_.read(max_bytes); }
    void close() override { throw std::runtime_error("close failed"); }

private:
    MemoryReader inner_;
};

// Hands out at most `step` bytes per read without being exhausted
class TrickleReader : public Readable {
public:
    TrickleReader(std::string data, std::size_t step) : inner_(data), step_(step) {}
    Bytes read(std::size_t max_bytes) override { return inner_.read(std::min(max_bytes, step_)); }

private:
    MemoryReader inner_;
    std::size_t step_;
};

}

int main() {
    // Sources are opened only when reading reaches them
    {
        std::vector<std::string> opened;
        std::vector<StreamCombiner::SourceFactory> factories;
        for (std::string part : {"Hello", " Worl", "d"}) {
            factories.push_back([&opened, part]() {
                opened.push_back(part);
                return std::make_unique<MemoryReader>(part);
            });
        }
        StreamCombiner combiner(std::move(factories));
        assert(opened.empty());

        assert(text(combiner.read(5)) == "Hello");
        assert(opened.size() == 1);

        assert(text(combiner.read(3)) == " Wo");
        assert(opened.size() == 2);

        assert(text(combiner.read(100)) == "rld");
        assert(opened.size() == 3);

        assert(combiner.read(100).empty());
        assert(combiner.read(100).empty());
    }

    // Reading in fixed steps reproduces the concatenation
    {
        std::vector<std::unique_ptr<Readable>> parts;
        parts.push_back(std::make_unique<MemoryReader>(std::string("abc")));
        parts.push_back(std::make_unique<MemoryReader>(std::string("")));
        parts.push_back(std::make_unique<MemoryReader>(std::string("defgh")));
        StreamCombiner combiner(std::move(parts));
        std::string collected;
        for (Bytes block = combiner.read(2); !block.empty(); block = combiner.read(2)) {
            assert(block.size() == 2 || collected.size() == 6);
            collected += text(block);
        }
        assert(collected == "abcdefgh");
    }

    // read_all and a null factory result (skipped)
    {
        std::vector<StreamCombiner::SourceFactory> factories;
        factories.push_back([]() { return std::make_unique<MemoryReader>(std::string("one,")); });
        factories.push_back([]() { return std::unique_ptr<Readable>(); });
        factories.push_back([]() { return std::make_unique<MemoryReader>(std::string("two")); });
        StreamCombiner combiner(std::move(factories));
        assert(text(combiner.read_all()) == "one,two");
        assert(combiner.read_all().empty());
        assert(combiner.opened() == 3);
    }

    // No sources at all
    {
        StreamCombiner combiner(std::vector<StreamCombiner::SourceFactory>{});
        assert(combiner.read(10).empty());
    }

    // close() stops reading; sources never reached are never opened
    {
        int opened = 0;
        std::vector<StreamCombiner::SourceFactory> factories;
        for (int i = 0; i < 3; ++i) {
            factories.push_back([&opened]() {
                ++opened;
                return std::make_unique<MemoryReader>(std::string("xyz"));
            });
        }
        StreamCombiner combiner(std::move(factories));
        assert(text(combiner.read(2)) == "xy");
        combiner.close();
        combiner.close();
        assert(combiner.read(10).empty());
        assert(opened == 1);
    }

    // A source whose close() fails does not stop the combination
    {
        std::vector<std::unique_ptr<Readable>> parts;
        parts.push_back(std::make_unique<ThrowingClose>("left "));
        parts.push_back(std::make_unique<ThrowingClose>("right"));
        StreamCombiner combiner(std::move(parts));
        assert(text(combiner.read_all()) == "left right");
    }

    // A short read does not move on to the next source; only an empty one does
    {
        std::vector<std::unique_ptr<Readable>> parts;
        parts.push_back(std::make_unique<TrickleReader>("abcdef", 2));
        parts.push_back(std::make_unique<MemoryReader>(std::string("XYZ")));
        StreamCombiner combiner(std::move(parts));
        assert(text(combiner.read(5)) == "abcde");
        assert(text(combiner.read_all()) == "fXYZ");
    }

    return 0;
}
