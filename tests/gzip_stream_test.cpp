#include <cassert>
#include <string>

#include "gzip_stream.hpp"
#include "payload_source.hpp"
#include "meshlink/errors.hpp"

using meshlink::Bytes;
using meshlink::CodecError;
using meshlink::GzipStreamFilter;
using meshlink::MemoryReader;

namespace {

Bytes gzip(const Bytes& data, std::size_t block_size = meshlink::DEFAULT_BLOCK_SIZE) {
    return GzipStreamFilter::compress(std::make_unique<MemoryReader>(data), block_size)->read_all();
}

Bytes gunzip(const Bytes& data, std::size_t block_size = meshlink::DEFAULT_BLOCK_SIZE) {
    return GzipStreamFilter::decompress(std::make_unique<MemoryReader>(data), block_size)->read_all();
}

Bytes bytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

bool throws_codec_error(const Bytes& data) {
    try {
        gunzip(data);
    } catch (const CodecError&) {
        return true;
    }
    return false;
}

}

int main() {
    // Round trip
    {
        Bytes original = bytes("Hello World, hello world, HELLO WORLD");
        Bytes compressed = gzip(original);
        assert(compressed.size() > 10);
        assert(compressed[0] == 0x1f && compressed[1] == 0x8b);
        assert(gunzip(compressed) == original);
    }

    // Empty input still produces a valid gzip stream that decodes to nothing
    {
        Bytes compressed = gzip(Bytes{});
        assert(!compressed.empty());
        assert(gunzip(compressed).empty());
        assert(gunzip(Bytes{}).empty());
    }

    // Larger than one block, with tiny blocks on both sides
    {
        Bytes original(200 * 1024);
        uint32_t state = 12345;
        for (auto& b : original) {
            state = state * 1103515245u + 12345u;
            b = static_cast<uint8_t>((state >> 16) % 7);
        }
        Bytes compressed = gzip(original, 1000);
        assert(compressed.size() < original.size());
        assert(gunzip(compressed, 333) == original);
    }

    // Reads are served in whatever sizes the caller asks for
    {
        Bytes original = bytes("abcdefghijklmnopqrstuvwxyz");
        auto filter = GzipStreamFilter::decompress(std::make_unique<MemoryReader>(gzip(original)));
        Bytes collected;
        for (Bytes part = filter->read(3); !part.empty(); part = filter->read(3)) {
            assert(part.size() <= 3);
            collected.insert(collected.end(), part.begin(), part.end());
        }
        assert(collected == original);
        // Drained: every further read is empty
        assert(filter->read(10).empty());
        assert(filter->read(10).empty());
    }

    // Concatenated members decode as one stream
    {
        Bytes first = gzip(bytes("Hello"));
        Bytes second = gzip(bytes(" World"));
        Bytes both = first;
        both.insert(both.end(), second.begin(), second.end());
        assert(gunzip(both) == bytes("Hello World"));
    }

    // Malformed and truncated input
    {
        assert(throws_codec_error(bytes("this is not gzip data at all")));

        Bytes compressed = gzip(bytes("some text that gets cut off before the trailer"));
        compressed.resize(compressed.size() - 6);
        assert(throws_codec_error(compressed));
    }

    // A failed filter stays finished
    {
        auto filter = GzipStreamFilter::decompress(std::make_unique<MemoryReader>(bytes("garbage!")));
        bool threw = false;
        try {
            filter->read(100);
        } catch (const CodecError&) {
            threw = true;
        }
        assert(threw);
        assert(filter->read(100).empty());
    }

    // close() before draining
    {
        auto filter = GzipStreamFilter::compress(std::make_unique<MemoryReader>(bytes("unused")));
        filter->close();
        assert(filter->read(10).empty());
    }

    return 0;
}
