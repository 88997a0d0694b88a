#include <memory>
#include <print>
#include <string_view>
#include <utility>
#include <vector>

#include "lazyjson/lazyjson.hpp"

// Prints a one-line summary of every top-level value in the given files,
// read as one concatenated JSON stream.
int main(int argc, char** argv) {
    if (argc < 2) {
        std::println("usage: {} FILE...", argv[0]);
        return 2;
    }

    std::vector<std::shared_ptr<LazyJson::ByteSource>> sources;
    for (int i = 1; i < argc; i++) {
        auto src = LazyJson::open_file(argv[i]);
        if (!src) {
            std::println("{}", src.error().msg);
            return 1;
        }
        sources.push_back(std::move(*src));
    }

    auto cursor = LazyJson::Cursor::open(std::move(sources));
    if (!cursor) {
        std::println("Read error ({}) at offset {}: {}", LazyJson::to_string(cursor.error().errc), cursor.error().offset, cursor.error().msg);
        return 1;
    }

    while (true) {
        const auto& node = cursor->current();
        if (node.is_array() || node.is_object()) {
            auto n = node.length();
            if (!n) {
                std::println("Read error at offset {}: {}", n.error().offset, n.error().msg);
                return 1;
            }
            std::println("#{} {} with {} entries (source {}, offset {})", cursor->ordinal(), LazyJson::to_string(node.kind()), *n, cursor->source_index(), node.start());
        } else {
            std::println("#{} {} (source {}, offset {})", cursor->ordinal(), LazyJson::to_string(node.kind()), cursor->source_index(), node.start());
        }

        if (auto r = cursor->advance(); !r) {
            if (r.error().errc == LazyJson::ReadError::code::stream_exhausted) break;
            std::println("Read error at offset {}: {}", r.error().offset, r.error().msg);
            return 1;
        }
    }

    return 0;
}
