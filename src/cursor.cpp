#include "lazyjson/cursor.hpp"

#include "lazyjson/log.hpp"
#include "lazyjson/scanner.hpp"

#include <utility>


namespace LazyJson {

    namespace {
        using code = ReadError::code;
    } // namespace

    Cursor::Cursor(std::vector<std::shared_ptr<ByteSource>> sources, Located first, const ReaderOptions& opts)
        : m_Sources{ std::move(sources) }, m_SourceIndex{ first.source_index },
          m_Current{ std::move(first.node) }, m_Opts{ opts } {}

    Result<Cursor> Cursor::open(std::shared_ptr<ByteSource> source, const ReaderOptions& opts) {
        std::vector<std::shared_ptr<ByteSource>> sources;
        sources.push_back(std::move(source));
        return open(std::move(sources), opts);
    }

    Result<Cursor> Cursor::open(std::vector<std::shared_ptr<ByteSource>> sources, const ReaderOptions& opts) {
        if (sources.empty()) return std::unexpected(ReadError::make(code::invalid_argument, 0, "Cursor requires at least one byte source"));
        for (const auto& s : sources) {
            if (!s) return std::unexpected(ReadError::make(code::invalid_argument, 0, "Cursor byte source is null"));
        }

        auto first = locate(sources, 0, 0, opts);
        if (!first) return std::unexpected(first.error());
        return Cursor{ std::move(sources), std::move(*first), opts };
    }

    Result<Cursor::Located> Cursor::locate(const std::vector<std::shared_ptr<ByteSource>>& sources, std::size_t index, position pos, const ReaderOptions& opts) {
        for (; index < sources.size(); index++, pos = 0) {
            Scanner s{ *sources[index], opts };
            auto start = s.skip_trivia(pos);
            if (!start) {
                if (start.error().errc != code::unexpected_end) return std::unexpected(start.error());
                LAZYJSON_DEBUG_LOG("source {} has no value after offset {}", index, pos);
                continue;
            }

            auto node = Node::open(sources[index], *start, opts);
            if (!node) return std::unexpected(node.error());
            return Located{ index, std::move(*node) };
        }
        return std::unexpected(ReadError::make(code::stream_exhausted, pos, "No further value in the stream"));
    }

    Result<void> Cursor::advance() {
        if (!m_End) {
            Scanner s{ *m_Current.source(), m_Opts };
            auto end = s.skip_value(m_Current.start());
            if (!end) return std::unexpected(end.error());
            m_End = *end;
        }

        auto next = locate(m_Sources, m_SourceIndex, *m_End, m_Opts);
        if (!next) {
            if (next.error().errc == code::stream_exhausted)
                LAZYJSON_DEBUG_LOG("stream exhausted after {} values", m_Ordinal + 1);
            return std::unexpected(next.error());
        }

        if (next->source_index != m_SourceIndex)
            LAZYJSON_DEBUG_LOG("moving from source {} to source {}", m_SourceIndex, next->source_index);

        m_SourceIndex = next->source_index;
        m_Current = std::move(next->node);
        m_End.reset();
        m_Ordinal++;
        return {};
    }

    Result<void> Cursor::advance_by(std::int64_t n) {
        if (n < 0) return std::unexpected(ReadError::make(code::invalid_argument, m_Current.start(), "advance_by requires a non-negative count"));
        for (std::int64_t i = 0; i < n; i++) {
            if (auto r = advance(); !r) return r;
        }
        return {};
    }

} // namespace LazyJson
