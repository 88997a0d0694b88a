#pragma once


/*
    -----------------------------------------------
    LazyJson::ByteSource - Seekable byte input
    -----------------------------------------------
    A `ByteSource` is anything that can read bytes sequentially and seek to
    an absolute position. Every node and cursor reads through one.

    --------
    Contract
    --------
    - `read(dst, n)` copies up to `n` bytes from the current position and
      advances it. Fewer bytes are returned near the end; 0 means end of data
    - `seek(pos)` moves the current position to the absolute offset `pos`
    - `tell()` reports the current position

    -------
    Sharing
    -------
    A source has exactly one read position, shared by every node derived
    from it. Each LazyJson operation seeks to the position it needs before
    reading, so operations are correct one at a time, but using nodes of the
    same source from several threads must be serialized by the caller.

    --------
    Adapters
    --------
    - `StringSource`: owns an in-memory copy of the bytes
    - `StreamSource`: wraps any seekable `std::istream`
    - `open_file(path)`: a `StreamSource` over a `std::ifstream` in binary mode
*/

#include <cstddef>
#include <filesystem>
#include <istream>
#include <memory>
#include <string>
#include <string_view>

#include "lazyjson/config.hpp"
#include "lazyjson/error.hpp"

/// @defgroup LazyJsonSource Byte Sources
/// @ingroup LazyJson
/// @brief Seekable inputs consumed by the scanner

namespace LazyJson {

    /// @ingroup LazyJsonSource
    /// @brief Abstract seekable byte input
    class LAZYJSON_API ByteSource {
    public:
        virtual ~ByteSource() = default;

        /// @brief Reads up to @p n bytes into @p dst
        /// @return Number of bytes read; 0 at end of data
        virtual Result<std::size_t> read(char* dst, std::size_t n) = 0;

        /// @brief Moves the read position to the absolute offset @p pos
        virtual Result<void> seek(position pos) = 0;

        /// @brief Current read position
        virtual Result<position> tell() = 0;
    };

    /// @ingroup LazyJsonSource
    /// @brief In-memory byte source
    class LAZYJSON_API StringSource : public ByteSource {
    public:
        explicit StringSource(std::string data) noexcept;

        Result<std::size_t> read(char* dst, std::size_t n) override;
        Result<void> seek(position pos) override;
        Result<position> tell() override;

        [[nodiscard]] std::size_t size() const noexcept { return m_Data.size(); }

    private:
        std::string m_Data;
        position m_Pos = 0;
    };

    /// @ingroup LazyJsonSource
    /// @brief Byte source over a seekable `std::istream`
    ///
    /// @details
    /// Stream state flags are cleared before every operation, so reaching the
    /// end of the stream does not prevent seeking back.
    class LAZYJSON_API StreamSource : public ByteSource {
    public:
        explicit StreamSource(std::unique_ptr<std::istream> stream) noexcept;

        Result<std::size_t> read(char* dst, std::size_t n) override;
        Result<void> seek(position pos) override;
        Result<position> tell() override;

    private:
        std::unique_ptr<std::istream> m_Stream;
    };

    /// @ingroup LazyJsonSource
    /// @brief Creates a source from an in-memory JSON text
    [[nodiscard]] LAZYJSON_API std::shared_ptr<ByteSource> make_source(std::string_view text);

    /// @ingroup LazyJsonSource
    /// @brief Opens @p path for binary reading
    ///
    /// @return The source, or `io_error` if the file cannot be opened
    [[nodiscard]] LAZYJSON_API Result<std::shared_ptr<ByteSource>> open_file(const std::filesystem::path& path);

} // namespace LazyJson
