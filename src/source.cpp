#include "lazyjson/source.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <utility>


namespace LazyJson {

    StringSource::StringSource(std::string data) noexcept
        : m_Data{ std::move(data) } {}

    Result<std::size_t> StringSource::read(char* dst, std::size_t n) {
        if (m_Pos >= m_Data.size()) return 0;
        std::size_t count = std::min(n, m_Data.size() - m_Pos);
        std::memcpy(dst, m_Data.data() + m_Pos, count);
        m_Pos += count;
        return count;
    }

    Result<void> StringSource::seek(position pos) {
        // Seeking past the end is allowed; reads there return 0
        m_Pos = pos;
        return {};
    }

    Result<position> StringSource::tell() {
        return m_Pos;
    }

    StreamSource::StreamSource(std::unique_ptr<std::istream> stream) noexcept
        : m_Stream{ std::move(stream) } {}

    Result<std::size_t> StreamSource::read(char* dst, std::size_t n) {
        m_Stream->clear();
        m_Stream->read(dst, static_cast<std::streamsize>(n));
        if (m_Stream->bad()) {
            auto at = m_Stream->tellg();
            return std::unexpected(ReadError::make(ReadError::code::io_error, at < 0 ? 0 : static_cast<position>(at), "Stream read failed"));
        }
        auto count = static_cast<std::size_t>(m_Stream->gcount());
        m_Stream->clear();
        return count;
    }

    Result<void> StreamSource::seek(position pos) {
        m_Stream->clear();
        m_Stream->seekg(static_cast<std::streamoff>(pos), std::ios::beg);
        if (m_Stream->fail()) return std::unexpected(ReadError::make(ReadError::code::io_error, pos, "Stream seek failed"));
        return {};
    }

    Result<position> StreamSource::tell() {
        auto at = m_Stream->tellg();
        if (at < 0) return std::unexpected(ReadError::make(ReadError::code::io_error, 0, "Stream position unavailable"));
        return static_cast<position>(at);
    }

    std::shared_ptr<ByteSource> make_source(std::string_view text) {
        return std::make_shared<StringSource>(std::string{ text });
    }

    Result<std::shared_ptr<ByteSource>> open_file(const std::filesystem::path& path) {
        auto stream = std::make_unique<std::ifstream>(path, std::ios::binary);
        if (!stream->is_open()) return std::unexpected(ReadError::make(ReadError::code::io_error, 0, "Failed to open file: " + path.string()));
        return std::make_shared<StreamSource>(std::move(stream));
    }

} // namespace LazyJson
