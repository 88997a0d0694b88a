#include "lazyjson/error.hpp"

namespace LazyJson {

    ReadError ReadError::make(code c, position o, std::string_view m) {
        ReadError e;
        e.errc = c;
        e.offset = o;
        e.msg.assign(m.begin(), m.end());
        return e;
    }

    std::string_view to_string(ReadError::code c) noexcept {
        using enum ReadError::code;
        switch (c) {
        case malformed_json:       return "malformed_json";
        case type_mismatch:        return "type_mismatch";
        case index_out_of_range:   return "index_out_of_range";
        case key_not_found:        return "key_not_found";
        case stream_exhausted:     return "stream_exhausted";
        case unexpected_end:       return "unexpected_end";
        case invalid_argument:     return "invalid_argument";
        case depth_limit_exceeded: return "depth_limit_exceeded";
        case io_error:             return "io_error";
        }
        return "unknown";
    }

} // namespace LazyJson
