//
// Names for enums and error codes
//

#include <ostream>

#include <riff/chunk_iterator.hh>
#include <riff/chunk_model.hh>
#include <riff/exceptions.hh>

namespace riff {

    std::string_view to_string(errc code) noexcept {
        switch (code) {
            case errc::too_small:            return "too_small";
            case errc::too_small_for_type:   return "too_small_for_type";
            case errc::payload_len_mismatch: return "payload_len_mismatch";
            case errc::invalid_header:       return "invalid_header";
            case errc::utf8_error:           return "utf8_error";
            case errc::length_mismatch:      return "length_mismatch";
            case errc::io:                   return "io";
            case errc::size_overflow:        return "size_overflow";
            case errc::invalid_chunk_kind:   return "invalid_chunk_kind";
            case errc::depth_limit:          return "depth_limit";
        }
        // make compiler happy
        return "unknown";
    }

    std::ostream& operator<<(std::ostream& os, chunk_kind kind) {
        switch (kind) {
            case chunk_kind::typed_container:
                return os << "typed container";
            case chunk_kind::untyped_container:
                return os << "untyped container";
            case chunk_kind::leaf:
                return os << "leaf";
        }
        return os;
    }

    std::ostream& operator<<(std::ostream& os, iteration_status status) {
        switch (status) {
            case iteration_status::active:
                return os << "active";
            case iteration_status::exhausted:
                return os << "exhausted";
            case iteration_status::failed:
                return os << "failed";
        }
        return os;
    }

} // namespace riff
