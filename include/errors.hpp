#pragma once
#include <string>
#include <system_error>

namespace sectorcast {

enum class errc {
    interrupted = 1,
    not_available_locally,
    open_failed,
    read_failed,
    download_failed,
    encode_failed,
    encrypt_failed,
    upload_rejected,
    connection_failed,
    bad_frame,
    oversized_request
};

const std::error_category& error_category();
std::error_code make_error_code(errc e);

} // namespace sectorcast

namespace std {
template <> struct is_error_code_enum<sectorcast::errc> : true_type {};
} // namespace std
