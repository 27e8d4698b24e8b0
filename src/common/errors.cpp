#include "errors.hpp"

namespace sectorcast {

namespace {

class ErrorCategory : public std::error_category {
public:
  const char *name() const noexcept override { return "sectorcast"; }
  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
    case errc::interrupted:
      return "interrupted by stop call";
    case errc::not_available_locally:
      return "file not available locally";
    case errc::open_failed:
      return "failed to open file locally";
    case errc::read_failed:
      return "failed to read file locally";
    case errc::download_failed:
      return "repair download failed";
    case errc::encode_failed:
      return "erasure encode failed";
    case errc::encrypt_failed:
      return "sector encryption failed";
    case errc::upload_rejected:
      return "host rejected sector";
    case errc::connection_failed:
      return "host connection failed";
    case errc::bad_frame:
      return "malformed frame";
    case errc::oversized_request:
      return "request exceeds memory limit";
    }
    return "unknown error";
  }
};

} // namespace

const std::error_category &error_category() {
  static ErrorCategory cat;
  return cat;
}

std::error_code make_error_code(errc e) {
  return std::error_code(static_cast<int>(e), error_category());
}

} // namespace sectorcast
