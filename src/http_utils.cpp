#include "http_utils.h"
#include <fmt/ranges.h>

namespace http_utils {

std::string FormatOneParam(const httplib::Params& params) {
  if (params.empty()) return "(none)";
  return fmt::format("{}", params);
}

std::string FormatBody(const std::string& body) {
  constexpr size_t kMaxLogBody = 256;
  if (body.size() <= kMaxLogBody) return body;
  return body.substr(0, kMaxLogBody) + fmt::format("...({} bytes)", body.size());
}

bool IsSuccess(int code) {
  return code >= 200 && code < 300;
}

} // namespace http_utils
