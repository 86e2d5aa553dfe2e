// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_errors.hpp"

#include <regex>

namespace tessera {
namespace uploader {

std::string sanitizeErrorMessage(const std::string& message) {
  // Pre-signed URLs embed credentials in their query string
  static const std::regex url_regex(R"(https?://[^\s"'<>]+)", std::regex::icase);
  static const std::regex signed_param_regex(
    R"((X-Amz-[A-Za-z]+|Signature|AWSAccessKeyId|Authorization)=[^\s&"']+)", std::regex::icase
  );
  static const std::regex bearer_regex(R"(Bearer\s+[A-Za-z0-9._~+/=-]+)", std::regex::icase);

  std::string sanitized = std::regex_replace(message, url_regex, "<url>");
  sanitized = std::regex_replace(sanitized, signed_param_regex, "$1=<redacted>");
  sanitized = std::regex_replace(sanitized, bearer_regex, "Bearer <redacted>");
  return sanitized;
}

}  // namespace uploader
}  // namespace tessera
