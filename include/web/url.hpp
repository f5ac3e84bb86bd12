#pragma once

#include <string>

namespace lanshare {
namespace web {

// Splits "/path?query" and returns the path part
std::string strip_query(const std::string& target);

// Percent-decodes a path component; false on a malformed escape
bool url_decode(const std::string& in, std::string& out);

// Percent-encodes everything outside the RFC 3986 unreserved set
std::string url_encode(const std::string& in);

} // namespace web
} // namespace lanshare
