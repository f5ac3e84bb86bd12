#pragma once

#include <string>

namespace lanshare {
namespace web {

// Content type guessed from the file extension, application/octet-stream if unknown
std::string mime_type(const std::string& filename);

} // namespace web
} // namespace lanshare
