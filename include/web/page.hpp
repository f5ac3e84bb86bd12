#pragma once

#include <string>
#include "store/store.hpp"

namespace lanshare {
namespace web {

// Everything the index page shows
struct IndexPage {
  // Address other devices should open, e.g. http://192.168.1.20:8000/
  std::string url;
  // Last component of the storage root
  std::string folder_name;
  store::Listing listing;
};

std::string render_index(const IndexPage& page);

// Escapes &, <, >, " and ' for use in HTML text and attribute values
std::string html_escape(const std::string& text);

} // namespace web
} // namespace lanshare
