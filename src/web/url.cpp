#include "web/url.hpp"

namespace lanshare {
namespace web {

namespace {

int hex_value(char ch) {
  if (ch >= '0' && ch <= '9') return ch - '0';
  if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
  if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
  return -1;
}

bool is_unreserved(unsigned char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
         ch == '-' || ch == '.' || ch == '_' || ch == '~';
}

} // namespace

std::string strip_query(const std::string& target) {
  const auto pos = target.find_first_of("?#");
  return pos == std::string::npos ? target : target.substr(0, pos);
}

bool url_decode(const std::string& in, std::string& out) {
  out.clear();
  out.reserve(in.size());

  for (std::size_t i = 0; i < in.size(); ++i) {
    if (in[i] != '%') {
      out.push_back(in[i]);
      continue;
    }
    if (i + 2 >= in.size()) {
      return false;
    }
    const int high = hex_value(in[i + 1]);
    const int low = hex_value(in[i + 2]);
    if (high < 0 || low < 0) {
      return false;
    }
    out.push_back(static_cast<char>((high << 4) | low));
    i += 2;
  }
  return true;
}

std::string url_encode(const std::string& in) {
  static const char hex[] = "0123456789ABCDEF";

  std::string out;
  out.reserve(in.size() * 3);
  for (char ch : in) {
    const auto uch = static_cast<unsigned char>(ch);
    if (is_unreserved(uch)) {
      out.push_back(ch);
    } else {
      out.push_back('%');
      out.push_back(hex[uch >> 4]);
      out.push_back(hex[uch & 0x0F]);
    }
  }
  return out;
}

} // namespace web
} // namespace lanshare
