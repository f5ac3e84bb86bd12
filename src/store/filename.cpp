#include "store/filename.hpp"
#include <boost/locale/conversion.hpp>
#include <boost/locale/generator.hpp>
#include <boost/log/trivial.hpp>
#include <iomanip>
#include <locale>
#include <sstream>

namespace lanshare {
namespace store {

namespace {

constexpr std::uintmax_t KIB = 1024;
constexpr std::uintmax_t MIB = 1024 * 1024;

bool is_allowed_char(unsigned char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
         ch == '_' || ch == '.' || ch == '-';
}

bool is_space(unsigned char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

// Normalization only needs a UTF-8 locale from the ICU backend, never the system's
const std::locale& utf8_locale() {
  static const std::locale locale = boost::locale::generator()("en_US.UTF-8");
  return locale;
}

// Splits accented letters into base letter plus combining mark (NFKD),
// so that the ASCII filter below keeps the base letter
std::string decompose(const std::string& raw) {
  try {
    return boost::locale::normalize(raw, boost::locale::norm_nfkd, utf8_locale());
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(debug) << "Filename: Could not normalize " << raw << ": " << e.what();
    return raw;
  }
}

// Fixed point rendering trimmed back to the shortest form with one decimal left
std::string to_decimal(double value, int precision) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(precision) << value;
  std::string text = out.str();

  const auto dot = text.find('.');
  if (dot != std::string::npos) {
    while (text.size() > dot + 2 && text.back() == '0') {
      text.pop_back();
    }
  }
  return text;
}

} // namespace

std::string sanitize_filename(const std::string& raw) {
  std::string spaced = decompose(raw);
  // Separators split words just like whitespace does; '\\' is an ordinary byte on POSIX
  for (char& ch : spaced) {
    if (ch == '/') {
      ch = ' ';
    }
  }

  // Join the whitespace separated words with '_' and drop disallowed bytes
  std::string joined;
  bool pending_separator = false;
  for (char ch : spaced) {
    const auto uch = static_cast<unsigned char>(ch);
    if (is_space(uch)) {
      pending_separator = !joined.empty();
      continue;
    }
    if (pending_separator) {
      joined.push_back('_');
      pending_separator = false;
    }
    joined.push_back(ch);
  }

  std::string filtered;
  filtered.reserve(joined.size());
  for (char ch : joined) {
    if (is_allowed_char(static_cast<unsigned char>(ch))) {
      filtered.push_back(ch);
    }
  }

  const auto first = filtered.find_first_not_of("._");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = filtered.find_last_not_of("._");
  return filtered.substr(first, last - first + 1);
}

std::string format_size(std::uintmax_t bytes) {
  if (bytes < MIB) {
    return to_decimal(static_cast<double>(bytes) / KIB, 1) + " KB";
  }
  return to_decimal(static_cast<double>(bytes) / MIB, 2) + " MB";
}

bool is_hidden(const std::string& name) {
  return !name.empty() && name.front() == '.';
}

} // namespace store
} // namespace lanshare
