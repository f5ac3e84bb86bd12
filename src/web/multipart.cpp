#include "web/multipart.hpp"
#include "web/url.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>
#include <cctype>
#include <sstream>
#include <vector>

namespace lanshare {
namespace web {

namespace {

std::string to_lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return text;
}

std::string trim(const std::string& text) {
  const auto first = text.find_first_not_of(" \t");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = text.find_last_not_of(" \t");
  return text.substr(first, last - first + 1);
}

// Removes surrounding quotes and backslash escapes from a parameter value
std::string unquote(const std::string& value) {
  if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
    return value;
  }

  std::string out;
  out.reserve(value.size() - 2);
  for (std::size_t i = 1; i + 1 < value.size(); ++i) {
    if (value[i] == '\\' && i + 2 < value.size()) {
      ++i;
    }
    out.push_back(value[i]);
  }
  return out;
}

// Splits "type; a=1; b=\"x;y\"" on semicolons outside quotes
std::vector<std::string> split_params(const std::string& header) {
  std::vector<std::string> parts;
  std::string current;
  bool quoted = false;

  for (std::size_t i = 0; i < header.size(); ++i) {
    const char ch = header[i];
    if (ch == '"' && (i == 0 || header[i - 1] != '\\')) {
      quoted = !quoted;
    }
    if (ch == ';' && !quoted) {
      parts.push_back(trim(current));
      current.clear();
      continue;
    }
    current.push_back(ch);
  }
  parts.push_back(trim(current));
  return parts;
}

} // namespace

MultipartReader::MultipartReader(std::string boundary)
  : boundary_(std::move(boundary))
  , dash_boundary_("--" + boundary_)
  , delimiter_("\r\n--" + boundary_) {
  if (boundary_.empty() || boundary_.size() > 200) {
    throw MultipartError("invalid boundary length");
  }
}


//==============================================
// BODY PARSING
//==============================================

std::size_t MultipartReader::read(std::istream& input, const PartSink& on_part, const PartDone& on_done) {
  input_ = &input;
  buffer_.clear();
  eof_ = false;

  read_preamble();
  if (read_boundary_suffix()) {
    BOOST_LOG_TRIVIAL(debug) << "Multipart: Body contains no parts";
    return 0;
  }

  std::size_t parts = 0;
  bool closed = false;
  while (!closed) {
    const PartHeaders headers = parse_headers(read_header_block());
    BOOST_LOG_TRIVIAL(debug) << "Multipart: Part " << parts << " field=" << headers.name
                             << (headers.has_filename ? " filename=" + headers.filename : "");

    std::ostream* sink = on_part ? on_part(headers) : nullptr;
    read_body(sink);
    if (on_done) {
      on_done(headers);
    }

    ++parts;
    closed = read_boundary_suffix();
  }

  BOOST_LOG_TRIVIAL(debug) << "Multipart: Finished reading " << parts << " parts";
  return parts;
}

bool MultipartReader::fill() {
  if (eof_) {
    return false;
  }

  char chunk[CHUNK_SIZE];
  input_->read(chunk, sizeof(chunk));
  const auto count = input_->gcount();
  if (count > 0) {
    buffer_.append(chunk, static_cast<std::size_t>(count));
  }
  if (!*input_) {
    eof_ = true;
  }
  return count > 0;
}

bool MultipartReader::ensure(std::size_t n) {
  while (buffer_.size() < n) {
    if (!fill()) {
      return false;
    }
  }
  return true;
}

void MultipartReader::read_preamble() {
  for (;;) {
    const auto pos = buffer_.find(dash_boundary_);
    // The opening boundary either starts the body or follows a line break
    if (pos != std::string::npos && (pos == 0 || (pos >= 2 && buffer_.compare(pos - 2, 2, "\r\n") == 0))) {
      buffer_.erase(0, pos + dash_boundary_.size());
      return;
    }
    if (pos != std::string::npos) {
      buffer_.erase(0, pos + 1);
      continue;
    }

    // Keep a tail that could hold the start of a split boundary
    if (buffer_.size() > dash_boundary_.size() + 2) {
      buffer_.erase(0, buffer_.size() - dash_boundary_.size() - 2);
    }
    if (!fill()) {
      throw MultipartError("missing opening boundary");
    }
  }
}

bool MultipartReader::read_boundary_suffix() {
  if (!ensure(2)) {
    throw MultipartError("truncated boundary");
  }
  if (buffer_.compare(0, 2, "--") == 0) {
    // Anything after the closing boundary is epilogue and is ignored
    buffer_.clear();
    return true;
  }

  // Transport padding is allowed before the line break
  for (;;) {
    if (!ensure(1)) {
      throw MultipartError("truncated boundary line");
    }
    if (buffer_[0] != ' ' && buffer_[0] != '\t') {
      break;
    }
    buffer_.erase(0, 1);
  }

  if (!ensure(2) || buffer_.compare(0, 2, "\r\n") != 0) {
    throw MultipartError("boundary not followed by a line break");
  }
  buffer_.erase(0, 2);
  return false;
}

std::string MultipartReader::read_header_block() {
  for (;;) {
    // A part without headers starts directly with the blank line
    if (buffer_.size() >= 2 && buffer_.compare(0, 2, "\r\n") == 0) {
      buffer_.erase(0, 2);
      return "";
    }

    const auto end = buffer_.find("\r\n\r\n");
    if (end != std::string::npos) {
      std::string block = buffer_.substr(0, end);
      buffer_.erase(0, end + 4);
      return block;
    }
    if (buffer_.size() > MAX_HEADER_BYTES) {
      throw MultipartError("part headers too large");
    }
    if (!fill()) {
      throw MultipartError("unexpected end of part headers");
    }
  }
}

void MultipartReader::read_body(std::ostream* sink) {
  for (;;) {
    const auto pos = buffer_.find(delimiter_);
    if (pos != std::string::npos) {
      if (sink && pos > 0) {
        sink->write(buffer_.data(), static_cast<std::streamsize>(pos));
      }
      buffer_.erase(0, pos + delimiter_.size());
      return;
    }

    // Flush everything that cannot be the start of a delimiter
    if (buffer_.size() >= delimiter_.size()) {
      const std::size_t safe = buffer_.size() - (delimiter_.size() - 1);
      if (sink) {
        sink->write(buffer_.data(), static_cast<std::streamsize>(safe));
      }
      buffer_.erase(0, safe);
    }

    if (!fill()) {
      throw MultipartError("unexpected end of part body");
    }
  }
}


//==============================================
// HEADER PARSING
//==============================================

PartHeaders MultipartReader::parse_headers(const std::string& block) {
  PartHeaders headers;
  std::istringstream lines(block);
  std::string line;

  while (std::getline(lines, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }

    const std::string field = to_lower(trim(line.substr(0, colon)));
    const std::string value = trim(line.substr(colon + 1));

    if (field == "content-type") {
      headers.content_type = value;
      continue;
    }
    if (field != "content-disposition") {
      continue;
    }

    std::string extended_filename;
    for (const auto& param : split_params(value)) {
      const auto eq = param.find('=');
      if (eq == std::string::npos) {
        continue;
      }
      const std::string key = to_lower(trim(param.substr(0, eq)));
      const std::string raw = trim(param.substr(eq + 1));

      if (key == "name") {
        headers.name = unquote(raw);
      } else if (key == "filename") {
        headers.filename = unquote(raw);
        headers.has_filename = true;
      } else if (key == "filename*") {
        // RFC 5987: charset'language'percent-encoded
        const auto quote = raw.find('\'', raw.find('\'') + 1);
        std::string decoded;
        if (quote != std::string::npos && url_decode(raw.substr(quote + 1), decoded)) {
          extended_filename = decoded;
        }
      }
    }
    if (!extended_filename.empty()) {
      headers.filename = extended_filename;
      headers.has_filename = true;
    }
  }
  return headers;
}

std::string MultipartReader::boundary_from_content_type(const std::string& content_type) {
  const auto params = split_params(content_type);
  if (params.empty() || to_lower(params.front()) != "multipart/form-data") {
    return "";
  }

  for (std::size_t i = 1; i < params.size(); ++i) {
    const auto eq = params[i].find('=');
    if (eq == std::string::npos) {
      continue;
    }
    if (to_lower(trim(params[i].substr(0, eq))) == "boundary") {
      return unquote(trim(params[i].substr(eq + 1)));
    }
  }
  return "";
}

} // namespace web
} // namespace lanshare
