#ifndef LANSHARE_WEB_MULTIPART_HPP
#define LANSHARE_WEB_MULTIPART_HPP

#include <cstddef>
#include <functional>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>

namespace lanshare {
namespace web {

// Headers of one multipart/form-data part
struct PartHeaders {
  // Form field name from Content-Disposition
  std::string name;
  // Client filename, only meaningful when has_filename is set
  std::string filename;
  bool has_filename = false;
  std::string content_type;
};

class MultipartError : public std::runtime_error {
public:
  explicit MultipartError(const std::string& message)
    : std::runtime_error("Multipart error: " + message) {}
};

// Streaming reader for multipart/form-data bodies (RFC 7578).
// Part bodies are copied chunk by chunk into a sink chosen per part,
// so the reader never holds more than a chunk and a header block in memory.
class MultipartReader {
public:
  // Returns the stream receiving the part body, or nullptr to discard the part
  using PartSink = std::function<std::ostream*(const PartHeaders&)>;
  // Called once the whole body of a part went to its sink
  using PartDone = std::function<void(const PartHeaders&)>;

  static constexpr std::size_t CHUNK_SIZE = 64 * 1024;
  static constexpr std::size_t MAX_HEADER_BYTES = 16 * 1024;

  explicit MultipartReader(std::string boundary);

  // Reads the entire body, returns the number of parts seen.
  // Throws MultipartError on a malformed body.
  std::size_t read(std::istream& input, const PartSink& on_part, const PartDone& on_done);

  // Extracts the boundary parameter of a multipart/form-data content type,
  // empty when the type is not multipart/form-data or has no boundary
  static std::string boundary_from_content_type(const std::string& content_type);

  // Parses a raw header block ("Name: value\r\n..." without the blank line)
  static PartHeaders parse_headers(const std::string& block);

private:
  // ---- PARAMETERS ----
  std::string boundary_;
  // "--boundary", opens the first part
  std::string dash_boundary_;
  // "\r\n--boundary", terminates every part body
  std::string delimiter_;

  // ---- PARSING STATE ----
  std::istream* input_ = nullptr;
  std::string buffer_;
  bool eof_ = false;

  // Appends the next chunk of input to the buffer, false once input is exhausted
  bool fill();
  // Skips the preamble and the opening boundary
  void read_preamble();
  // After a boundary: true if it was the closing one, otherwise consumes the line break
  bool read_boundary_suffix();
  std::string read_header_block();
  // Streams a part body to sink (may be null) up to the next delimiter
  void read_body(std::ostream* sink);
  // Makes sure at least n bytes are buffered, false at end of input
  bool ensure(std::size_t n);
};

} // namespace web
} // namespace lanshare

#endif // LANSHARE_WEB_MULTIPART_HPP
