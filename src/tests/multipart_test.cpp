#include <gtest/gtest.h>
#include <map>
#include <sstream>
#include "web/multipart.hpp"
#include "test_utils.hpp"

using namespace lanshare::web;

class MultipartTest : public ::testing::Test {
protected:
  const std::string BOUNDARY = "----lanshareBoundary7MA4YWxk";

  // Collected part bodies keyed by field, in arrival order
  std::vector<PartHeaders> headers;
  std::vector<std::string> bodies;
  std::vector<std::unique_ptr<std::ostringstream>> sinks;
  size_t done_calls = 0;

  size_t parse(const std::string& body, const std::string& only_field = "") {
    std::istringstream input(body);
    MultipartReader reader(BOUNDARY);
    const size_t parts = reader.read(input,
      [this, &only_field](const PartHeaders& part) -> std::ostream* {
        headers.push_back(part);
        if (!only_field.empty() && part.name != only_field) {
          return nullptr;
        }
        sinks.push_back(std::make_unique<std::ostringstream>());
        return sinks.back().get();
      },
      [this](const PartHeaders&) { ++done_calls; });

    for (const auto& sink : sinks) {
      bodies.push_back(sink->str());
    }
    return parts;
  }
};

TEST_F(MultipartTest, SingleFile) {
  const auto body = make_multipart(BOUNDARY, "file", {{"a.txt", "hello"}});
  ASSERT_EQ(parse(body), 1u);
  ASSERT_EQ(headers.size(), 1u);
  EXPECT_EQ(headers[0].name, "file");
  EXPECT_EQ(headers[0].filename, "a.txt");
  EXPECT_TRUE(headers[0].has_filename);
  EXPECT_EQ(headers[0].content_type, "application/octet-stream");
  EXPECT_EQ(bodies, (std::vector<std::string>{"hello"}));
  EXPECT_EQ(done_calls, 1u);
}

TEST_F(MultipartTest, MultipleFilesAndFields) {
  std::string body =
    "--" + BOUNDARY + "\r\n"
    "Content-Disposition: form-data; name=\"note\"\r\n\r\n"
    "just text\r\n";
  body += make_multipart(BOUNDARY, "file", {{"a.txt", "first"}, {"b.bin", std::string("\0\r\n\x01", 4)}});

  ASSERT_EQ(parse(body, "file"), 3u);
  EXPECT_EQ(headers[0].name, "note");
  EXPECT_FALSE(headers[0].has_filename);
  EXPECT_EQ(bodies, (std::vector<std::string>{"first", std::string("\0\r\n\x01", 4)}));
  EXPECT_EQ(done_calls, 3u);
}

TEST_F(MultipartTest, EmptyFilenameAndEmptyBody) {
  const auto body = make_multipart(BOUNDARY, "file", {{"", ""}});
  ASSERT_EQ(parse(body), 1u);
  EXPECT_TRUE(headers[0].has_filename);
  EXPECT_EQ(headers[0].filename, "");
  EXPECT_EQ(bodies, (std::vector<std::string>{""}));
}

TEST_F(MultipartTest, BodyLargerThanChunk) {
  // Boundary-like bytes straddling chunk edges must not end the part
  std::string payload;
  while (payload.size() < 3 * MultipartReader::CHUNK_SIZE) {
    payload += "\r\n--" + BOUNDARY.substr(0, BOUNDARY.size() - 1) + "x";
  }
  const auto body = make_multipart(BOUNDARY, "file", {{"big.bin", payload}});
  ASSERT_EQ(parse(body), 1u);
  ASSERT_EQ(bodies.size(), 1u);
  EXPECT_EQ(bodies[0].size(), payload.size());
  EXPECT_EQ(bodies[0], payload);
}

TEST_F(MultipartTest, PreambleAndEpilogueIgnored) {
  const auto body = "This is a preamble\r\n" + make_multipart(BOUNDARY, "file", {{"a.txt", "x"}}) + "epilogue";
  ASSERT_EQ(parse(body), 1u);
  EXPECT_EQ(bodies, (std::vector<std::string>{"x"}));
}

TEST_F(MultipartTest, NoParts) {
  EXPECT_EQ(parse("--" + BOUNDARY + "--\r\n"), 0u);
  EXPECT_EQ(done_calls, 0u);
}

TEST_F(MultipartTest, MissingOpeningBoundaryThrows) {
  EXPECT_THROW(parse("no boundary anywhere"), MultipartError);
  EXPECT_THROW(parse(""), MultipartError);
}

TEST_F(MultipartTest, TruncatedBodyThrows) {
  const std::string body =
    "--" + BOUNDARY + "\r\n"
    "Content-Disposition: form-data; name=\"file\"; filename=\"a.txt\"\r\n\r\n"
    "cut off here";
  EXPECT_THROW(parse(body), MultipartError);
}

TEST_F(MultipartTest, TruncatedHeadersThrow) {
  const std::string body =
    "--" + BOUNDARY + "\r\n"
    "Content-Disposition: form-data; name=\"file\"";
  EXPECT_THROW(parse(body), MultipartError);
}

TEST_F(MultipartTest, InvalidBoundaryRejected) {
  EXPECT_THROW(MultipartReader(""), MultipartError);
  EXPECT_THROW(MultipartReader(std::string(201, 'b')), MultipartError);
}

TEST(MultipartHeadersTest, BoundaryFromContentType) {
  EXPECT_EQ(MultipartReader::boundary_from_content_type("multipart/form-data; boundary=abc123"), "abc123");
  EXPECT_EQ(MultipartReader::boundary_from_content_type("Multipart/Form-Data; charset=utf-8; boundary=\"a;b\""), "a;b");
  EXPECT_EQ(MultipartReader::boundary_from_content_type("application/x-www-form-urlencoded"), "");
  EXPECT_EQ(MultipartReader::boundary_from_content_type("multipart/form-data"), "");
  EXPECT_EQ(MultipartReader::boundary_from_content_type(""), "");
}

TEST(MultipartHeadersTest, ParsesQuotedAndExtendedFilenames) {
  auto headers = MultipartReader::parse_headers(
    "content-disposition: form-data; name=\"file\"; filename=\"semi;colon \\\"q\\\".txt\"");
  EXPECT_EQ(headers.name, "file");
  EXPECT_EQ(headers.filename, "semi;colon \"q\".txt");

  headers = MultipartReader::parse_headers(
    "Content-Disposition: form-data; name=file; filename=\"fallback.txt\"; filename*=UTF-8''r%C3%A9sum%C3%A9.txt\r\n"
    "Content-Type: text/plain");
  EXPECT_EQ(headers.name, "file");
  EXPECT_EQ(headers.filename, "r\xC3\xA9sum\xC3\xA9.txt");
  EXPECT_EQ(headers.content_type, "text/plain");
}
