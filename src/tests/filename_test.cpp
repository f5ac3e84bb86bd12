#include <gtest/gtest.h>
#include "store/filename.hpp"

using namespace lanshare::store;

TEST(SanitizeFilenameTest, KeepsSafeNames) {
  EXPECT_EQ(sanitize_filename("report.pdf"), "report.pdf");
  EXPECT_EQ(sanitize_filename("my-file_v2.tar.gz"), "my-file_v2.tar.gz");
}

TEST(SanitizeFilenameTest, FlattensPaths) {
  EXPECT_EQ(sanitize_filename("../../etc/passwd"), "etc_passwd");
  EXPECT_EQ(sanitize_filename("/abs/path/file.txt"), "abs_path_file.txt");
}

TEST(SanitizeFilenameTest, BackslashIsNotASeparator) {
  EXPECT_EQ(sanitize_filename("a\\b.txt"), "ab.txt");
  EXPECT_EQ(sanitize_filename("C:\\Users\\me\\photo.jpg"), "CUsersmephoto.jpg");
}

TEST(SanitizeFilenameTest, JoinsWhitespaceAndDropsOtherCharacters) {
  EXPECT_EQ(sanitize_filename("My Report (1).pdf"), "My_Report_1.pdf");
  EXPECT_EQ(sanitize_filename("  lots \t of   space  "), "lots_of_space");
  EXPECT_EQ(sanitize_filename("a&b=c;d.txt"), "abcd.txt");
}

TEST(SanitizeFilenameTest, KeepsBaseLettersOfAccentedCharacters) {
  EXPECT_EQ(sanitize_filename("caf\xC3\xA9.txt"), "cafe.txt");
  EXPECT_EQ(sanitize_filename("r\xC3\xA9sum\xC3\xA9.pdf"), "resume.pdf");
  EXPECT_EQ(sanitize_filename("Stra\xC3\x9F" "e \xC3\x85ngstr\xC3\xB6m.txt"), "Strae_Angstrom.txt");
}

TEST(SanitizeFilenameTest, DropsCharactersWithoutAsciiBase) {
  EXPECT_EQ(sanitize_filename("\xE6\x96\x87\xE4\xBB\xB6.txt"), "txt");
  // Invalid UTF-8 still loses its non-ASCII bytes
  EXPECT_EQ(sanitize_filename("caf\xE9.txt"), "caf.txt");
}

TEST(SanitizeFilenameTest, StripsLeadingDotsAndUnderscores) {
  EXPECT_EQ(sanitize_filename(".bashrc"), "bashrc");
  EXPECT_EQ(sanitize_filename("__init__.py"), "init__.py");
  EXPECT_EQ(sanitize_filename("name."), "name");
}

TEST(SanitizeFilenameTest, CanBecomeEmpty) {
  EXPECT_EQ(sanitize_filename(""), "");
  EXPECT_EQ(sanitize_filename(".."), "");
  EXPECT_EQ(sanitize_filename("   "), "");
  EXPECT_EQ(sanitize_filename("\xE6\x96\x87"), "");
}

TEST(FormatSizeTest, Kilobytes) {
  EXPECT_EQ(format_size(0), "0.0 KB");
  EXPECT_EQ(format_size(500), "0.5 KB");
  EXPECT_EQ(format_size(1024), "1.0 KB");
  EXPECT_EQ(format_size(1536), "1.5 KB");
  EXPECT_EQ(format_size(1048575), "1024.0 KB");
}

TEST(FormatSizeTest, Megabytes) {
  EXPECT_EQ(format_size(1048576), "1.0 MB");
  EXPECT_EQ(format_size(1572864), "1.5 MB");
  EXPECT_EQ(format_size(2097152), "2.0 MB");
  EXPECT_EQ(format_size(1300000), "1.24 MB");
}

TEST(IsHiddenTest, LeadingDot) {
  EXPECT_TRUE(is_hidden(".secret"));
  EXPECT_TRUE(is_hidden(".upload-123.tmp"));
  EXPECT_FALSE(is_hidden("visible.txt"));
  EXPECT_FALSE(is_hidden(""));
}
