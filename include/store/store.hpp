#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace lanshare {
namespace store {

// Snapshot of the visible files, names in ascending byte order
struct Listing {
  std::vector<std::string> names;
  // Display size per name, empty when the file could not be stat'ed
  std::map<std::string, std::string> sizes_by_name;
};

class FileWriter;

class Store {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Creates the storage root if needed and pins its canonical path
  explicit Store(const std::filesystem::path& root);


  // ---- SAFETY GUARD ----
  // True iff root/name resolves (following symlinks and "..") to a direct child of the root
  bool is_safe(const std::string& name) const noexcept;


  // ---- CORE STORAGE OPERATIONS ----
  // Opens an atomic writer for the given name; nothing is visible until commit()
  std::unique_ptr<FileWriter> open_writer(const std::string& name);
  // Removes a stored file; false when the name is unsafe or no such file exists
  bool remove(const std::string& name);


  // ---- QUERY OPERATIONS ----
  // Checks that the name is safe and refers to a regular file
  bool has(const std::string& name) const;
  // Live scan of the visible regular files
  Listing list() const;
  // Absolute path of a stored file, throws StoreError if the name is unsafe
  std::filesystem::path path_of(const std::string& name) const;


  // ---- GETTERS ----
  const std::filesystem::path& root() const { return root_; }
  // Unique hidden path inside the root for scratch files (request spooling)
  std::filesystem::path make_temp_path(const std::string& prefix, const std::string& suffix) const;

private:
  // ---- PARAMETERS ----
  // Canonical root path for all stored files
  std::filesystem::path root_;

  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
};

// Writes into a hidden temporary sibling and renames it over the target on commit.
// An uncommitted writer removes its temporary file when destroyed.
class FileWriter {
public:
  FileWriter(std::filesystem::path final_path, std::filesystem::path temp_path);
  ~FileWriter();

  FileWriter(const FileWriter&) = delete;
  FileWriter& operator=(const FileWriter&) = delete;

  std::ostream& stream() { return file_; }
  // Flushes, closes and atomically publishes the file
  void commit();

  std::uintmax_t bytes_written();
  const std::filesystem::path& final_path() const { return final_path_; }

private:
  std::filesystem::path final_path_;
  std::filesystem::path temp_path_;
  std::ofstream file_;
  bool committed_ = false;
};

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace store
} // namespace lanshare
