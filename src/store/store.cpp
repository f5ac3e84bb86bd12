#include "store/store.hpp"
#include "store/filename.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>
#include <iomanip>
#include <random>
#include <sstream>

namespace lanshare {
namespace store {

namespace {

std::string random_token() {
  thread_local std::mt19937_64 gen(std::random_device{}());
  std::ostringstream out;
  out << std::hex << std::setw(16) << std::setfill('0') << gen();
  return out.str();
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Store::Store(const std::filesystem::path& root) {
  BOOST_LOG_TRIVIAL(info) << "Store: Initializing store with root: " << root.string();
  check_directory_exists(root); // Create root directory if it doesn't exist

  std::error_code ec;
  root_ = std::filesystem::canonical(root, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to resolve root " << root.string() << ": " << ec.message();
    throw StoreError("Store: Failed to resolve storage root: " + root.string());
  }
  BOOST_LOG_TRIVIAL(debug) << "Store: Storage root resolved to: " << root_.string();
}


//==============================================
// SAFETY GUARD
//==============================================

bool Store::is_safe(const std::string& name) const noexcept {
  if (name.empty() || name.find('\0') != std::string::npos) {
    return false;
  }

  try {
    std::error_code ec;
    // An absolute name replaces the root entirely and fails the parent check below
    const std::filesystem::path resolved = std::filesystem::weakly_canonical(root_ / name, ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(debug) << "Store: Could not resolve name: " << name << ": " << ec.message();
      return false;
    }
    return resolved.has_filename() && resolved.parent_path() == root_;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(debug) << "Store: Safety check failed for " << name << ": " << e.what();
    return false;
  }
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

std::unique_ptr<FileWriter> Store::open_writer(const std::string& name) {
  const std::filesystem::path final_path = path_of(name);
  const std::filesystem::path temp_path = root_ / ("." + final_path.filename().string() + "." + random_token() + ".part");

  BOOST_LOG_TRIVIAL(debug) << "Store: Opening writer for " << final_path.string()
                           << " via " << temp_path.filename().string();
  return std::make_unique<FileWriter>(final_path, temp_path);
}

bool Store::remove(const std::string& name) {
  BOOST_LOG_TRIVIAL(info) << "Store: Removing file with name: " << name;

  if (!has(name)) {
    BOOST_LOG_TRIVIAL(info) << "Store: Nothing to remove for name: " << name;
    return false;
  }

  std::error_code ec;
  if (!std::filesystem::remove(path_of(name), ec) || ec) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to remove file with name: " << name
                             << (ec ? ": " + ec.message() : "");
    return false;
  }

  BOOST_LOG_TRIVIAL(info) << "Store: Successfully removed file with name: " << name;
  return true;
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool Store::has(const std::string& name) const {
  if (!is_safe(name)) {
    return false;
  }

  std::error_code ec;
  bool exists = std::filesystem::is_regular_file(root_ / name, ec) && !ec;
  BOOST_LOG_TRIVIAL(debug) << "Store: Name " << name << (exists ? " exists" : " not found");
  return exists;
}

Listing Store::list() const {
  Listing listing;

  std::error_code ec;
  std::filesystem::directory_iterator it(root_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to scan " << root_.string() << ": " << ec.message();
    return listing;
  }

  for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Store: Directory scan interrupted: " << ec.message();
      break;
    }

    const std::string name = it->path().filename().string();
    if (is_hidden(name)) {
      continue;
    }

    std::error_code type_ec;
    if (!it->is_regular_file(type_ec) || type_ec) {
      continue;
    }
    listing.names.push_back(name);
  }

  std::sort(listing.names.begin(), listing.names.end());

  for (const auto& name : listing.names) {
    std::error_code size_ec;
    const std::uintmax_t size = std::filesystem::file_size(root_ / name, size_ec);
    if (size_ec) {
      BOOST_LOG_TRIVIAL(warning) << "Store: Failed to stat " << name << ": " << size_ec.message();
      listing.sizes_by_name[name] = "";
    } else {
      listing.sizes_by_name[name] = format_size(size);
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "Store: Listed " << listing.names.size() << " files";
  return listing;
}

std::filesystem::path Store::path_of(const std::string& name) const {
  if (!is_safe(name)) {
    BOOST_LOG_TRIVIAL(warning) << "Store: Rejected unsafe name: " << name;
    throw StoreError("Store: Unsafe file name: " + name);
  }
  return (root_ / name).lexically_normal();
}

std::filesystem::path Store::make_temp_path(const std::string& prefix, const std::string& suffix) const {
  return root_ / ("." + prefix + random_token() + suffix);
}

void Store::check_directory_exists(const std::filesystem::path& path) const {
  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    return;
  }

  std::filesystem::create_directories(path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to create directory " << path.string() << ": " << ec.message();
    throw StoreError("Store: Failed to create directory: " + path.string());
  }
  BOOST_LOG_TRIVIAL(debug) << "Store: Directory created at: " << path.string();
}


//==============================================
// FILE WRITER
//==============================================

FileWriter::FileWriter(std::filesystem::path final_path, std::filesystem::path temp_path)
  : final_path_(std::move(final_path))
  , temp_path_(std::move(temp_path))
  , file_(temp_path_, std::ios::binary | std::ios::trunc) {
  if (!file_) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to create file: " << temp_path_.string();
    throw StoreError("Store: Failed to create file: " + final_path_.filename().string());
  }
}

FileWriter::~FileWriter() {
  if (committed_) {
    return;
  }

  file_.close();
  std::error_code ec;
  std::filesystem::remove(temp_path_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Store: Failed to discard " << temp_path_.string() << ": " << ec.message();
  } else {
    BOOST_LOG_TRIVIAL(debug) << "Store: Discarded unfinished write for " << final_path_.filename().string();
  }
}

void FileWriter::commit() {
  file_.flush();
  if (!file_) {
    throw StoreError("Store: Failed to write file: " + final_path_.filename().string());
  }
  file_.close();

  // rename() replaces an existing target in one step
  std::error_code ec;
  std::filesystem::rename(temp_path_, final_path_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to publish " << final_path_.string() << ": " << ec.message();
    throw StoreError("Store: Failed to publish file: " + final_path_.filename().string());
  }
  committed_ = true;
}

std::uintmax_t FileWriter::bytes_written() {
  const auto pos = file_.tellp();
  return pos < 0 ? 0 : static_cast<std::uintmax_t>(pos);
}

} // namespace store
} // namespace lanshare
