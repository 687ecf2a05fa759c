#include "store/file_store.hpp"
#include <algorithm>
#include <atomic>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>

namespace ifs {
namespace store {

namespace {

const char* const IMAGE_EXTENSION = ".ifs";
const char* const COMPONENT_ID_FILE = "component_id";

// Distinguishes concurrent temporary files written by one process
std::atomic<uint64_t> temp_counter{0};

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

// Initialize store with base directory path and ensure it exists
FileStore::FileStore(const std::string& base_path) {
  BOOST_LOG_TRIVIAL(info) << "File store: Initializing FileStore with base path: " << base_path;
  check_directory_exists(base_path);
  base_path_ = std::filesystem::canonical(base_path);
  BOOST_LOG_TRIVIAL(debug) << "File store: Store directory created/verified at: " << base_path_.string();
}


//==============================================
// PUBLISHING
//==============================================

uint64_t FileStore::publish(const ComponentId& id, Version version, std::istream& data) {
  BOOST_LOG_TRIVIAL(info) << "File store: Publishing image " << id << "@" << version;

  if (id.empty()) {
    throw InvalidArgumentError("File store: Component id must not be empty");
  }
  if (!data.good()) {
    BOOST_LOG_TRIVIAL(error) << "File store: Invalid input stream provided for " << id << "@" << version;
    throw InvalidArgumentError("File store: Invalid input stream");
  }

  std::filesystem::path dir = component_dir(id);
  check_directory_exists(dir);

  // Record the clear-text id once per component
  std::filesystem::path id_file = dir / COMPONENT_ID_FILE;
  if (!std::filesystem::exists(id_file)) {
    std::ofstream out(id_file, std::ios::binary | std::ios::trunc);
    out << id.str();
    if (!out) {
      throw IfsError(ErrorKind::INTERNAL, "File store: Failed to write component id file: " + id_file.string());
    }
  }

  std::filesystem::path final_path = image_path(id, version);
  if (std::filesystem::exists(final_path)) {
    BOOST_LOG_TRIVIAL(error) << "File store: Image already published for " << id << "@" << version;
    throw AlreadyExistsError("File store: Image already published for " + id.str() + "@" + std::to_string(version));
  }

  // Write to a temporary file first so readers never observe a partial image
  std::filesystem::path temp_path = final_path;
  temp_path += ".tmp" + std::to_string(temp_counter.fetch_add(1));

  uint64_t bytes_written = 0;
  {
    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw IfsError(ErrorKind::INTERNAL, "File store: Failed to create file: " + temp_path.string());
    }

    char buffer[4096];
    while (data.read(buffer, sizeof(buffer)) || data.gcount() > 0) {
      file.write(buffer, data.gcount());
      bytes_written += static_cast<uint64_t>(data.gcount());
    }

    if (data.bad() || !file) {
      file.close();
      std::error_code ec;
      std::filesystem::remove(temp_path, ec);
      throw IfsError(ErrorKind::INTERNAL, "File store: Failed to copy image data for " + id.str());
    }
  }

  // A hard link fails if the target exists, so a concurrent publish of the same key cannot overwrite it
  std::error_code link_error;
  std::filesystem::create_hard_link(temp_path, final_path, link_error);
  std::error_code remove_error;
  std::filesystem::remove(temp_path, remove_error);
  if (remove_error) {
    BOOST_LOG_TRIVIAL(warning) << "File store: Failed to remove temporary file " << temp_path.string()
                               << ": " << remove_error.message();
  }

  if (link_error) {
    if (link_error == std::errc::file_exists) {
      throw AlreadyExistsError("File store: Image already published for " + id.str() + "@" + std::to_string(version));
    }
    BOOST_LOG_TRIVIAL(error) << "File store: Failed to move image into place: " << link_error.message();
    throw IfsError(ErrorKind::INTERNAL, "File store: Failed to move image into place: " + link_error.message());
  }

  BOOST_LOG_TRIVIAL(info) << "File store: Successfully stored " << bytes_written << " bytes for " << id << "@" << version;
  return bytes_written;
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool FileStore::exists(const ComponentId& id, Version version) const {
  std::filesystem::path path = image_path(id, version);
  std::error_code ec;
  bool found = std::filesystem::is_regular_file(path, ec);

  BOOST_LOG_TRIVIAL(debug) << "File store: Image " << id << "@" << version << (found ? " exists" : " not found");
  return found;
}

std::set<Version> FileStore::list_versions(const ComponentId& id) const {
  std::set<Version> versions;
  std::filesystem::path dir = component_dir(id);

  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    return versions;
  }

  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    const auto& path = entry.path();
    if (!entry.is_regular_file() || path.extension() != IMAGE_EXTENSION) {
      continue;
    }

    // Version is the file stem in the form image_path() writes, anything else is ignored
    const std::string stem = path.stem().string();
    if (stem.empty() || stem.find_first_not_of("0123456789") != std::string::npos) {
      continue;
    }
    if (stem.size() > 1 && stem[0] == '0') {
      BOOST_LOG_TRIVIAL(warning) << "File store: Ignoring non-canonical version file: " << path.string();
      continue;
    }
    try {
      versions.insert(std::stoull(stem));
    } catch (const std::out_of_range&) {
      BOOST_LOG_TRIVIAL(warning) << "File store: Ignoring out of range version file: " << path.string();
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "File store: Found " << versions.size() << " versions for " << id;
  return versions;
}

Bytes FileStore::read_range(const ComponentId& id, Version version,
                            uint64_t offset, uint64_t max_length) const {
  std::filesystem::path path = image_path(id, version);
  verify_image_exists(path, id, version);

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "File store: Failed to open file: " << path.string();
    throw IfsError(ErrorKind::INTERNAL, "File store: Failed to open file: " + path.string());
  }

  file.seekg(0, std::ios::end);
  const uint64_t total = static_cast<uint64_t>(file.tellg());
  if (offset > total) {
    BOOST_LOG_TRIVIAL(error) << "File store: Offset " << offset << " beyond image length " << total
                             << " for " << id << "@" << version;
    throw RangeError("File store: Offset " + std::to_string(offset) + " beyond image length " + std::to_string(total));
  }

  Bytes buffer(static_cast<std::size_t>(std::min(max_length, total - offset)));
  file.seekg(static_cast<std::streamoff>(offset));
  if (!buffer.empty()) {
    file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    buffer.resize(static_cast<std::size_t>(file.gcount()));
  }

  BOOST_LOG_TRIVIAL(trace) << "File store: Read " << buffer.size() << " bytes at offset " << offset
                           << " for " << id << "@" << version;
  return buffer;
}

uint64_t FileStore::size(const ComponentId& id, Version version) const {
  std::filesystem::path path = image_path(id, version);
  verify_image_exists(path, id, version);

  uint64_t size = std::filesystem::file_size(path);
  BOOST_LOG_TRIVIAL(debug) << "File store: Image size for " << id << "@" << version << ": " << size << " bytes";
  return size;
}


//==============================================
// CAS STORAGE SUPPORT
//==============================================

std::string FileStore::hash_key(const ComponentId& id) const {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len;

  // Create a new message digest context for the hashing operation
  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) {
    throw IfsError(ErrorKind::INTERNAL, "File store: Failed to create hash context");
  }

  if (!EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr)) {
    EVP_MD_CTX_free(ctx);
    throw IfsError(ErrorKind::INTERNAL, "File store: Failed to initialize hash context");
  }

  if (!EVP_DigestUpdate(ctx, id.str().data(), id.str().size())) {
    EVP_MD_CTX_free(ctx);
    throw IfsError(ErrorKind::INTERNAL, "File store: Failed to update hash");
  }

  if (!EVP_DigestFinal_ex(ctx, hash, &hash_len)) {
    EVP_MD_CTX_free(ctx);
    throw IfsError(ErrorKind::INTERNAL, "File store: Failed to finalize hash");
  }

  EVP_MD_CTX_free(ctx);

  // Convert the raw hash bytes to a hexadecimal string
  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(hash[i]);
  }
  return ss.str();
}

std::filesystem::path FileStore::component_dir(const ComponentId& id) const {
  const std::string hash = hash_key(id);
  std::filesystem::path path = base_path_;

  for (size_t i = 0; i < 6; i += 2) {
    path /= hash.substr(i, 2);
  }
  path /= hash.substr(6);

  ensure_inside_root(path);
  return path;
}

std::filesystem::path FileStore::image_path(const ComponentId& id, Version version) const {
  return component_dir(id) / (std::to_string(version) + IMAGE_EXTENSION);
}


//==============================================
// UTILITY METHODS
//==============================================

void FileStore::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

void FileStore::verify_image_exists(const std::filesystem::path& path, const ComponentId& id, Version version) const {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    BOOST_LOG_TRIVIAL(debug) << "File store: No image for " << id << "@" << version;
    throw NotFoundError("File store: No image for " + id.str() + "@" + std::to_string(version));
  }
}

void FileStore::ensure_inside_root(const std::filesystem::path& path) const {
  const auto normalized = path.lexically_normal();
  auto relative = normalized.lexically_relative(base_path_);
  if (relative.empty() || *relative.begin() == "..") {
    BOOST_LOG_TRIVIAL(error) << "File store: Path " << normalized.string() << " is not within " << base_path_.string();
    throw IfsError(ErrorKind::INTERNAL, "File store: Path is not within the store root");
  }
}

} // namespace store
} // namespace ifs
