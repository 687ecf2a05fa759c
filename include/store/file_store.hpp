#ifndef IFS_STORE_FILE_STORE_HPP
#define IFS_STORE_FILE_STORE_HPP

#include <filesystem>
#include <string>
#include "store/content_store.hpp"

namespace ifs {
namespace store {

/**
 * Filesystem backed content store.
 *
 * Images of a component live in a directory derived from the SHA-256 of the
 * component id: {base}/{hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{hash[6:]}/{version}.ifs
 * The clear-text id is kept next to them in a "component_id" file.
 */
class FileStore : public WritableContentStore {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit FileStore(const std::string& base_path);


  // ---- PUBLISHING ----
  uint64_t publish(const ComponentId& id, Version version, std::istream& data) override;


  // ---- QUERY OPERATIONS ----
  bool exists(const ComponentId& id, Version version) const override;
  std::set<Version> list_versions(const ComponentId& id) const override;
  Bytes read_range(const ComponentId& id, Version version,
                   uint64_t offset, uint64_t max_length) const override;
  uint64_t size(const ComponentId& id, Version version) const override;


  // ---- GETTERS ----
  const std::filesystem::path& base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  // Root path for all stored images
  std::filesystem::path base_path_;


  // ---- CAS STORAGE SUPPORT ----
  // Generate SHA-256 hash of the component id using OpenSSL EVP
  std::string hash_key(const ComponentId& id) const;
  // Directory holding every version of a component
  std::filesystem::path component_dir(const ComponentId& id) const;
  // Full path of one image
  std::filesystem::path image_path(const ComponentId& id, Version version) const;


  // ---- UTILITY METHODS ----
  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
  // Throws NotFoundError if no image is stored at the path
  void verify_image_exists(const std::filesystem::path& path, const ComponentId& id, Version version) const;
  // Rejects any resolved path that escapes base_path_
  void ensure_inside_root(const std::filesystem::path& path) const;
};

} // namespace store
} // namespace ifs

#endif // IFS_STORE_FILE_STORE_HPP
