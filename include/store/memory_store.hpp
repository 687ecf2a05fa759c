#ifndef IFS_STORE_MEMORY_STORE_HPP
#define IFS_STORE_MEMORY_STORE_HPP

#include <map>
#include <memory>
#include <shared_mutex>
#include "store/content_store.hpp"

namespace ifs {
namespace store {

class MemoryStore : public WritableContentStore {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  MemoryStore();


  // ---- PUBLISHING ----
  uint64_t publish(const ComponentId& id, Version version, std::istream& data) override;
  // Convenience overload used by tests and the shell
  uint64_t publish(const ComponentId& id, Version version, Bytes data);


  // ---- QUERY OPERATIONS ----
  bool exists(const ComponentId& id, Version version) const override;
  std::set<Version> list_versions(const ComponentId& id) const override;
  Bytes read_range(const ComponentId& id, Version version,
                   uint64_t offset, uint64_t max_length) const override;
  uint64_t size(const ComponentId& id, Version version) const override;

private:
  // ---- PARAMETERS ----
  mutable std::shared_mutex mutex_;
  // Images are immutable once inserted so readers may hold a shared_ptr after unlocking
  std::map<ComponentId, std::map<Version, std::shared_ptr<const Bytes>>> images_;


  // Returns the image or throws NotFoundError
  std::shared_ptr<const Bytes> find_image(const ComponentId& id, Version version) const;
};

} // namespace store
} // namespace ifs

#endif // IFS_STORE_MEMORY_STORE_HPP
