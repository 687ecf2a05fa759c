#ifndef IFS_STORE_CONTENT_STORE_HPP
#define IFS_STORE_CONTENT_STORE_HPP

#include <cstdint>
#include <istream>
#include <ostream>
#include <set>
#include <string>
#include <vector>
#include "common/ifs_error.hpp"

namespace ifs {
namespace store {

using Version = uint64_t;
using Bytes = std::vector<uint8_t>;

// Opaque identifier of a software component. Only used as a lookup key.
class ComponentId {
public:
  ComponentId() = default;
  explicit ComponentId(std::string value) : value_(std::move(value)) {}

  const std::string& str() const { return value_; }
  bool empty() const { return value_.empty(); }

  bool operator==(const ComponentId& other) const { return value_ == other.value_; }
  bool operator!=(const ComponentId& other) const { return value_ != other.value_; }
  bool operator<(const ComponentId& other) const { return value_ < other.value_; }

private:
  std::string value_;
};

inline std::ostream& operator<<(std::ostream& os, const ComponentId& id) {
  return os << id.str();
}

/**
 * Read-only view of published IFS images keyed by (component id, version).
 * Published bytes never change, so every read is repeatable. Implementations
 * must allow concurrent calls from any number of threads.
 */
class ContentStore {
public:
  virtual ~ContentStore() = default;

  // Checks if an image is published under the given key
  virtual bool exists(const ComponentId& id, Version version) const = 0;

  // Returns all published versions of a component, empty if none
  virtual std::set<Version> list_versions(const ComponentId& id) const = 0;

  // Reads up to max_length bytes starting at offset.
  // Throws NotFoundError if the key is absent and RangeError if offset > size.
  virtual Bytes read_range(const ComponentId& id, Version version,
                           uint64_t offset, uint64_t max_length) const = 0;

  // Total byte length of the image, throws NotFoundError if absent
  virtual uint64_t size(const ComponentId& id, Version version) const = 0;
};

// A ContentStore that the publishing side can add images to
class WritableContentStore : public ContentStore {
public:
  // Stores the stream under the key and returns the number of bytes written.
  // Throws AlreadyExistsError if the key is already published.
  virtual uint64_t publish(const ComponentId& id, Version version, std::istream& data) = 0;
};

} // namespace store
} // namespace ifs

#endif // IFS_STORE_CONTENT_STORE_HPP
