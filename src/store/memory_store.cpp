#include "store/memory_store.hpp"
#include <algorithm>
#include <iterator>
#include <mutex>
#include <boost/log/trivial.hpp>

namespace ifs {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

MemoryStore::MemoryStore() {
  BOOST_LOG_TRIVIAL(info) << "Memory store: Initializing in-memory content store";
}


//==============================================
// PUBLISHING
//==============================================

uint64_t MemoryStore::publish(const ComponentId& id, Version version, std::istream& data) {
  if (!data.good()) {
    BOOST_LOG_TRIVIAL(error) << "Memory store: Invalid input stream provided for " << id << "@" << version;
    throw InvalidArgumentError("Memory store: Invalid input stream");
  }

  Bytes bytes((std::istreambuf_iterator<char>(data)), std::istreambuf_iterator<char>());
  if (data.bad()) {
    throw InvalidArgumentError("Memory store: Failed to read input stream");
  }
  return publish(id, version, std::move(bytes));
}

uint64_t MemoryStore::publish(const ComponentId& id, Version version, Bytes data) {
  if (id.empty()) {
    throw InvalidArgumentError("Memory store: Component id must not be empty");
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);

  auto& versions = images_[id];
  if (versions.count(version) != 0) {
    BOOST_LOG_TRIVIAL(error) << "Memory store: Image already published for " << id << "@" << version;
    throw AlreadyExistsError("Memory store: Image already published for " + id.str() +
                             "@" + std::to_string(version));
  }

  const uint64_t length = data.size();
  versions.emplace(version, std::make_shared<const Bytes>(std::move(data)));

  BOOST_LOG_TRIVIAL(info) << "Memory store: Published " << length << " bytes for " << id << "@" << version;
  return length;
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool MemoryStore::exists(const ComponentId& id, Version version) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = images_.find(id);
  return it != images_.end() && it->second.count(version) != 0;
}

std::set<Version> MemoryStore::list_versions(const ComponentId& id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::set<Version> versions;
  auto it = images_.find(id);
  if (it != images_.end()) {
    for (const auto& entry : it->second) {
      versions.insert(entry.first);
    }
  }
  return versions;
}

Bytes MemoryStore::read_range(const ComponentId& id, Version version,
                              uint64_t offset, uint64_t max_length) const {
  auto image = find_image(id, version);

  if (offset > image->size()) {
    BOOST_LOG_TRIVIAL(error) << "Memory store: Offset " << offset << " beyond image length "
                             << image->size() << " for " << id << "@" << version;
    throw RangeError("Memory store: Offset " + std::to_string(offset) + " beyond image length " +
                     std::to_string(image->size()));
  }

  const uint64_t length = std::min<uint64_t>(max_length, image->size() - offset);
  auto begin = image->begin() + static_cast<std::ptrdiff_t>(offset);
  return Bytes(begin, begin + static_cast<std::ptrdiff_t>(length));
}

uint64_t MemoryStore::size(const ComponentId& id, Version version) const {
  return find_image(id, version)->size();
}

std::shared_ptr<const Bytes> MemoryStore::find_image(const ComponentId& id, Version version) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  auto it = images_.find(id);
  if (it != images_.end()) {
    auto image = it->second.find(version);
    if (image != it->second.end()) {
      return image->second;
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "Memory store: No image for " << id << "@" << version;
  throw NotFoundError("Memory store: No image for " + id.str() + "@" + std::to_string(version));
}

} // namespace store
} // namespace ifs
