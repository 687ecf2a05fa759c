#ifndef IFS_DOWNLOAD_VERSION_RESOLVER_HPP
#define IFS_DOWNLOAD_VERSION_RESOLVER_HPP

#include <optional>
#include "store/content_store.hpp"

namespace ifs {
namespace download {

// Pins an optional requested version to a concrete published one
class VersionResolver {
public:
  explicit VersionResolver(const store::ContentStore& store);

  // Returns the requested version if it exists, or the highest published
  // version when none is requested. Throws NotFoundError otherwise.
  store::Version resolve(const store::ComponentId& id, std::optional<store::Version> version) const;

private:
  const store::ContentStore& store_;
};

} // namespace download
} // namespace ifs

#endif // IFS_DOWNLOAD_VERSION_RESOLVER_HPP
