#include "download/version_resolver.hpp"
#include <boost/log/trivial.hpp>

namespace ifs {
namespace download {

VersionResolver::VersionResolver(const store::ContentStore& store)
  : store_(store) {}

store::Version VersionResolver::resolve(const store::ComponentId& id,
                                        std::optional<store::Version> version) const {
  if (version) {
    if (!store_.exists(id, *version)) {
      BOOST_LOG_TRIVIAL(info) << "Version resolver: " << id << "@" << *version << " is not published";
      throw NotFoundError("Component " + id.str() + " has no version " + std::to_string(*version));
    }
    BOOST_LOG_TRIVIAL(debug) << "Version resolver: Using requested version " << *version << " of " << id;
    return *version;
  }

  const auto versions = store_.list_versions(id);
  if (versions.empty()) {
    BOOST_LOG_TRIVIAL(info) << "Version resolver: No published versions of " << id;
    throw NotFoundError("Component " + id.str() + " has no published versions");
  }

  // std::set is ordered, the last element is the highest version
  const store::Version latest = *versions.rbegin();
  BOOST_LOG_TRIVIAL(debug) << "Version resolver: Resolved latest version of " << id << " to " << latest;
  return latest;
}

} // namespace download
} // namespace ifs
