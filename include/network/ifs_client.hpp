#ifndef IFS_NETWORK_IFS_CLIENT_HPP
#define IFS_NETWORK_IFS_CLIENT_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include "download/chunk.hpp"
#include "network/codec.hpp"

namespace ifs {
namespace network {

// How a remote download ended from the client's point of view
enum class FetchStatus {
  COMPLETED,
  FAILED,
  CANCELLED
};

const char* fetch_status_to_string(FetchStatus status);

struct FetchResult {
  FetchStatus status{FetchStatus::FAILED};
  // Set when status is FAILED. Connection and framing problems are TRANSPORT_FAILURE.
  std::optional<download::DownloadError> error;
  uint64_t chunks{0};
  uint64_t bytes{0};

  bool ok() const { return status == FetchStatus::COMPLETED; }
};

/**
 * Blocking client of the DownloadIFS call. Opens one connection per request.
 * Chunk offsets are checked for contiguity and a completed download must end
 * with a final chunk followed by the stream end marker.
 */
class IfsClient {
public:
  // Receives each chunk in order. Returning false cancels the download.
  using ChunkHandler = std::function<bool(const download::Chunk&)>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  IfsClient(const std::string& address, uint16_t port);


  // ---- DOWNLOAD OPERATIONS ----
  FetchResult download(const download::DownloadRequest& request, const ChunkHandler& handler) const;
  // Writes the reassembled image to output. A failed write ends the download as FAILED.
  FetchResult download_to(const download::DownloadRequest& request, std::ostream& output) const;


  // ---- GETTERS ----
  const std::string& get_address() const { return address_; }
  uint16_t get_port() const { return port_; }

private:
  // ---- PARAMETERS ----
  const std::string address_;
  const uint16_t port_;
  Codec codec_;
};

} // namespace network
} // namespace ifs

#endif // IFS_NETWORK_IFS_CLIENT_HPP
