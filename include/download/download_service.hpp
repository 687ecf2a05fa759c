#ifndef IFS_DOWNLOAD_DOWNLOAD_SERVICE_HPP
#define IFS_DOWNLOAD_DOWNLOAD_SERVICE_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "download/chunk.hpp"
#include "download/chunk_streamer.hpp"
#include "download/download_state.hpp"
#include "download/version_resolver.hpp"
#include "store/content_store.hpp"

namespace ifs {
namespace download {

struct ServiceConfig {
  uint64_t chunk_size{DEFAULT_CHUNK_SIZE};
};

// Consumer side of a push style download, typically the outbound RPC stream
class ResponseWriter {
public:
  virtual ~ResponseWriter() = default;
  // Returns false if the item could not be delivered
  virtual bool write(const DownloadResult& result) = 0;
};

// Summary of a finished download
struct DownloadOutcome {
  DownloadState::State state{DownloadState::State::RESOLVING};
  std::optional<store::Version> version;
  uint64_t chunks{0};
  uint64_t bytes{0};
  std::optional<DownloadError> error;
};

/**
 * One download request in progress.
 *
 * next() drives the state machine and yields success chunks followed by
 * either nothing (completed) or one terminal error (failed). It must be
 * called from a single thread; cancel() may be called from any thread.
 */
class DownloadSession {
public:
  DownloadSession(const store::ContentStore& store, DownloadRequest request, uint64_t chunk_size);

  DownloadSession(const DownloadSession&) = delete;
  DownloadSession& operator=(const DownloadSession&) = delete;

  // ---- STATE MACHINE ----
  // Returns the next item, or nullopt once the session reached a terminal state
  std::optional<DownloadResult> next();
  // Stops the session without emitting anything further
  void cancel();
  // Records that the consumer failed to deliver an item. The session fails
  // and the next call to next() yields the TRANSPORT_FAILURE error.
  void report_transport_failure(const std::string& message);


  // ---- GETTERS ----
  DownloadState::State state() const { return state_.get_state(); }
  std::optional<store::Version> pinned_version() const { return pinned_version_; }
  const DownloadRequest& request() const { return request_; }
  DownloadOutcome outcome() const;

private:
  // ---- PARAMETERS ----
  const store::ContentStore& store_;
  const DownloadRequest request_;
  const uint64_t chunk_size_;

  DownloadState state_;
  std::optional<store::Version> pinned_version_;
  // Guards stream_ against cancel() from another thread
  mutable std::mutex stream_mutex_;
  std::unique_ptr<ChunkStream> stream_;

  std::optional<DownloadError> error_;
  bool error_emitted_{false};
  // Read by cancel() from other threads
  std::atomic<uint64_t> chunks_emitted_{0};
  std::atomic<uint64_t> bytes_emitted_{0};


  // ---- STATE HANDLERS ----
  // Pins the version and opens the chunk stream
  bool resolve();
  std::optional<DownloadResult> stream_next();
  // Moves to FAILED and records the terminal error, unless already terminal
  void fail(ErrorKind kind, const std::string& message);
  // Yields the recorded error exactly once
  std::optional<DownloadResult> take_terminal_error();
};

class DownloadService {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit DownloadService(const store::ContentStore& store, ServiceConfig config = {});


  // ---- DOWNLOAD OPERATIONS ----
  // Starts a pull style download
  std::unique_ptr<DownloadSession> open(const DownloadRequest& request) const;
  // Runs a download to completion, pushing every item into the writer
  DownloadOutcome download(const DownloadRequest& request, ResponseWriter& writer) const;


  // ---- GETTERS ----
  const ServiceConfig& config() const { return config_; }

private:
  const store::ContentStore& store_;
  ServiceConfig config_;
};

} // namespace download
} // namespace ifs

#endif // IFS_DOWNLOAD_DOWNLOAD_SERVICE_HPP
