#ifndef IFS_DOWNLOAD_CHUNK_STREAMER_HPP
#define IFS_DOWNLOAD_CHUNK_STREAMER_HPP

#include <atomic>
#include <memory>
#include <optional>
#include "download/chunk.hpp"
#include "store/content_store.hpp"

namespace ifs {
namespace download {

/**
 * Lazy, finite sequence of chunks over one image.
 *
 * Every call to next() issues exactly one ranged read, so at most one chunk is
 * held in memory at a time. The sequence cannot be rewound; ask the
 * ChunkStreamer for a fresh stream to start again from offset 0.
 */
class ChunkStream {
public:
  ChunkStream(const store::ContentStore& store, store::ComponentId id, store::Version version,
              uint64_t chunk_size, uint64_t total_size);

  ChunkStream(const ChunkStream&) = delete;
  ChunkStream& operator=(const ChunkStream&) = delete;

  // Returns the next chunk, or nullopt once the final chunk was produced or
  // the stream was cancelled. Throws StoreInconsistencyError on a short read
  // and propagates store errors; the stream is finished afterwards.
  std::optional<Chunk> next();

  // Stops the stream. No further reads reach the store. Safe from any thread.
  void cancel() { cancelled_ = true; }

  bool cancelled() const { return cancelled_; }
  bool finished() const { return finished_; }
  uint64_t offset() const { return offset_; }
  uint64_t total_size() const { return total_size_; }

private:
  const store::ContentStore& store_;
  const store::ComponentId id_;
  const store::Version version_;
  const uint64_t chunk_size_;
  const uint64_t total_size_;

  uint64_t offset_{0};
  bool finished_{false};
  std::atomic<bool> cancelled_{false};
};

class ChunkStreamer {
public:
  explicit ChunkStreamer(const store::ContentStore& store);

  // Queries the image size once and returns a stream positioned at offset 0.
  // Throws InvalidArgumentError for a chunk size of 0 or above MAX_CHUNK_SIZE,
  // and NotFoundError if the image does not exist.
  std::unique_ptr<ChunkStream> stream(const store::ComponentId& id, store::Version version,
                                      uint64_t chunk_size) const;

private:
  const store::ContentStore& store_;
};

} // namespace download
} // namespace ifs

#endif // IFS_DOWNLOAD_CHUNK_STREAMER_HPP
