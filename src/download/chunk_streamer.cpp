#include "download/chunk_streamer.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace ifs {
namespace download {

//==============================================
// CHUNK STREAM
//==============================================

ChunkStream::ChunkStream(const store::ContentStore& store, store::ComponentId id, store::Version version,
                         uint64_t chunk_size, uint64_t total_size)
  : store_(store)
  , id_(std::move(id))
  , version_(version)
  , chunk_size_(chunk_size)
  , total_size_(total_size) {}

std::optional<Chunk> ChunkStream::next() {
  if (finished_ || cancelled_) {
    return std::nullopt;
  }

  // An empty image is a single empty final chunk
  if (total_size_ == 0) {
    finished_ = true;
    BOOST_LOG_TRIVIAL(debug) << "Chunk streamer: Empty image " << id_ << "@" << version_;
    return Chunk{0, {}, true};
  }

  const uint64_t expected = std::min(chunk_size_, total_size_ - offset_);

  Chunk chunk;
  chunk.offset = offset_;
  try {
    chunk.data = store_.read_range(id_, version_, offset_, chunk_size_);
  } catch (const std::exception&) {
    finished_ = true;
    throw;
  }

  if (chunk.data.size() != expected) {
    finished_ = true;
    BOOST_LOG_TRIVIAL(error) << "Chunk streamer: Store returned " << chunk.data.size() << " bytes at offset "
                             << offset_ << " of " << id_ << "@" << version_ << ", expected " << expected
                             << " of " << total_size_;
    throw StoreInconsistencyError("Store returned " + std::to_string(chunk.data.size()) +
                                  " bytes at offset " + std::to_string(offset_) + ", expected " +
                                  std::to_string(expected));
  }

  offset_ += chunk.data.size();
  chunk.is_final = offset_ == total_size_;
  finished_ = chunk.is_final;

  BOOST_LOG_TRIVIAL(trace) << "Chunk streamer: Produced " << chunk.data.size() << " bytes at offset "
                           << chunk.offset << (chunk.is_final ? " (final)" : "");
  return chunk;
}


//==============================================
// CHUNK STREAMER
//==============================================

ChunkStreamer::ChunkStreamer(const store::ContentStore& store)
  : store_(store) {}

std::unique_ptr<ChunkStream> ChunkStreamer::stream(const store::ComponentId& id, store::Version version,
                                                   uint64_t chunk_size) const {
  if (chunk_size == 0 || chunk_size > MAX_CHUNK_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Chunk streamer: Invalid chunk size: " << chunk_size;
    throw InvalidArgumentError("Chunk size must be between 1 and " + std::to_string(MAX_CHUNK_SIZE) +
                               " bytes, got " + std::to_string(chunk_size));
  }

  const uint64_t total_size = store_.size(id, version);
  BOOST_LOG_TRIVIAL(debug) << "Chunk streamer: Streaming " << total_size << " bytes of " << id << "@" << version
                           << " in chunks of " << chunk_size;
  return std::make_unique<ChunkStream>(store_, id, version, chunk_size, total_size);
}

} // namespace download
} // namespace ifs
