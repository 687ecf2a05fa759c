#ifndef IFS_DOWNLOAD_CHUNK_HPP
#define IFS_DOWNLOAD_CHUNK_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include "store/content_store.hpp"

namespace ifs {
namespace download {

// Default and upper bound for the size of a single chunk
constexpr uint64_t DEFAULT_CHUNK_SIZE = 1024 * 1024;
constexpr uint64_t MAX_CHUNK_SIZE = 16 * 1024 * 1024;

// Contiguous slice of an image starting at offset
struct Chunk {
    uint64_t offset{0};
    store::Bytes data;
    bool is_final{false};

    uint64_t end_offset() const { return offset + data.size(); }
};

struct DownloadError {
    ErrorKind kind{ErrorKind::INTERNAL};
    std::string message;
};

// One item of a download response, either a success chunk or the terminal error
using DownloadResult = std::variant<Chunk, DownloadError>;

inline bool is_error(const DownloadResult& result) {
    return std::holds_alternative<DownloadError>(result);
}

struct DownloadRequest {
    store::ComponentId component_id;
    // Absent means the latest published version
    std::optional<store::Version> version;
};

} // namespace download
} // namespace ifs

#endif // IFS_DOWNLOAD_CHUNK_HPP
