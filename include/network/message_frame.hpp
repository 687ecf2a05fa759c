#ifndef IFS_NETWORK_MESSAGE_FRAME_HPP
#define IFS_NETWORK_MESSAGE_FRAME_HPP

#include <cstdint>
#include "download/chunk.hpp"

namespace ifs {
namespace network {

// Message type used to differentiate between frames on the wire
enum class MessageType : uint8_t {
    DOWNLOAD_REQUEST = 1,
    SUCCESS_CHUNK = 2,
    ERROR = 3,
    STREAM_END = 4
};

// Upper bounds enforced while decoding untrusted input
constexpr uint32_t MAX_COMPONENT_ID_LENGTH = 4096;
constexpr uint32_t MAX_ERROR_MESSAGE_LENGTH = 64 * 1024;

// One item of the DownloadIFS response stream
struct ResponseFrame {
    MessageType message_type{MessageType::STREAM_END};
    download::Chunk chunk;
    download::DownloadError error;

    static ResponseFrame from_result(const download::DownloadResult& result) {
        ResponseFrame frame;
        if (const auto* chunk = std::get_if<download::Chunk>(&result)) {
            frame.message_type = MessageType::SUCCESS_CHUNK;
            frame.chunk = *chunk;
        } else {
            frame.message_type = MessageType::ERROR;
            frame.error = std::get<download::DownloadError>(result);
        }
        return frame;
    }

    static ResponseFrame end_of_stream() {
        return ResponseFrame{};
    }
};

} // namespace network
} // namespace ifs

#endif // IFS_NETWORK_MESSAGE_FRAME_HPP
