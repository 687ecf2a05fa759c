#include "network/codec.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <stdexcept>
#include <string>

namespace ifs {
namespace network {

//==============================================
// REQUESTS
//==============================================

std::size_t Codec::serialize_request(const download::DownloadRequest& request, std::ostream& output) const {
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid output stream state";
    throw std::runtime_error("Codec: Invalid output stream");
  }

  const std::string& id = request.component_id.str();
  if (id.size() > MAX_COMPONENT_ID_LENGTH) {
    throw std::runtime_error("Codec: Component id too long: " + std::to_string(id.size()));
  }

  std::size_t total_bytes = 0;

  write_integer<uint8_t>(output, static_cast<uint8_t>(MessageType::DOWNLOAD_REQUEST));
  total_bytes += sizeof(uint8_t);

  write_integer<uint32_t>(output, static_cast<uint32_t>(id.size()));
  write_bytes(output, id.data(), id.size());
  total_bytes += sizeof(uint32_t) + id.size();

  // Version is always written so the frame has a fixed tail
  write_integer<uint8_t>(output, request.version ? 1 : 0);
  write_integer<uint64_t>(output, request.version.value_or(0));
  total_bytes += sizeof(uint8_t) + sizeof(uint64_t);

  output.flush();
  BOOST_LOG_TRIVIAL(debug) << "Codec: Serialized download request for " << id << ", " << total_bytes << " bytes";
  return total_bytes;
}

download::DownloadRequest Codec::deserialize_request(std::istream& input) const {
  if (!input.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid input stream state";
    throw std::runtime_error("Codec: Invalid input stream");
  }

  MessageType type = read_message_type(input);
  if (type != MessageType::DOWNLOAD_REQUEST) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Expected download request, got message type " << static_cast<int>(type);
    throw std::runtime_error("Codec: Unexpected message type");
  }

  const uint32_t id_length = read_integer<uint32_t>(input);
  if (id_length > MAX_COMPONENT_ID_LENGTH) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Component id length " << id_length << " exceeds limit";
    throw std::runtime_error("Codec: Component id too long");
  }

  std::string id(id_length, '\0');
  read_bytes(input, id.data(), id.size());

  const uint8_t has_version = read_integer<uint8_t>(input);
  const uint64_t version = read_integer<uint64_t>(input);
  if (has_version > 1) {
    throw std::runtime_error("Codec: Invalid version flag");
  }

  download::DownloadRequest request;
  request.component_id = store::ComponentId(std::move(id));
  if (has_version == 1) {
    request.version = version;
  }

  BOOST_LOG_TRIVIAL(debug) << "Codec: Deserialized download request for " << request.component_id;
  return request;
}


//==============================================
// RESPONSES
//==============================================

std::size_t Codec::serialize_response(const ResponseFrame& frame, std::ostream& output) const {
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid output stream state";
    throw std::runtime_error("Codec: Invalid output stream");
  }

  std::size_t total_bytes = sizeof(uint8_t);
  write_integer<uint8_t>(output, static_cast<uint8_t>(frame.message_type));

  switch (frame.message_type) {
    case MessageType::SUCCESS_CHUNK: {
      const auto& chunk = frame.chunk;
      write_integer<uint64_t>(output, chunk.offset);
      write_integer<uint8_t>(output, chunk.is_final ? 1 : 0);
      write_integer<uint64_t>(output, static_cast<uint64_t>(chunk.data.size()));
      write_bytes(output, chunk.data.data(), chunk.data.size());
      total_bytes += sizeof(uint64_t) + sizeof(uint8_t) + sizeof(uint64_t) + chunk.data.size();
      break;
    }

    case MessageType::ERROR: {
      const auto& message = frame.error.message;
      const uint32_t message_length =
          static_cast<uint32_t>(std::min<std::size_t>(message.size(), MAX_ERROR_MESSAGE_LENGTH));
      write_integer<uint8_t>(output, static_cast<uint8_t>(frame.error.kind));
      write_integer<uint32_t>(output, message_length);
      write_bytes(output, message.data(), message_length);
      total_bytes += sizeof(uint8_t) + sizeof(uint32_t) + message_length;
      break;
    }

    case MessageType::STREAM_END:
      break;

    default:
      BOOST_LOG_TRIVIAL(error) << "Codec: Cannot serialize message type " << static_cast<int>(frame.message_type)
                               << " as a response";
      throw std::runtime_error("Codec: Invalid response message type");
  }

  output.flush();
  BOOST_LOG_TRIVIAL(trace) << "Codec: Serialized response frame of type " << static_cast<int>(frame.message_type)
                           << ", " << total_bytes << " bytes";
  return total_bytes;
}

ResponseFrame Codec::deserialize_response(std::istream& input) const {
  if (!input.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid input stream state";
    throw std::runtime_error("Codec: Invalid input stream");
  }

  ResponseFrame frame;
  frame.message_type = read_message_type(input);

  switch (frame.message_type) {
    case MessageType::SUCCESS_CHUNK: {
      frame.chunk.offset = read_integer<uint64_t>(input);
      const uint8_t is_final = read_integer<uint8_t>(input);
      const uint64_t length = read_integer<uint64_t>(input);
      if (is_final > 1) {
        throw std::runtime_error("Codec: Invalid final flag");
      }
      if (length > download::MAX_CHUNK_SIZE) {
        BOOST_LOG_TRIVIAL(error) << "Codec: Chunk length " << length << " exceeds limit";
        throw std::runtime_error("Codec: Chunk too large");
      }
      frame.chunk.is_final = is_final == 1;
      frame.chunk.data.resize(static_cast<std::size_t>(length));
      read_bytes(input, frame.chunk.data.data(), frame.chunk.data.size());
      break;
    }

    case MessageType::ERROR: {
      const uint8_t kind = read_integer<uint8_t>(input);
      if (!is_valid_error_kind(kind)) {
        BOOST_LOG_TRIVIAL(error) << "Codec: Unknown error kind " << static_cast<int>(kind);
        throw std::runtime_error("Codec: Unknown error kind");
      }
      const uint32_t message_length = read_integer<uint32_t>(input);
      if (message_length > MAX_ERROR_MESSAGE_LENGTH) {
        throw std::runtime_error("Codec: Error message too long");
      }
      frame.error.kind = static_cast<ErrorKind>(kind);
      frame.error.message.resize(message_length);
      read_bytes(input, frame.error.message.data(), message_length);
      break;
    }

    case MessageType::STREAM_END:
      break;

    default:
      BOOST_LOG_TRIVIAL(error) << "Codec: Unexpected message type in response: "
                               << static_cast<int>(frame.message_type);
      throw std::runtime_error("Codec: Unexpected message type");
  }

  return frame;
}


//==============================================
// UTILITY METHODS
//==============================================

MessageType Codec::read_message_type(std::istream& input) const {
  const uint8_t raw = read_integer<uint8_t>(input);
  if (raw < static_cast<uint8_t>(MessageType::DOWNLOAD_REQUEST) ||
      raw > static_cast<uint8_t>(MessageType::STREAM_END)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Unknown message type: " << static_cast<int>(raw);
    throw std::runtime_error("Codec: Unknown message type");
  }
  return static_cast<MessageType>(raw);
}

void Codec::write_bytes(std::ostream& output, const void* data, std::size_t size) const {
  if (size == 0) {
    return;
  }
  if (!output.write(static_cast<const char*>(data), static_cast<std::streamsize>(size))) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to write " << size << " bytes to output stream";
    throw std::runtime_error("Codec: Failed to write to output stream");
  }
}

void Codec::read_bytes(std::istream& input, void* data, std::size_t size) const {
  if (size == 0) {
    return;
  }
  if (!input.read(static_cast<char*>(data), static_cast<std::streamsize>(size))) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to read " << size << " bytes from input stream";
    throw std::runtime_error("Codec: Failed to read from input stream");
  }
}

} // namespace network
} // namespace ifs
