#include "network/ifs_client.hpp"
#include <boost/asio.hpp>
#include <boost/log/trivial.hpp>

namespace ifs {
namespace network {

namespace {

FetchResult transport_failure(FetchResult result, const std::string& message) {
  BOOST_LOG_TRIVIAL(error) << "IFS client: " << message;
  result.status = FetchStatus::FAILED;
  result.error = download::DownloadError{ErrorKind::TRANSPORT_FAILURE, message};
  return result;
}

} // namespace

const char* fetch_status_to_string(FetchStatus status) {
  switch (status) {
    case FetchStatus::COMPLETED: return "COMPLETED";
    case FetchStatus::FAILED: return "FAILED";
    case FetchStatus::CANCELLED: return "CANCELLED";
    default: return "UNKNOWN";
  }
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

IfsClient::IfsClient(const std::string& address, uint16_t port)
  : address_(address)
  , port_(port) {}


//==============================================
// DOWNLOAD OPERATIONS
//==============================================

FetchResult IfsClient::download(const download::DownloadRequest& request, const ChunkHandler& handler) const {
  FetchResult result;

  boost::asio::ip::tcp::iostream stream;
  stream.connect(address_, std::to_string(port_));
  if (!stream) {
    return transport_failure(result, "Failed to connect to " + address_ + ":" + std::to_string(port_) + ": " +
                                     stream.error().message());
  }

  BOOST_LOG_TRIVIAL(debug) << "IFS client: Connected to " << address_ << ":" << port_
                           << ", requesting " << request.component_id;

  try {
    codec_.serialize_request(request, stream);
    if (!stream) {
      return transport_failure(result, "Failed to send download request");
    }

    uint64_t expected_offset = 0;
    bool final_seen = false;

    while (true) {
      const ResponseFrame frame = codec_.deserialize_response(stream);

      switch (frame.message_type) {
        case MessageType::SUCCESS_CHUNK: {
          const auto& chunk = frame.chunk;
          if (final_seen) {
            return transport_failure(result, "Chunk received after the final chunk");
          }
          if (chunk.offset != expected_offset) {
            return transport_failure(result, "Non contiguous chunk at offset " + std::to_string(chunk.offset) +
                                             ", expected " + std::to_string(expected_offset));
          }
          expected_offset = chunk.end_offset();
          final_seen = chunk.is_final;
          ++result.chunks;
          result.bytes += chunk.data.size();

          if (!handler(chunk)) {
            BOOST_LOG_TRIVIAL(info) << "IFS client: Download of " << request.component_id
                                    << " cancelled after " << result.chunks << " chunks";
            stream.close();
            result.status = FetchStatus::CANCELLED;
            return result;
          }
          break;
        }

        case MessageType::ERROR:
          BOOST_LOG_TRIVIAL(warning) << "IFS client: Server reported " << error_kind_to_string(frame.error.kind)
                                     << ": " << frame.error.message;
          result.status = FetchStatus::FAILED;
          result.error = frame.error;
          return result;

        case MessageType::STREAM_END:
          if (!final_seen) {
            return transport_failure(result, "Stream ended before the final chunk");
          }
          result.status = FetchStatus::COMPLETED;
          BOOST_LOG_TRIVIAL(debug) << "IFS client: Download of " << request.component_id << " complete, "
                                   << result.bytes << " bytes";
          return result;

        default:
          return transport_failure(result, "Unexpected frame in response stream");
      }
    }
  } catch (const std::exception& e) {
    return transport_failure(result, std::string("Download failed: ") + e.what());
  }
}

FetchResult IfsClient::download_to(const download::DownloadRequest& request, std::ostream& output) const {
  std::optional<download::DownloadError> write_error;

  FetchResult result = download(request, [&output, &write_error](const download::Chunk& chunk) {
    output.write(reinterpret_cast<const char*>(chunk.data.data()), static_cast<std::streamsize>(chunk.data.size()));
    if (!output) {
      BOOST_LOG_TRIVIAL(error) << "IFS client: Failed to write chunk at offset " << chunk.offset;
      write_error = download::DownloadError{ErrorKind::INTERNAL,
                                            "Failed to write chunk at offset " + std::to_string(chunk.offset) +
                                            " to output"};
      return false;
    }
    return true;
  });

  // A local write failure stops the download but is not a cancellation
  if (write_error && result.status == FetchStatus::CANCELLED) {
    result.status = FetchStatus::FAILED;
    result.error = write_error;
  }
  return result;
}

} // namespace network
} // namespace ifs
