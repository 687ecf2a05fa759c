#ifndef IFS_NETWORK_CODEC_HPP
#define IFS_NETWORK_CODEC_HPP

#include <cstdint>
#include <iostream>
#include <boost/endian/conversion.hpp>
#include "download/chunk.hpp"
#include "network/message_frame.hpp"

namespace ifs {
namespace network {

/**
 * Binary framing of the DownloadIFS call. All integers are big-endian.
 *
 *   request:  u8 type | u32 id_len | id | u8 has_version | u64 version
 *   chunk:    u8 type | u64 offset | u8 is_final | u64 len | bytes
 *   error:    u8 type | u8 kind | u32 msg_len | msg
 *   end:      u8 type
 *
 * Errors are reported as std::runtime_error.
 */
class Codec {
public:
  // ---- SERIALIZATION AND DESERIALIZATION ----
  // Serializes a request and returns the number of bytes written
  std::size_t serialize_request(const download::DownloadRequest& request, std::ostream& output) const;
  download::DownloadRequest deserialize_request(std::istream& input) const;

  // Serializes one response frame and returns the number of bytes written
  std::size_t serialize_response(const ResponseFrame& frame, std::ostream& output) const;
  ResponseFrame deserialize_response(std::istream& input) const;

private:
  // ---- STREAM OPERATIONS ----
  // Writes bytes to an output stream
  void write_bytes(std::ostream& output, const void* data, std::size_t size) const;
  // Reads bytes from an input stream
  void read_bytes(std::istream& input, void* data, std::size_t size) const;

  template <typename T>
  void write_integer(std::ostream& output, T host_value) const {
    T network_value = boost::endian::native_to_big(host_value);
    write_bytes(output, &network_value, sizeof(network_value));
  }

  template <typename T>
  T read_integer(std::istream& input) const {
    T network_value;
    read_bytes(input, &network_value, sizeof(network_value));
    return boost::endian::big_to_native(network_value);
  }

  // Reads and validates the leading message type byte
  MessageType read_message_type(std::istream& input) const;
};

} // namespace network
} // namespace ifs

#endif // IFS_NETWORK_CODEC_HPP
