#include <gtest/gtest.h>
#include <sstream>
#include <boost/endian/conversion.hpp>
#include "network/codec.hpp"
#include "network/message_frame.hpp"
#include "test_utils.hpp"

using namespace ifs;
using namespace ifs::network;
using ifs::download::Chunk;
using ifs::download::DownloadError;
using ifs::download::DownloadRequest;
using ifs::store::ComponentId;

class CodecTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_logging();
  }

  Codec codec;
};

TEST_F(CodecTest, RequestWithVersion) {
  std::stringstream stream;
  const DownloadRequest request{ComponentId("3f2b7c4e-0d1a"), store::Version{0}};
  const std::size_t written = codec.serialize_request(request, stream);

  EXPECT_EQ(written, 1u + 4u + 13u + 1u + 8u);
  EXPECT_EQ(stream.str().size(), written);

  const auto decoded = codec.deserialize_request(stream);
  EXPECT_EQ(decoded.component_id, request.component_id);
  ASSERT_TRUE(decoded.version) << "Version zero must survive as a present version";
  EXPECT_EQ(*decoded.version, 0u);
}

TEST_F(CodecTest, RequestWithoutVersion) {
  std::stringstream stream;
  codec.serialize_request(DownloadRequest{ComponentId("C1"), std::nullopt}, stream);

  const auto decoded = codec.deserialize_request(stream);
  EXPECT_EQ(decoded.component_id.str(), "C1");
  EXPECT_FALSE(decoded.version);
}

TEST_F(CodecTest, RequestLayoutIsBigEndian) {
  std::stringstream stream;
  codec.serialize_request(DownloadRequest{ComponentId("AB"), store::Version{0x0102}}, stream);
  const std::string bytes = stream.str();

  ASSERT_EQ(bytes.size(), 16u);
  EXPECT_EQ(static_cast<uint8_t>(bytes[0]), 0x01);
  EXPECT_EQ(bytes.substr(1, 4), std::string("\x00\x00\x00\x02", 4));
  EXPECT_EQ(bytes.substr(5, 2), "AB");
  EXPECT_EQ(static_cast<uint8_t>(bytes[7]), 1);
  EXPECT_EQ(static_cast<uint8_t>(bytes[14]), 0x01);
  EXPECT_EQ(static_cast<uint8_t>(bytes[15]), 0x02);
}

TEST_F(CodecTest, ChunkFrame) {
  Chunk chunk;
  chunk.offset = 1048576;
  chunk.data = make_pattern(300);
  chunk.is_final = true;

  std::stringstream stream;
  codec.serialize_response(ResponseFrame::from_result(chunk), stream);
  const auto frame = codec.deserialize_response(stream);

  EXPECT_EQ(frame.message_type, MessageType::SUCCESS_CHUNK);
  EXPECT_EQ(frame.chunk.offset, chunk.offset);
  EXPECT_EQ(frame.chunk.data, chunk.data);
  EXPECT_TRUE(frame.chunk.is_final);
}

TEST_F(CodecTest, ErrorFrame) {
  std::stringstream stream;
  codec.serialize_response(ResponseFrame::from_result(DownloadError{ErrorKind::NOT_FOUND, "no version 5"}), stream);
  const auto frame = codec.deserialize_response(stream);

  EXPECT_EQ(frame.message_type, MessageType::ERROR);
  EXPECT_EQ(frame.error.kind, ErrorKind::NOT_FOUND);
  EXPECT_EQ(frame.error.message, "no version 5");
}

TEST_F(CodecTest, FrameSequence) {
  std::stringstream stream;
  codec.serialize_response(ResponseFrame::from_result(Chunk{0, {1, 2, 3}, false}), stream);
  codec.serialize_response(ResponseFrame::from_result(Chunk{3, {4}, true}), stream);
  codec.serialize_response(ResponseFrame::end_of_stream(), stream);

  EXPECT_EQ(codec.deserialize_response(stream).chunk.offset, 0u);
  EXPECT_EQ(codec.deserialize_response(stream).chunk.offset, 3u);
  EXPECT_EQ(codec.deserialize_response(stream).message_type, MessageType::STREAM_END);
}

TEST_F(CodecTest, RejectsUnknownMessageType) {
  std::stringstream stream(std::string("\x09", 1));
  EXPECT_THROW(codec.deserialize_response(stream), std::runtime_error);
}

TEST_F(CodecTest, RejectsResponseWhereRequestExpected) {
  std::stringstream stream;
  codec.serialize_response(ResponseFrame::end_of_stream(), stream);
  EXPECT_THROW(codec.deserialize_request(stream), std::runtime_error);
}

TEST_F(CodecTest, RejectsTruncatedChunk) {
  std::stringstream full;
  codec.serialize_response(ResponseFrame::from_result(Chunk{0, make_pattern(100), true}), full);
  std::stringstream truncated(full.str().substr(0, 50));
  EXPECT_THROW(codec.deserialize_response(truncated), std::runtime_error);
}

TEST_F(CodecTest, RejectsOversizedChunkLength) {
  std::stringstream stream;
  stream.put(static_cast<char>(MessageType::SUCCESS_CHUNK));
  const uint64_t offset = 0;
  const uint64_t length = boost::endian::native_to_big(download::MAX_CHUNK_SIZE + 1);
  stream.write(reinterpret_cast<const char*>(&offset), sizeof(offset));
  stream.put(0);
  stream.write(reinterpret_cast<const char*>(&length), sizeof(length));
  EXPECT_THROW(codec.deserialize_response(stream), std::runtime_error);
}

TEST_F(CodecTest, RejectsUnknownErrorKind) {
  std::stringstream stream;
  stream.put(static_cast<char>(MessageType::ERROR));
  stream.put(static_cast<char>(42));
  EXPECT_THROW(codec.deserialize_response(stream), std::runtime_error);
}

TEST_F(CodecTest, RejectsOverlongComponentId) {
  std::stringstream stream;
  const DownloadRequest request{ComponentId(std::string(MAX_COMPONENT_ID_LENGTH + 1, 'x')), std::nullopt};
  EXPECT_THROW(codec.serialize_request(request, stream), std::runtime_error);
}
