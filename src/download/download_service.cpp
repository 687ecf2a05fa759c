#include "download/download_service.hpp"
#include <boost/log/trivial.hpp>

namespace ifs {
namespace download {

namespace {

std::string describe(const DownloadRequest& request) {
  return request.component_id.str() + "@" +
         (request.version ? std::to_string(*request.version) : std::string("latest"));
}

} // namespace

//==============================================
// DOWNLOAD SESSION
//==============================================

DownloadSession::DownloadSession(const store::ContentStore& store, DownloadRequest request, uint64_t chunk_size)
  : store_(store)
  , request_(std::move(request))
  , chunk_size_(chunk_size) {
  BOOST_LOG_TRIVIAL(debug) << "Download session: Created for " << describe(request_);
}

std::optional<DownloadResult> DownloadSession::next() {
  switch (state_.get_state()) {
    case DownloadState::State::RESOLVING:
      if (!resolve()) {
        return take_terminal_error();
      }
      return stream_next();

    case DownloadState::State::STREAMING:
      return stream_next();

    case DownloadState::State::FAILED:
      return take_terminal_error();

    case DownloadState::State::COMPLETED:
    case DownloadState::State::CANCELLED:
      return std::nullopt;
  }
  return std::nullopt;
}

void DownloadSession::cancel() {
  if (!state_.transition_to(DownloadState::State::CANCELLED)) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "Download session: Cancelled " << describe(request_)
                          << " after " << chunks_emitted_.load() << " chunks";
  std::lock_guard<std::mutex> lock(stream_mutex_);
  if (stream_) {
    stream_->cancel();
  }
}

void DownloadSession::report_transport_failure(const std::string& message) {
  BOOST_LOG_TRIVIAL(warning) << "Download session: Transport failure for " << describe(request_) << ": " << message;
  fail(ErrorKind::TRANSPORT_FAILURE, message);

  std::lock_guard<std::mutex> lock(stream_mutex_);
  if (stream_) {
    stream_->cancel();
  }
}

DownloadOutcome DownloadSession::outcome() const {
  DownloadOutcome outcome;
  outcome.state = state_.get_state();
  outcome.version = pinned_version_;
  outcome.chunks = chunks_emitted_.load();
  outcome.bytes = bytes_emitted_.load();
  outcome.error = error_;
  return outcome;
}

bool DownloadSession::resolve() {
  if (request_.component_id.empty()) {
    fail(ErrorKind::INVALID_ARGUMENT, "Component id must not be empty");
    return false;
  }

  try {
    VersionResolver resolver(store_);
    const store::Version version = resolver.resolve(request_.component_id, request_.version);

    ChunkStreamer streamer(store_);
    auto stream = streamer.stream(request_.component_id, version, chunk_size_);

    pinned_version_ = version;
    {
      std::lock_guard<std::mutex> lock(stream_mutex_);
      stream_ = std::move(stream);
    }
  } catch (const IfsError& e) {
    fail(e.kind(), e.what());
    return false;
  } catch (const std::exception& e) {
    fail(ErrorKind::INTERNAL, e.what());
    return false;
  }

  // Fails only if the session was cancelled while resolving
  if (!state_.transition_to(DownloadState::State::STREAMING)) {
    return false;
  }

  BOOST_LOG_TRIVIAL(info) << "Download session: Streaming " << request_.component_id << "@" << *pinned_version_;
  return true;
}

std::optional<DownloadResult> DownloadSession::stream_next() {
  std::optional<Chunk> chunk;
  try {
    chunk = stream_->next();
  } catch (const IfsError& e) {
    fail(e.kind(), e.what());
    return take_terminal_error();
  } catch (const std::exception& e) {
    fail(ErrorKind::INTERNAL, e.what());
    return take_terminal_error();
  }

  if (!chunk) {
    if (stream_->cancelled()) {
      return take_terminal_error();
    }
    if (state_.transition_to(DownloadState::State::COMPLETED)) {
      BOOST_LOG_TRIVIAL(info) << "Download session: Completed " << request_.component_id << "@" << *pinned_version_
                              << ", " << chunks_emitted_.load() << " chunks, " << bytes_emitted_.load() << " bytes";
    }
    return std::nullopt;
  }

  // Cancelled while the read was in flight
  if (state_.get_state() != DownloadState::State::STREAMING) {
    return take_terminal_error();
  }

  ++chunks_emitted_;
  bytes_emitted_ += chunk->data.size();
  return DownloadResult{std::move(*chunk)};
}

void DownloadSession::fail(ErrorKind kind, const std::string& message) {
  if (!state_.transition_to(DownloadState::State::FAILED)) {
    BOOST_LOG_TRIVIAL(debug) << "Download session: Ignoring error in state " << state_.get_state_string()
                             << ": " << message;
    return;
  }

  BOOST_LOG_TRIVIAL(error) << "Download session: " << describe(request_) << " failed ("
                           << error_kind_to_string(kind) << "): " << message;
  error_ = DownloadError{kind, message};
}

std::optional<DownloadResult> DownloadSession::take_terminal_error() {
  if (state_.get_state() != DownloadState::State::FAILED || !error_ || error_emitted_) {
    return std::nullopt;
  }
  error_emitted_ = true;
  return DownloadResult{*error_};
}


//==============================================
// DOWNLOAD SERVICE
//==============================================

DownloadService::DownloadService(const store::ContentStore& store, ServiceConfig config)
  : store_(store)
  , config_(config) {
  if (config_.chunk_size == 0 || config_.chunk_size > MAX_CHUNK_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Download service: Invalid chunk size: " << config_.chunk_size;
    throw InvalidArgumentError("Download service: Chunk size must be between 1 and " +
                               std::to_string(MAX_CHUNK_SIZE) + " bytes");
  }
  BOOST_LOG_TRIVIAL(info) << "Download service: Initialized with chunk size " << config_.chunk_size;
}

std::unique_ptr<DownloadSession> DownloadService::open(const DownloadRequest& request) const {
  return std::make_unique<DownloadSession>(store_, request, config_.chunk_size);
}

DownloadOutcome DownloadService::download(const DownloadRequest& request, ResponseWriter& writer) const {
  auto session = open(request);

  while (auto item = session->next()) {
    if (writer.write(*item)) {
      continue;
    }

    if (is_error(*item)) {
      BOOST_LOG_TRIVIAL(warning) << "Download service: Failed to deliver terminal error for " << describe(request);
      break;
    }

    const auto& chunk = std::get<Chunk>(*item);
    session->report_transport_failure("Failed to write chunk at offset " + std::to_string(chunk.offset));
    if (auto terminal = session->next()) {
      if (!writer.write(*terminal)) {
        BOOST_LOG_TRIVIAL(warning) << "Download service: Transport failure could not be reported to client";
      }
    }
    break;
  }

  DownloadOutcome outcome = session->outcome();
  BOOST_LOG_TRIVIAL(debug) << "Download service: " << describe(request) << " ended in state "
                           << DownloadState::state_to_string(outcome.state);
  return outcome;
}

} // namespace download
} // namespace ifs
