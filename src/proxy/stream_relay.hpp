#pragma once

#include <functional>
#include <memory>
#include <string>

#include "relay/core/types.hpp"
#include "relay/net/stream.hpp"

namespace relay::proxy {

enum class RelayOutcome {
  Completed,       // upstream reached end of stream
  UpstreamFailed,  // read error, reported to the caller as a final chunk
  CallerGone,      // write failed or the caller disconnected
};

std::string to_string(RelayOutcome outcome);

// Copies an upstream chunk source into a caller sink one chunk at a time.
// The source is closed exactly once, whichever way the relay ends.
class StreamRelay : public std::enable_shared_from_this<StreamRelay> {
 public:
  using DoneCallback = std::function<void(RelayOutcome, const RelaySession&)>;

  StreamRelay(std::shared_ptr<net::ChunkSource> source, std::shared_ptr<net::ChunkSink> sink, std::string label);

  ~StreamRelay();

  StreamRelay(const StreamRelay&) = delete;
  StreamRelay& operator=(const StreamRelay&) = delete;

  void start(DoneCallback on_done);

  // Stop relaying and release the upstream at once. No-op after completion.
  void cancel();

  bool done() const {
    return done_;
  }

  const RelaySession& session() const {
    return session_;
  }

 private:
  void read_next();

  void on_chunk(const std::error_code& ec, std::string chunk);

  void release();

  void complete(RelayOutcome outcome);

  std::shared_ptr<net::ChunkSource> source_;
  std::shared_ptr<net::ChunkSink> sink_;
  std::string label_;
  DoneCallback on_done_;
  RelaySession session_;
  bool released_ = false;
  bool done_ = false;
};

}  // namespace relay::proxy
