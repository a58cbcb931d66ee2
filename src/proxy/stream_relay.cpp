#include "stream_relay.hpp"

#include <spdlog/spdlog.h>

#include "relay/net/errors.hpp"

namespace relay::proxy {

std::string to_string(RelayOutcome outcome) {
  switch (outcome) {
    case RelayOutcome::Completed:
      return "completed";
    case RelayOutcome::UpstreamFailed:
      return "upstream_failed";
    case RelayOutcome::CallerGone:
      return "caller_gone";
  }
  return "unknown";
}

StreamRelay::StreamRelay(std::shared_ptr<net::ChunkSource> source, std::shared_ptr<net::ChunkSink> sink, std::string label)
    : source_(std::move(source)), sink_(std::move(sink)), label_(std::move(label)) {}

StreamRelay::~StreamRelay() {
  release();
}

void StreamRelay::start(DoneCallback on_done) {
  on_done_ = std::move(on_done);
  session_.started = std::chrono::steady_clock::now();
  read_next();
}

void StreamRelay::cancel() {
  if (done_) {
    return;
  }
  spdlog::warn("[{}] Caller disconnected after {} chunks, closing upstream", label_, session_.chunk_count);
  release();
  complete(RelayOutcome::CallerGone);
}

void StreamRelay::read_next() {
  if (done_) {
    return;
  }
  source_->read_chunk([self = shared_from_this()](const std::error_code& ec, std::string chunk) {
    self->on_chunk(ec, std::move(chunk));
  });
}

void StreamRelay::on_chunk(const std::error_code& ec, std::string chunk) {
  if (done_) {
    return;
  }

  if (ec) {
    spdlog::error("[{}] Stream interrupted | kind: {} | detail: {}", label_, net::error_kind(ec), ec.message());
    release();
    // Terminate the body with the error text instead of leaving the caller hanging
    sink_->write_chunk(ec.message(), [self = shared_from_this()](const std::error_code& wec) {
      if (self->done_) return;
      if (wec) {
        self->complete(RelayOutcome::CallerGone);
        return;
      }
      self->sink_->finish([self](const std::error_code&) {
        self->complete(RelayOutcome::UpstreamFailed);
      });
    });
    return;
  }

  if (chunk.empty()) {
    release();
    sink_->finish([self = shared_from_this()](const std::error_code& fec) {
      if (self->done_) return;
      if (fec) {
        self->complete(RelayOutcome::CallerGone);
        return;
      }
      spdlog::info("[{}] Stream completed | chunks: {} | {:.1f}KB | {}ms", self->label_, self->session_.chunk_count,
                   self->session_.total_bytes / 1024.0, self->session_.elapsed_ms());
      self->complete(RelayOutcome::Completed);
    });
    return;
  }

  session_.chunk_count++;
  session_.total_bytes += chunk.size();
  spdlog::trace("[{}] chunk {} | {} bytes | {:.1f}KB total", label_, session_.chunk_count, chunk.size(),
                session_.total_bytes / 1024.0);

  sink_->write_chunk(std::move(chunk), [self = shared_from_this()](const std::error_code& wec) {
    if (self->done_) return;
    if (wec) {
      spdlog::warn("[{}] Write to caller failed: {}", self->label_, wec.message());
      self->release();
      self->complete(RelayOutcome::CallerGone);
      return;
    }
    self->read_next();
  });
}

void StreamRelay::release() {
  if (released_) {
    return;
  }
  released_ = true;
  source_->close();
}

void StreamRelay::complete(RelayOutcome outcome) {
  if (done_) {
    return;
  }
  done_ = true;
  release();

  auto on_done = std::move(on_done_);
  on_done_ = nullptr;
  if (on_done) {
    on_done(outcome, session_);
  }
}

}  // namespace relay::proxy
