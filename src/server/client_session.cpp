#include "server/client_session.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

#include "relay/net/errors.hpp"
#include "relay/proxy/proxy_service.hpp"

namespace relay::server {

// Reply side of one request, handed to the proxy service
class ClientSession::Channel : public proxy::ResponseChannel {
 public:
  explicit Channel(std::shared_ptr<ClientSession> session) : session_(std::move(session)) {}

  void respond(int status, HeaderMap headers, std::string body) override {
    if (used_) {
      spdlog::error("Second reply for one request dropped (status {})", status);
      return;
    }
    used_ = true;
    session_->respond(status, std::move(headers), std::move(body));
  }

  std::shared_ptr<net::ChunkSink> open_stream(int status, const std::string& content_type) override {
    used_ = true;
    return session_->open_stream(status, content_type);
  }

  void on_disconnect(std::function<void()> callback) override {
    session_->disconnect_cb_ = std::move(callback);
  }

 private:
  std::shared_ptr<ClientSession> session_;
  bool used_ = false;
};

// Writes relayed chunks as HTTP chunks, one per call
class ClientSession::StreamSink : public net::ChunkSink {
 public:
  StreamSink(std::shared_ptr<ClientSession> session, bool chunked) : session_(std::move(session)), chunked_(chunked) {}

  void write_chunk(std::string chunk, net::WriteHandler handler) override {
    if (chunk.empty()) {
      // A zero-size HTTP chunk would end the body
      asio::post(session_->socket_.get_executor(), [handler = std::move(handler)]() {
        handler({});
      });
      return;
    }

    if (!chunked_) {
      session_->write(std::move(chunk), std::move(handler));
      return;
    }

    std::ostringstream framed;
    framed << std::hex << chunk.size() << "\r\n" << chunk << "\r\n";
    session_->write(framed.str(), std::move(handler));
  }

  void finish(net::WriteHandler handler) override {
    auto session = session_;
    auto done = [session, handler = std::move(handler)](const std::error_code& ec) {
      session->stream_finished_ = true;
      session->close();
      handler(ec);
    };

    if (!chunked_) {
      asio::post(session->socket_.get_executor(), [done]() {
        done({});
      });
      return;
    }
    session_->write("0\r\n\r\n", std::move(done));
  }

 private:
  std::shared_ptr<ClientSession> session_;
  bool chunked_;
};

ClientSession::ClientSession(asio::ip::tcp::socket socket, const Config& config, proxy::ProxyService& service)
    : socket_(std::move(socket)), config_(config), service_(service), read_buf_(16 * 1024) {
  asio::error_code ec;
  auto remote = socket_.remote_endpoint(ec);
  peer_ = ec ? "unknown" : remote.address().to_string() + ":" + std::to_string(remote.port());
}

ClientSession::~ClientSession() {
  close();
}

void ClientSession::start() {
  spdlog::debug("Connection from {}", peer_);
  read_request();
}

void ClientSession::read_request() {
  if (closed_) {
    return;
  }

  request_ = net::InboundRequest{};
  decoder_ = net::ChunkedDecoder{};
  body_remaining_ = 0;
  streaming_ = false;
  stream_finished_ = false;
  disconnect_cb_ = nullptr;

  // Pipelined bytes are parsed before anything new is read
  if (!pending_.empty()) {
    auto room = head_buf_.max_size() - head_buf_.size();
    auto n = std::min(room, pending_.size());
    head_buf_.sputn(pending_.data(), static_cast<std::streamsize>(n));
    pending_.erase(0, n);
  }

  asio::async_read_until(socket_, head_buf_, "\r\n\r\n", [self = shared_from_this()](const std::error_code& ec, size_t n) {
    self->on_head(ec, n);
  });
}

void ClientSession::on_head(const std::error_code& ec, size_t n) {
  if (ec) {
    if (ec == asio::error::not_found) {
      reject(400, "Bad Request: " + make_error_code(net::Error::header_too_large).message());
    } else {
      if (ec != asio::error::eof && ec != asio::error::operation_aborted) {
        spdlog::debug("Read from {} failed: {}", peer_, ec.message());
      }
      close();
    }
    return;
  }

  std::string data(asio::buffers_begin(head_buf_.data()), asio::buffers_end(head_buf_.data()));
  head_buf_.consume(head_buf_.size());
  data += pending_;
  pending_ = data.substr(n);

  if (auto perr = net::parse_request_head(std::string_view(data).substr(0, n), request_)) {
    spdlog::warn("Malformed request from {}: {}", peer_, perr.message());
    reject(400, "Bad Request: " + perr.message());
    return;
  }

  keep_alive_ = request_.keep_alive();
  head_only_ = request_.method == "HEAD";
  chunked_reply_ = request_.version_minor >= 1;

  uint64_t length = 0;
  if (auto ferr = net::request_body_framing(request_.headers, body_framing_, length)) {
    reject(400, "Bad Request: " + ferr.message());
    return;
  }
  if (length > config_.max_body_bytes) {
    reject(413, "Payload Too Large");
    return;
  }

  if (body_framing_ != net::BodyFraming::None && header_has_token(request_.headers, "expect", "100-continue")) {
    erase_header(request_.headers, "expect");
    write("HTTP/1.1 100 Continue\r\n\r\n", [](const std::error_code&) {});
  }

  switch (body_framing_) {
    case net::BodyFraming::Length:
      body_remaining_ = length;
      read_length_body();
      break;
    case net::BodyFraming::Chunked:
      read_chunked_body();
      break;
    default:
      dispatch();
      break;
  }
}

void ClientSession::read_length_body() {
  auto take = static_cast<size_t>(std::min<uint64_t>(body_remaining_, pending_.size()));
  request_.body.append(pending_, 0, take);
  pending_.erase(0, take);
  body_remaining_ -= take;

  if (body_remaining_ == 0) {
    dispatch();
    return;
  }

  read_more([this]() {
    read_length_body();
  });
}

void ClientSession::read_chunked_body() {
  if (!pending_.empty()) {
    std::string out;
    if (auto ec = decoder_.feed(pending_, out)) {
      reject(400, "Bad Request: " + ec.message());
      return;
    }
    pending_.erase(0, decoder_.consumed());
    request_.body += out;

    if (request_.body.size() > config_.max_body_bytes) {
      reject(413, "Payload Too Large");
      return;
    }
    if (decoder_.done()) {
      dispatch();
      return;
    }
  }

  read_more([this]() {
    read_chunked_body();
  });
}

void ClientSession::read_more(std::function<void()> next) {
  socket_.async_read_some(asio::buffer(read_buf_), [self = shared_from_this(), next = std::move(next)](const std::error_code& ec,
                                                                                                        size_t n) {
    if (ec) {
      spdlog::debug("Caller {} went away while sending the body: {}", self->peer_, ec.message());
      self->close();
      return;
    }
    self->pending_.append(self->read_buf_.data(), n);
    next();
  });
}

void ClientSession::dispatch() {
  spdlog::debug("{} {} from {} ({} body bytes)", request_.method, request_.path, peer_, request_.body.size());
  auto channel = std::make_shared<Channel>(shared_from_this());
  service_.handle(std::move(request_), std::move(channel), socket_.get_executor());
}

void ClientSession::respond(int status, HeaderMap headers, std::string body) {
  std::ostringstream out;
  out << "HTTP/1.1 " << status << " " << net::status_reason(status) << "\r\n";
  for (const auto& [name, value] : headers) {
    if (iequals(name, "content-length") || iequals(name, "transfer-encoding") || iequals(name, "connection") ||
        iequals(name, "keep-alive")) {
      continue;
    }
    out << name << ": " << value << "\r\n";
  }
  out << "Content-Length: " << body.size() << "\r\n";
  out << "Connection: " << (keep_alive_ ? "keep-alive" : "close") << "\r\n";
  out << "\r\n";
  if (!head_only_) {
    out << body;
  }

  write(out.str(), [self = shared_from_this()](const std::error_code& ec) {
    if (ec || !self->keep_alive_) {
      self->close();
      return;
    }
    self->read_request();
  });
}

std::shared_ptr<net::ChunkSink> ClientSession::open_stream(int status, const std::string& content_type) {
  streaming_ = true;

  std::ostringstream out;
  out << "HTTP/1.1 " << status << " " << net::status_reason(status) << "\r\n";
  out << "Content-Type: " << content_type << "\r\n";
  out << "Cache-Control: no-cache\r\n";
  if (chunked_reply_) {
    out << "Transfer-Encoding: chunked\r\n";
  }
  out << "Connection: close\r\n";
  out << "\r\n";

  // Write errors surface on the first relayed chunk
  write(out.str(), [](const std::error_code&) {});
  watch_disconnect();

  return std::make_shared<StreamSink>(shared_from_this(), chunked_reply_);
}

void ClientSession::reject(int status, const std::string& text) {
  keep_alive_ = false;
  HeaderMap headers;
  headers.emplace("Content-Type", "text/plain; charset=utf-8");
  respond(status, std::move(headers), text);
}

void ClientSession::watch_disconnect() {
  socket_.async_read_some(asio::buffer(read_buf_), [self = shared_from_this()](const std::error_code& ec, size_t) {
    if (self->stream_finished_ || self->closed_) {
      return;
    }
    if (ec) {
      spdlog::debug("Caller {} disconnected: {}", self->peer_, ec.message());
      auto cb = std::move(self->disconnect_cb_);
      self->disconnect_cb_ = nullptr;
      self->close();
      if (cb) cb();
      return;
    }
    // Bytes sent during a stream are discarded; the connection ends with it
    self->watch_disconnect();
  });
}

void ClientSession::write(std::string bytes, net::WriteHandler handler) {
  if (closed_) {
    asio::post(socket_.get_executor(), [handler = std::move(handler)]() {
      handler(asio::error::not_connected);
    });
    return;
  }

  outbox_.emplace_back(std::move(bytes), std::move(handler));
  if (!writing_) {
    do_write();
  }
}

void ClientSession::do_write() {
  writing_ = true;
  asio::async_write(socket_, asio::buffer(outbox_.front().first), [self = shared_from_this()](const std::error_code& ec, size_t) {
    auto handler = std::move(self->outbox_.front().second);
    self->outbox_.pop_front();

    if (ec) {
      // Fail everything still queued
      auto queued = std::move(self->outbox_);
      self->outbox_.clear();
      self->writing_ = false;
      self->close();
      handler(ec);
      for (auto& [bytes, h] : queued) {
        h(ec);
      }
      return;
    }

    if (self->outbox_.empty()) {
      self->writing_ = false;
    } else {
      self->do_write();
    }
    handler(ec);
  });
}

void ClientSession::close() {
  if (closed_) {
    return;
  }
  closed_ = true;

  asio::error_code ignored;
  socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
  socket_.close(ignored);
}

}  // namespace relay::server
