#include "net/chunked_decoder.hpp"

#include <algorithm>

#include "relay/net/errors.hpp"

namespace relay::net {

namespace {

constexpr size_t kMaxLineBytes = 4096;

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

std::error_code ChunkedDecoder::feed(std::string_view input, std::string& out) {
  size_t i = 0;
  while (i < input.size() && state_ != State::Done) {
    switch (state_) {
      case State::Size:
      case State::Trailer: {
        char c = input[i++];
        if (c != '\n') {
          if (line_.size() >= kMaxLineBytes) return Error::bad_chunk_encoding;
          line_.push_back(c);
          break;
        }
        if (!line_.empty() && line_.back() == '\r') line_.pop_back();

        if (state_ == State::Size) {
          if (auto ec = finish_size_line()) return ec;
        } else if (line_.empty()) {
          state_ = State::Done;
        }
        line_.clear();
        break;
      }

      case State::Data: {
        auto n = static_cast<size_t>(std::min<uint64_t>(remaining_, input.size() - i));
        out.append(input.data() + i, n);
        i += n;
        remaining_ -= n;
        if (remaining_ == 0) state_ = State::DataCr;
        break;
      }

      case State::DataCr: {
        char c = input[i++];
        if (c == '\r') {
          state_ = State::DataLf;
        } else if (c == '\n') {
          state_ = State::Size;
        } else {
          return Error::bad_chunk_encoding;
        }
        break;
      }

      case State::DataLf: {
        if (input[i++] != '\n') return Error::bad_chunk_encoding;
        state_ = State::Size;
        break;
      }

      case State::Done:
        break;
    }
  }
  consumed_ = i;
  return {};
}

std::error_code ChunkedDecoder::finish_size_line() {
  std::string_view size = line_;
  auto semi = size.find(';');
  if (semi != std::string_view::npos) size = size.substr(0, semi);
  while (!size.empty() && (size.back() == ' ' || size.back() == '\t')) size.remove_suffix(1);

  if (size.empty() || size.size() > 15) {
    return Error::bad_chunk_encoding;
  }

  uint64_t value = 0;
  for (char c : size) {
    int v = hex_value(c);
    if (v < 0) return Error::bad_chunk_encoding;
    value = value * 16 + static_cast<uint64_t>(v);
  }

  if (value == 0) {
    state_ = State::Trailer;
  } else {
    remaining_ = value;
    state_ = State::Data;
  }
  return {};
}

}  // namespace relay::net
