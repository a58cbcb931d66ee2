#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace relay::net {

// Incremental decoder for "Transfer-Encoding: chunked" bodies.
// Input may be split at any byte; each feed() appends the payload bytes it
// could decode to out. Chunk extensions and trailer fields are discarded.
class ChunkedDecoder {
 public:
  std::error_code feed(std::string_view input, std::string& out);

  // The terminating zero-size chunk and trailer section were consumed
  bool done() const {
    return state_ == State::Done;
  }

  // Bytes of the last successful feed() that belonged to the body.
  // Anything after them is the next message on the connection.
  size_t consumed() const {
    return consumed_;
  }

 private:
  enum class State {
    Size,       // hex size line, possibly with ;extensions
    Data,       // payload bytes
    DataCr,     // CR after payload
    DataLf,     // LF after payload
    Trailer,    // trailer lines until an empty one
    Done,
  };

  std::error_code finish_size_line();

  State state_ = State::Size;
  uint64_t remaining_ = 0;
  size_t consumed_ = 0;
  std::string line_;
};

}  // namespace relay::net
