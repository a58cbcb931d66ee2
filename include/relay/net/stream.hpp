#pragma once

#include <functional>
#include <string>
#include <system_error>

namespace relay::net {

// Called once per read. An empty chunk with no error marks end of stream.
using ChunkHandler = std::function<void(const std::error_code& ec, std::string chunk)>;

using WriteHandler = std::function<void(const std::error_code& ec)>;

// Readable byte stream that owns an upstream connection
class ChunkSource {
 public:
  virtual ~ChunkSource() = default;

  // At most one read may be outstanding. Chunks are never empty.
  virtual void read_chunk(ChunkHandler handler) = 0;

  // Release the underlying connection. Safe to call more than once.
  virtual void close() = 0;
};

// Writable end of the caller's response
class ChunkSink {
 public:
  virtual ~ChunkSink() = default;

  // Deliver exactly this chunk as one unit
  virtual void write_chunk(std::string chunk, WriteHandler handler) = 0;

  // Terminate the stream
  virtual void finish(WriteHandler handler) = 0;
};

}  // namespace relay::net
