#pragma once
/*
 * ByteSource
 *
 * What the multiplexer needs from a running process: a non-blocking
 * single-byte read and a non-blocking liveness poll. Implemented by
 * ChildProcess and by scripted fakes in the tests.
 */

enum class ProcessStatus { Running, Exited };

struct ReadResult {
  enum class Kind { Byte, None, EndOfStream };

  Kind kind = Kind::None;
  char byte = 0;

  static ReadResult of(char ch) { return ReadResult{Kind::Byte, ch}; }
  static ReadResult none() { return ReadResult{Kind::None, 0}; }
  static ReadResult end_of_stream() { return ReadResult{Kind::EndOfStream, 0}; }
};

class ByteSource {
public:
  virtual ~ByteSource() = default;
  virtual ProcessStatus poll_status() = 0;
  // Never blocks. Read errors are reported as None.
  virtual ReadResult try_read_byte() = 0;
};
