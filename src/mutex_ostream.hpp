#pragma once

#include <iostream>
#include <mutex>

namespace objxfer {

// A thread-safe output stream that can be used to write to any std::ostream
// from multiple threads without interleaving the output.
// A default constructed stream has no buffer and discards everything.

class mutex_ostream : public std::ostream {
  std::unique_lock<std::mutex> _lock;

 public:
  mutex_ostream() : std::ostream(nullptr) {}

  // Construct a mutex_ostream from an existing std::ostream and a mutex
  mutex_ostream(std::ostream& stream, std::mutex& mutex) : std::ostream(stream.rdbuf()), _lock(mutex) {}

  // Move constructor
  mutex_ostream(mutex_ostream&& other) : std::ostream(other.rdbuf()), _lock(std::move(other._lock)) {
    other.rdbuf(nullptr);
  }

  // Terminates the line while still holding the lock
  ~mutex_ostream() override {
    if (rdbuf()) {
      *this << std::endl;
    }
  }
};

}  // namespace objxfer
