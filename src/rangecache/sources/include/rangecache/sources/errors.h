#ifndef RANGECACHE_SRC_SOURCES_INCLUDE_RANGECACHE_SOURCES_ERRORS_H
#define RANGECACHE_SRC_SOURCES_INCLUDE_RANGECACHE_SOURCES_ERRORS_H

#include <stdexcept>

namespace rangecache {

// Raised by a source when a read or seek fails.
class SourceError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Raised when a relative seek moves the position outside [0, 2^64).
class SeekOverflowError : public std::overflow_error {
public:
  using std::overflow_error::overflow_error;
};

}  // namespace rangecache

#endif  // RANGECACHE_SRC_SOURCES_INCLUDE_RANGECACHE_SOURCES_ERRORS_H
