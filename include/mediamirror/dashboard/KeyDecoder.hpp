// Repository: MediaMirror
// Component: Key Decoder
// Purpose: Raw terminal bytes to scroll commands.
// Copyright (c) 2026 MediaMirror

#ifndef MEDIAMIRROR_DASHBOARD_KEY_DECODER_HPP_
#define MEDIAMIRROR_DASHBOARD_KEY_DECODER_HPP_

#include <cstddef>
#include <string>
#include <vector>

#include "mediamirror/dashboard/ScrollViewport.hpp"

namespace mediamirror::dashboard {

// KeyDecoder understands:
//   Up / k                 line up
//   Down / j               line down
//   PgUp / b               page up
//   PgDn / space           page down
//   Home / g               top
//   End / G                bottom
//
// Escape sequences split across reads are buffered until complete.
// Unknown sequences are dropped.
class KeyDecoder {
 public:
  std::vector<ScrollKey> Feed(const char* data, size_t size);
  std::vector<ScrollKey> Feed(const std::string& data) { return Feed(data.data(), data.size()); }

 private:
  std::string pending_;
};

}  // namespace mediamirror::dashboard

#endif  // MEDIAMIRROR_DASHBOARD_KEY_DECODER_HPP_
