// Repository: MediaMirror
// Component: Key Decoder Implementation
// Purpose: Decodes raw terminal bytes into scroll keys.
// Copyright (c) 2026 MediaMirror

#include "mediamirror/dashboard/KeyDecoder.hpp"

#include <cctype>

namespace mediamirror::dashboard {

namespace {

constexpr char kEsc = '\x1b';

ScrollKey MapChar(char c) {
  switch (c) {
    case 'k':
      return ScrollKey::kLineUp;
    case 'j':
      return ScrollKey::kLineDown;
    case 'b':
      return ScrollKey::kPageUp;
    case ' ':
      return ScrollKey::kPageDown;
    case 'g':
      return ScrollKey::kTop;
    case 'G':
      return ScrollKey::kBottom;
    default:
      return ScrollKey::kNone;
  }
}

// `body` is everything after ESC: "[A", "OH", "[5~", ...
ScrollKey MapSequence(const std::string& body) {
  const std::string params = body.substr(1, body.size() - 2);
  const char final_byte = body.back();
  switch (final_byte) {
    case 'A':
      return ScrollKey::kLineUp;
    case 'B':
      return ScrollKey::kLineDown;
    case 'H':
      return ScrollKey::kTop;
    case 'F':
      return ScrollKey::kBottom;
    case '~':
      if (params == "5") return ScrollKey::kPageUp;
      if (params == "6") return ScrollKey::kPageDown;
      if (params == "1" || params == "7") return ScrollKey::kTop;
      if (params == "4" || params == "8") return ScrollKey::kBottom;
      return ScrollKey::kNone;
    default:
      return ScrollKey::kNone;
  }
}

}  // namespace

std::vector<ScrollKey> KeyDecoder::Feed(const char* data, size_t size) {
  std::string buf = std::move(pending_);
  pending_.clear();
  buf.append(data, size);

  std::vector<ScrollKey> keys;
  size_t i = 0;
  while (i < buf.size()) {
    if (buf[i] != kEsc) {
      const ScrollKey key = MapChar(buf[i]);
      if (key != ScrollKey::kNone) keys.push_back(key);
      ++i;
      continue;
    }
    if (i + 1 >= buf.size()) {
      pending_ = buf.substr(i);
      break;
    }
    const char intro = buf[i + 1];
    if (intro != '[' && intro != 'O') {
      ++i;  // stray ESC
      continue;
    }
    size_t j = i + 2;
    while (j < buf.size() &&
           (std::isdigit(static_cast<unsigned char>(buf[j])) || buf[j] == ';')) {
      ++j;
    }
    if (j >= buf.size()) {
      pending_ = buf.substr(i);
      break;
    }
    const ScrollKey key = MapSequence(buf.substr(i + 1, j - i));
    if (key != ScrollKey::kNone) keys.push_back(key);
    i = j + 1;
  }
  return keys;
}

}  // namespace mediamirror::dashboard
