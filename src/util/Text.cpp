// Repository: Seedling
// Component: Text helpers
// Purpose: Transcript clean-up and UTF-8 measurement.
// Copyright (c) 2025 RetroVue

#include "seedling/util/Text.hpp"

#include <array>

namespace seedling::util {

namespace {

constexpr std::string_view kAsciiPunctuation = ".,!?;:~";

// UTF-8 encodings of the multi-byte marks.
constexpr std::array<std::string_view, 8> kWidePunctuation = {
    "\xE3\x80\x82",  // 。
    "\xEF\xBC\x8C",  // ，
    "\xEF\xBC\x81",  // ！
    "\xEF\xBC\x9F",  // ？
    "\xEF\xBC\x9B",  // ；
    "\xEF\xBC\x9A",  // ：
    "\xE3\x80\x81",  // 、
    "\xE2\x80\xA6",  // …
};
constexpr std::string_view kWideTilde = "\xEF\xBD\x9E";  // ～

bool EndsWith(std::string_view s, std::string_view suffix) {
  return s.size() >= suffix.size() &&
         s.substr(s.size() - suffix.size()) == suffix;
}

}  // namespace

std::string StripTrailingPunctuation(std::string_view text) {
  bool stripped = true;
  while (stripped && !text.empty()) {
    stripped = false;
    if (kAsciiPunctuation.find(text.back()) != std::string_view::npos) {
      text.remove_suffix(1);
      stripped = true;
      continue;
    }
    if (EndsWith(text, kWideTilde)) {
      text.remove_suffix(kWideTilde.size());
      stripped = true;
      continue;
    }
    for (std::string_view mark : kWidePunctuation) {
      if (EndsWith(text, mark)) {
        text.remove_suffix(mark.size());
        stripped = true;
        break;
      }
    }
  }
  return std::string(text);
}

size_t Utf8CodePointCount(std::string_view text) {
  size_t count = 0;
  for (unsigned char c : text) {
    if ((c & 0xC0) != 0x80) ++count;
  }
  return count;
}

}  // namespace seedling::util
