// Repository: Seedling
// Component: Text helpers
// Purpose: Transcript clean-up and UTF-8 measurement.
// Copyright (c) 2025 RetroVue

#ifndef SEEDLING_UTIL_TEXT_HPP_
#define SEEDLING_UTIL_TEXT_HPP_

#include <cstddef>
#include <string>
#include <string_view>

namespace seedling::util {

// Removes any run of trailing punctuation, ASCII or full-width:
//   . , ! ? ; :  。 ， ！ ？ ； ： 、 … ~ ～
// Leading and interior characters are untouched.
std::string StripTrailingPunctuation(std::string_view text);

// Number of Unicode code points in a UTF-8 string. Continuation bytes are not
// counted, so malformed input still yields a bounded count.
size_t Utf8CodePointCount(std::string_view text);

}  // namespace seedling::util

#endif  // SEEDLING_UTIL_TEXT_HPP_
