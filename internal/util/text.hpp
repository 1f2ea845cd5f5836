#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace jobmeter::util {

// ASCII whitespace only; provider replies and uploaded text are UTF-8.
std::string Trim(std::string_view text);

// A-Z only; other bytes are kept.
std::string LowerAscii(std::string_view text);

std::vector<std::string> Split(const std::string& text, const std::string& separator);
std::string              Join(const std::vector<std::string>& parts, const std::string& separator);

// Code points of a UTF-8 string. Malformed sequences decode as U+FFFD.
std::u32string DecodeUtf8(std::string_view text);

// First `max_chars` code points of `text`; sets *truncated when cut.
std::string ClipChars(const std::string& text, std::size_t max_chars, bool* truncated);

} // namespace jobmeter::util
