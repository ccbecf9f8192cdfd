#pragma once

#include <stdexcept>
#include <string>

namespace tmsim {

// Malformed UTF-8 byte sequence
struct EncodingError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Strip leading and trailing ASCII whitespace
std::string Trim(const std::string& s);

// Decode UTF-8 into code points. Throws EncodingError on malformed input,
// overlong forms, surrogates and values above U+10FFFF.
std::u32string DecodeUtf8(const std::string& s);

std::string EncodeUtf8(char32_t cp);
std::string EncodeUtf8(const std::u32string& s);

}  // namespace tmsim
