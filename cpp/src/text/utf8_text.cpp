#include "rgkb/utf8_text.hpp"

#include <cctype>

namespace rgkb {
namespace {

constexpr unsigned char kLatin1Lead = 0xC3;
constexpr unsigned char kLatin1UpperFirst = 0x80;  // À
constexpr unsigned char kLatin1UpperLast = 0x9E;   // Þ
constexpr unsigned char kMultiplicationSign = 0x97;

bool IsContinuation(unsigned char byte) {
  return (byte & 0xC0U) == 0x80U;
}

// Length of the sequence introduced by a lead byte, 0 when the byte cannot start one.
std::size_t SequenceLength(unsigned char lead) {
  if (lead < 0x80U) {
    return 1;
  }
  if (lead >= 0xC2U && lead <= 0xDFU) {
    return 2;
  }
  if (lead >= 0xE0U && lead <= 0xEFU) {
    return 3;
  }
  if (lead >= 0xF0U && lead <= 0xF4U) {
    return 4;
  }
  return 0;
}

bool IsWellFormed(std::string_view text, std::size_t pos, std::size_t length) {
  if (length == 0 || pos + length > text.size()) {
    return false;
  }
  const auto lead = static_cast<unsigned char>(text[pos]);
  for (std::size_t i = 1; i < length; ++i) {
    if (!IsContinuation(static_cast<unsigned char>(text[pos + i]))) {
      return false;
    }
  }
  if (length < 3) {
    return true;
  }
  const auto second = static_cast<unsigned char>(text[pos + 1]);
  // Overlong forms, UTF-16 surrogates and code points past U+10FFFF.
  if (lead == 0xE0U && second < 0xA0U) {
    return false;
  }
  if (lead == 0xEDU && second > 0x9FU) {
    return false;
  }
  if (lead == 0xF0U && second < 0x90U) {
    return false;
  }
  if (lead == 0xF4U && second > 0x8FU) {
    return false;
  }
  return true;
}

}  // namespace

std::string FoldCase(std::string_view text) {
  std::string out(text);
  for (std::size_t i = 0; i < out.size(); ++i) {
    const auto byte = static_cast<unsigned char>(out[i]);
    if (byte < 0x80U) {
      out[i] = static_cast<char>(std::tolower(byte));
      continue;
    }
    if (byte != kLatin1Lead || i + 1 >= out.size()) {
      continue;
    }
    const auto next = static_cast<unsigned char>(out[i + 1]);
    if (!IsContinuation(next)) {
      continue;
    }
    if (next >= kLatin1UpperFirst && next <= kLatin1UpperLast && next != kMultiplicationSign) {
      out[i + 1] = static_cast<char>(next + 0x20U);
    }
    ++i;
  }
  return out;
}

std::string_view ClipUtf8(std::string_view text, std::size_t max_bytes) {
  if (text.size() <= max_bytes) {
    return text;
  }
  std::size_t end = max_bytes;
  while (end > 0 && IsContinuation(static_cast<unsigned char>(text[end]))) {
    --end;
  }
  return text.substr(0, end);
}

std::string ScrubUtf8(std::string_view text) {
  std::string out{};
  out.reserve(text.size());
  std::size_t pos = 0;
  while (pos < text.size()) {
    const auto length = SequenceLength(static_cast<unsigned char>(text[pos]));
    if (IsWellFormed(text, pos, length)) {
      out.append(text.substr(pos, length));
      pos += length;
    } else {
      out.push_back('?');
      ++pos;
    }
  }
  return out;
}

bool IsWordByte(unsigned char byte) {
  return byte >= 0x80U || std::isalnum(byte) != 0;
}

}  // namespace rgkb
