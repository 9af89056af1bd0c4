#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace rgkb {

// Lowercases ASCII letters and the accented capitals of the Latin-1 block
// (Á, É, Í, Ñ, Ó, Ú, Ü, ...) encoded as two-byte UTF-8. Other bytes pass through.
std::string FoldCase(std::string_view text);

// Longest prefix of at most max_bytes that does not end inside a multibyte sequence.
std::string_view ClipUtf8(std::string_view text, std::size_t max_bytes);

// Replaces every byte that is not part of a well-formed UTF-8 sequence with '?'.
std::string ScrubUtf8(std::string_view text);

// True for bytes that can appear inside a word: ASCII alphanumerics and any
// byte of a multibyte UTF-8 sequence.
bool IsWordByte(unsigned char byte);

}  // namespace rgkb
