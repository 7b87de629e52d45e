#pragma once

#include <ulid/result.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

// Crockford Base32 codec for 128-bit values.
//
// The 16 input bytes are read as one big-endian 128-bit integer and cut
// into 26 five-bit groups, most significant first. 26 * 5 = 130, so the
// leading symbol carries only the top 3 bits of byte 0 and is always in
// the range '0'..'7'.
namespace ulid::base32 {

constexpr size_t EncodedSize = 26;
constexpr size_t DecodedSize = 16;

// Excludes I, L, O and U.
extern const char Alphabet[33];

// 0..31 for a symbol of the alphabet (either case), -1 otherwise.
int symbol_value(char c);

// Always returns exactly EncodedSize uppercase symbols.
std::string encode(const std::array<uint8_t, DecodedSize>& bytes);

// Fails with Format if the length is wrong, a symbol is outside the
// alphabet, or the value does not fit in 128 bits.
Result<std::array<uint8_t, DecodedSize>> decode(const std::string& text);

} // namespace ulid::base32
