#include <ulid/base32.hpp>

namespace ulid::base32 {

const char Alphabet[33] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

// Leading zero bits needed to pad 128 bits out to 26 whole symbols.
static constexpr int PadBits = static_cast<int>(EncodedSize * 5 - DecodedSize * 8);

int symbol_value(char c) {
    if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
    for (int i = 0; i < 32; ++i) {
        if (Alphabet[i] == c) return i;
    }
    return -1;
}

std::string encode(const std::array<uint8_t, DecodedSize>& bytes) {
    std::string out;
    out.reserve(EncodedSize);

    // Bit positions count from the MSB of byte 0; negative positions are
    // the implicit zero padding in front of the value.
    int bit = -PadBits;
    for (size_t i = 0; i < EncodedSize; ++i) {
        unsigned group = 0;
        for (int j = 0; j < 5; ++j, ++bit) {
            group <<= 1;
            if (bit >= 0) {
                group |= (bytes[bit / 8] >> (7 - bit % 8)) & 0x1u;
            }
        }
        out += Alphabet[group];
    }
    return out;
}

// Shift a big-endian byte array left by 5 bits and OR in a symbol value.
// Returns the bits shifted out of the most significant byte.
static uint8_t shift_in_symbol(uint8_t* num, size_t len, uint8_t val) {
    uint32_t carry = val;
    for (size_t i = len; i-- > 0; ) {
        uint32_t cur = (static_cast<uint32_t>(num[i]) << 5) | carry;
        num[i] = static_cast<uint8_t>(cur & 0xFF);
        carry = cur >> 8;
    }
    return static_cast<uint8_t>(carry);
}

Result<std::array<uint8_t, DecodedSize>> decode(const std::string& text) {
    using Bytes = std::array<uint8_t, DecodedSize>;

    if (text.size() != EncodedSize) {
        return UlidError(UlidError::Format,
            "identifier text must be 26 characters",
            "Got " + std::to_string(text.size()) + " characters");
    }

    Bytes out{};
    for (size_t i = 0; i < EncodedSize; ++i) {
        int v = symbol_value(text[i]);
        if (v < 0) {
            return UlidError(UlidError::Format,
                "identifier text contains invalid character",
                std::string("Invalid char '") + text[i] + "' at position " + std::to_string(i));
        }
        if (shift_in_symbol(out.data(), out.size(), static_cast<uint8_t>(v)) != 0) {
            return UlidError(UlidError::Format,
                "identifier text exceeds 128 bits",
                "The first character must be in the range 0-7");
        }
    }
    return Result<Bytes>::ok(out);
}

} // namespace ulid::base32
