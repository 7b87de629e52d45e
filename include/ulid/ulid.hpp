#pragma once

#include <ulid/result.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace ulid {

// Lexicographically sortable 128-bit identifier.
//
//   bytes 0..5   big-endian 48-bit timestamp (ms since Unix epoch)
//   bytes 6..15  80 bits of randomness, stored as supplied
//
// Byte order, text order and (timestamp, randomness) order all agree.
class Ulid {
public:
    static constexpr int64_t MinTimestamp = 0;
    static constexpr int64_t MaxTimestamp = 0xFFFFFFFFFFFF;
    static constexpr size_t ByteSize = 16;
    static constexpr size_t TimestampSize = 6;
    static constexpr size_t RandomnessSize = 10;
    static constexpr size_t TextSize = 26;

    using Bytes = std::array<uint8_t, ByteSize>;
    using Randomness = std::array<uint8_t, RandomnessSize>;

    // The null value: all 16 bytes zero.
    Ulid() = default;
    explicit Ulid(const Bytes& bytes) : bytes_(bytes) {}

    static Ulid null() { return Ulid(); }

    // Range error if timestamp is outside [MinTimestamp, MaxTimestamp],
    // Length error unless exactly RandomnessSize bytes are given.
    static Result<Ulid> create(int64_t timestamp, const uint8_t* randomness, size_t len);
    static Result<Ulid> create(int64_t timestamp, const std::vector<uint8_t>& randomness);
    static Result<Ulid> create(int64_t timestamp, const Randomness& randomness);

    // Length error unless exactly ByteSize bytes are given.
    static Result<Ulid> from_bytes(const uint8_t* data, size_t len);
    static Result<Ulid> from_bytes(const std::vector<uint8_t>& data);

    // Accepts the canonical text in either case.
    static Result<Ulid> parse(const std::string& s);

    const Bytes& to_bytes() const { return bytes_; }
    std::string to_string() const;

    // Copies the binary form into out; Length error if len < ByteSize.
    Status write(uint8_t* out, size_t len) const;

    int64_t timestamp() const;
    Randomness randomness() const;
    bool is_null() const;

    // -1, 0 or 1 by unsigned byte-wise comparison.
    int compare(const Ulid& other) const;

    // FNV-1a over the 16 bytes.
    size_t hash() const;

    bool operator==(const Ulid& other) const;
    bool operator!=(const Ulid& other) const;
    bool operator<(const Ulid& other) const;
    bool operator<=(const Ulid& other) const;
    bool operator>(const Ulid& other) const;
    bool operator>=(const Ulid& other) const;

private:
    Bytes bytes_{};
};

// Range error unless MinTimestamp <= timestamp <= MaxTimestamp.
Status check_timestamp(int64_t timestamp);

} // namespace ulid

namespace std {
template<>
struct hash<ulid::Ulid> {
    size_t operator()(const ulid::Ulid& u) const { return u.hash(); }
};
} // namespace std
