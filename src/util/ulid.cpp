#include <ulid/ulid.hpp>
#include <ulid/base32.hpp>
#include <algorithm>

namespace ulid {

Status check_timestamp(int64_t timestamp) {
    if (timestamp < Ulid::MinTimestamp || timestamp > Ulid::MaxTimestamp) {
        return UlidError(UlidError::Range,
            "timestamp " + std::to_string(timestamp) + " is out of range",
            "Timestamps must be milliseconds in [0, 281474976710655]");
    }
    return ok_status();
}

// ---- Construction ----

Result<Ulid> Ulid::create(int64_t timestamp, const uint8_t* randomness, size_t len) {
    ULID_TRY(check_timestamp(timestamp));
    if (len != RandomnessSize) {
        return UlidError(UlidError::Length,
            "randomness must be 10 bytes",
            "Got " + std::to_string(len) + " bytes");
    }

    Bytes b{};
    auto ts = static_cast<uint64_t>(timestamp);
    for (size_t i = 0; i < TimestampSize; ++i) {
        b[i] = static_cast<uint8_t>(ts >> ((TimestampSize - 1 - i) * 8));
    }
    std::copy(randomness, randomness + RandomnessSize, b.begin() + TimestampSize);
    return Result<Ulid>::ok(Ulid(b));
}

Result<Ulid> Ulid::create(int64_t timestamp, const std::vector<uint8_t>& randomness) {
    return create(timestamp, randomness.data(), randomness.size());
}

Result<Ulid> Ulid::create(int64_t timestamp, const Randomness& randomness) {
    return create(timestamp, randomness.data(), randomness.size());
}

Result<Ulid> Ulid::from_bytes(const uint8_t* data, size_t len) {
    if (len != ByteSize) {
        return UlidError(UlidError::Length,
            "binary identifier must be 16 bytes",
            "Got " + std::to_string(len) + " bytes");
    }
    Bytes b{};
    std::copy(data, data + ByteSize, b.begin());
    return Result<Ulid>::ok(Ulid(b));
}

Result<Ulid> Ulid::from_bytes(const std::vector<uint8_t>& data) {
    return from_bytes(data.data(), data.size());
}

Result<Ulid> Ulid::parse(const std::string& s) {
    return base32::decode(s).map([](const Bytes& b) { return Ulid(b); });
}

// ---- Conversion ----

std::string Ulid::to_string() const {
    return base32::encode(bytes_);
}

Status Ulid::write(uint8_t* out, size_t len) const {
    if (len < ByteSize) {
        return UlidError(UlidError::Length,
            "output buffer too small for identifier",
            "Need 16 bytes, got " + std::to_string(len));
    }
    std::copy(bytes_.begin(), bytes_.end(), out);
    return ok_status();
}

int64_t Ulid::timestamp() const {
    uint64_t ts = 0;
    for (size_t i = 0; i < TimestampSize; ++i) {
        ts = (ts << 8) | bytes_[i];
    }
    return static_cast<int64_t>(ts);
}

Ulid::Randomness Ulid::randomness() const {
    Randomness r{};
    std::copy(bytes_.begin() + TimestampSize, bytes_.end(), r.begin());
    return r;
}

bool Ulid::is_null() const {
    return std::all_of(bytes_.begin(), bytes_.end(), [](uint8_t b) { return b == 0; });
}

// ---- Ordering and hashing ----

int Ulid::compare(const Ulid& other) const {
    for (size_t i = 0; i < ByteSize; ++i) {
        if (bytes_[i] < other.bytes_[i]) return -1;
        if (bytes_[i] > other.bytes_[i]) return 1;
    }
    return 0;
}

size_t Ulid::hash() const {
    uint64_t h = 0xcbf29ce484222325ULL;
    for (uint8_t b : bytes_) {
        h ^= b;
        h *= 0x100000001b3ULL;
    }
    return static_cast<size_t>(h);
}

bool Ulid::operator==(const Ulid& other) const { return bytes_ == other.bytes_; }
bool Ulid::operator!=(const Ulid& other) const { return !(*this == other); }
bool Ulid::operator<(const Ulid& other) const { return compare(other) < 0; }
bool Ulid::operator<=(const Ulid& other) const { return compare(other) <= 0; }
bool Ulid::operator>(const Ulid& other) const { return compare(other) > 0; }
bool Ulid::operator>=(const Ulid& other) const { return compare(other) >= 0; }

} // namespace ulid
