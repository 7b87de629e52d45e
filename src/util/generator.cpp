#include <ulid/generator.hpp>
#include <ulid/entropy.hpp>
#include <ulid/log.hpp>
#include <chrono>

namespace ulid {

int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

Generator::Generator() : Generator(GeneratorOptions{}) {}

Generator::Generator(GeneratorOptions options) : options_(std::move(options)) {
    if (!options_.clock) options_.clock = now_ms;
    if (!options_.entropy) options_.entropy = fill_random;
}

Result<Ulid> Generator::generate() {
    std::lock_guard<std::mutex> lock(mutex_);
    return generate_locked(options_.clock());
}

// Add one to a big-endian integer, carrying from the last byte forward.
// Returns false (and leaves the value untouched) if it is already all ones.
static bool increment(Ulid::Randomness& r) {
    bool all_ones = true;
    for (uint8_t b : r) {
        if (b != 0xFF) { all_ones = false; break; }
    }
    if (all_ones) return false;

    for (size_t i = r.size(); i-- > 0; ) {
        if (++r[i] != 0) break;
    }
    return true;
}

Status Generator::next_randomness(int64_t timestamp) {
    if (has_last_ && timestamp == last_timestamp_) {
        if (!increment(last_randomness_)) {
            log::warn("randomness exhausted for timestamp %lld",
                      static_cast<long long>(timestamp));
            return UlidError(UlidError::Overflow,
                "randomness overflow within millisecond " + std::to_string(timestamp),
                "Too many identifiers requested in one millisecond; retry with a later timestamp");
        }
        log::trace("same millisecond %lld, incremented randomness",
                   static_cast<long long>(timestamp));
        return ok_status();
    }

    Ulid::Randomness fresh{};
    ULID_TRY(options_.entropy(fresh.data(), fresh.size()));
    log::trace("new millisecond %lld, drew fresh randomness",
               static_cast<long long>(timestamp));
    has_last_ = true;
    last_timestamp_ = timestamp;
    last_randomness_ = fresh;
    return ok_status();
}

Result<Ulid> Generator::generate(int64_t timestamp) {
    std::lock_guard<std::mutex> lock(mutex_);
    return generate_locked(timestamp);
}

Result<Ulid> Generator::generate_locked(int64_t timestamp) {
    ULID_TRY(check_timestamp(timestamp));
    ULID_TRY(next_randomness(timestamp));
    return Ulid::create(timestamp, last_randomness_);
}

Generator& default_generator() {
    static Generator instance;
    return instance;
}

Result<Ulid> generate() {
    return default_generator().generate();
}

Result<Ulid> generate(int64_t timestamp) {
    return default_generator().generate(timestamp);
}

} // namespace ulid
