#pragma once

#include <ulid/ulid.hpp>
#include <functional>
#include <mutex>

namespace ulid {

struct GeneratorOptions {
    // Milliseconds since the Unix epoch.
    using Clock = std::function<int64_t()>;
    using EntropySource = std::function<Status(uint8_t*, size_t)>;

    Clock clock;            // empty: system clock
    EntropySource entropy;  // empty: fill_random()
};

// Produces identifiers ordered by timestamp. Within one millisecond each
// call returns the previous randomness plus one, so successive values
// from the same generator are strictly increasing. Thread-safe.
class Generator {
public:
    Generator();
    explicit Generator(GeneratorOptions options);

    Generator(const Generator&) = delete;
    Generator& operator=(const Generator&) = delete;

    // Reads the configured clock while holding the generator lock, so a
    // caller can never commit a timestamp older than one already issued
    // by a concurrent caller.
    Result<Ulid> generate();

    // Range error if timestamp is outside [MinTimestamp, MaxTimestamp].
    // Overflow error if the randomness of this millisecond is exhausted;
    // the state is left as is, so later calls with the same timestamp
    // fail the same way.
    Result<Ulid> generate(int64_t timestamp);

private:
    // Caller holds mutex_.
    Result<Ulid> generate_locked(int64_t timestamp);
    Status next_randomness(int64_t timestamp);

    GeneratorOptions options_;
    std::mutex mutex_;
    bool has_last_ = false;
    int64_t last_timestamp_ = 0;
    Ulid::Randomness last_randomness_{};
};

// Current wall-clock time in milliseconds since the Unix epoch.
int64_t now_ms();

// Process-wide generator shared by the free generate() functions.
Generator& default_generator();

Result<Ulid> generate();
Result<Ulid> generate(int64_t timestamp);

} // namespace ulid
