#pragma once

#include <ulid/result.hpp>
#include <cstddef>
#include <cstdint>

namespace ulid {

// Fill buf with len bytes from the operating system CSPRNG.
// Entropy error if no secure source can deliver them.
Status fill_random(uint8_t* buf, size_t len);

// Fallback used by fill_random() when /dev/urandom cannot be read.
// Draws from std::random_device, which libstdc++ and libc++ back with
// getrandom(), rdrand or /dev/urandom on Linux. entropy() is not
// consulted: older libstdc++ reports 0 even for those sources.
// Entropy error if the device cannot be opened or read.
Status fill_random_device(uint8_t* buf, size_t len);

} // namespace ulid
