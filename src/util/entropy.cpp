#include <ulid/entropy.hpp>
#include <ulid/log.hpp>
#include <fstream>
#include <random>
#include <stdexcept>

namespace ulid {

// ---- /dev/urandom with std::random_device fallback ----

static bool read_urandom(uint8_t* buf, size_t len) {
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (!urandom.is_open()) return false;
    urandom.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
    return static_cast<size_t>(urandom.gcount()) == len;
}

Status fill_random_device(uint8_t* buf, size_t len) {
    try {
        std::random_device rd;
        size_t i = 0;
        while (i < len) {
            auto word = rd();
            for (size_t k = 0; k < sizeof(word) && i < len; ++k, ++i) {
                buf[i] = static_cast<uint8_t>(word >> (k * 8));
            }
        }
    } catch (const std::exception& e) {
        return UlidError(UlidError::Entropy,
            std::string("secure random source failed: ") + e.what());
    }
    return ok_status();
}

Status fill_random(uint8_t* buf, size_t len) {
    if (len == 0 || read_urandom(buf, len)) return ok_status();

    log::debug("/dev/urandom unavailable, using std::random_device");
    return fill_random_device(buf, len);
}

} // namespace ulid
