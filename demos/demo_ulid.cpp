// demo_ulid.cpp
//
// A small standalone program that exercises the identifier codec, the
// generator, configuration and logging.  Run it with:
//
//     ./demo_ulid                      # default config (if present)
//     ./demo_ulid ulid.toml            # explicit config file
//     ULID_CONFIG=ulid.toml ./demo_ulid
//
// Identifiers go to stdout; log output and formatted errors go to stderr.

#include <ulid/config.hpp>
#include <ulid/generator.hpp>
#include <ulid/log.hpp>
#include <ulid/ulid.hpp>

#include <cstdio>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;
using namespace ulid;

// Load the config named on the command line, or the default one if it
// exists. A missing default config is not an error.
static Result<Config> load_config(int argc, char** argv) {
    if (argc >= 2) {
        return Config::load(argv[1]);
    }
    std::string path = default_config_path();
    if (!path.empty() && fs::exists(path)) {
        log::debug("using config %s", path.c_str());
        return Config::load(path);
    }
    return Result<Config>::ok(Config{});
}

static std::string hex(const Ulid::Bytes& bytes) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    for (uint8_t b : bytes) {
        out += digits[b >> 4];
        out += digits[b & 0x0F];
    }
    return out;
}

int main(int argc, char** argv) {
    auto cfg = load_config(argc, argv);
    if (cfg.is_err()) {
        std::fprintf(stderr, "%s\n", cfg.error().format().c_str());
        return 1;
    }
    cfg.value().apply_logging();

    Generator gen;

    // -----------------------------------------------------------------------
    // Happy path: generate, print, round-trip
    // -----------------------------------------------------------------------
    for (int i = 0; i < 5; ++i) {
        auto id = gen.generate();
        if (id.is_err()) {
            std::fprintf(stderr, "%s\n", id.error().format().c_str());
            return 1;
        }
        const Ulid& u = id.value();
        std::string text = u.to_string();
        std::printf("%s  ts=%lld  bytes=%s\n", text.c_str(),
                    static_cast<long long>(u.timestamp()), hex(u.to_bytes()).c_str());

        auto back = Ulid::parse(text);
        if (back.is_err() || back.value() != u) {
            log::error("round-trip mismatch for %s", text.c_str());
            return 1;
        }
    }

    // -----------------------------------------------------------------------
    // Error paths
    // -----------------------------------------------------------------------
    auto bad_text = Ulid::parse("01ARZ3NDEKTSV4RRFFQ69G5FAI");
    if (bad_text.is_err()) {
        std::fprintf(stderr, "%s\n", bad_text.error().format().c_str());
    }

    auto bad_time = gen.generate(Ulid::MaxTimestamp + 1);
    if (bad_time.is_err()) {
        std::fprintf(stderr, "%s\n", bad_time.error().format().c_str());
    }

    return 0;
}
