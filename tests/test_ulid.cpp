#include <catch2/catch.hpp>
#include <ulid/ulid.hpp>
#include <set>
#include <unordered_set>
#include <vector>

using namespace ulid;

static Ulid make(int64_t ts, std::vector<uint8_t> randomness) {
    auto r = Ulid::create(ts, randomness);
    REQUIRE(r.is_ok());
    return r.value();
}

// ===== Construction =====

TEST_CASE("Ulid default is the null value", "[ulid]") {
    Ulid u;
    REQUIRE(u.is_null());
    REQUIRE(u == Ulid::null());
    REQUIRE(u.timestamp() == 0);
    REQUIRE(u.to_string() == "00000000000000000000000000");
}

TEST_CASE("Ulid parse of all zeros yields null", "[ulid]") {
    auto r = Ulid::parse(std::string(26, '0'));
    REQUIRE(r.is_ok());
    REQUIRE(r.value().is_null());
}

TEST_CASE("Ulid create packs timestamp big-endian", "[ulid]") {
    auto u = make(1609459200000, {0, 0, 0, 0, 0, 0, 0, 0, 0, 0x0A});
    const auto& b = u.to_bytes();
    REQUIRE(b[0] == 0x01);
    REQUIRE(b[1] == 0x76);
    REQUIRE(b[2] == 0xBB);
    REQUIRE(b[3] == 0x3E);
    REQUIRE(b[4] == 0x70);
    REQUIRE(b[5] == 0x00);
    REQUIRE(b[15] == 0x0A);
    REQUIRE(u.timestamp() == 1609459200000);
    REQUIRE(u.to_string() == "01ETXKWW00000000000000000A");
    REQUIRE(u.to_string().substr(0, 10) == "01ETXKWW00");
}

TEST_CASE("Ulid create keeps randomness byte order", "[ulid]") {
    std::vector<uint8_t> rnd = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10};
    auto u = make(42, rnd);
    auto r = u.randomness();
    REQUIRE(std::vector<uint8_t>(r.begin(), r.end()) == rnd);
    REQUIRE(u.to_bytes()[6] == 1);
    REQUIRE(u.to_bytes()[15] == 10);
}

TEST_CASE("Ulid create accepts timestamp bounds", "[ulid]") {
    Ulid::Randomness rnd{};
    REQUIRE(Ulid::create(Ulid::MinTimestamp, rnd).is_ok());
    auto max = Ulid::create(Ulid::MaxTimestamp, rnd);
    REQUIRE(max.is_ok());
    REQUIRE(max.value().timestamp() == Ulid::MaxTimestamp);
    REQUIRE(max.value().to_string() == "7ZZZZZZZZZ0000000000000000");
}

TEST_CASE("Ulid create rejects out-of-range timestamp", "[ulid]") {
    Ulid::Randomness rnd{};
    auto high = Ulid::create(Ulid::MaxTimestamp + 1, rnd);
    REQUIRE(high.is_err());
    REQUIRE(high.error().code == UlidError::Range);

    auto neg = Ulid::create(-1, rnd);
    REQUIRE(neg.is_err());
    REQUIRE(neg.error().code == UlidError::Range);
}

TEST_CASE("Ulid create rejects wrong randomness length", "[ulid]") {
    for (size_t len : {0u, 9u, 11u, 16u}) {
        std::vector<uint8_t> rnd(len, 0xAB);
        auto r = Ulid::create(1000, rnd);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == UlidError::Length);
    }
}

TEST_CASE("Ulid from_bytes requires 16 bytes", "[ulid]") {
    std::vector<uint8_t> ok(16, 0x5A);
    auto r = Ulid::from_bytes(ok);
    REQUIRE(r.is_ok());
    REQUIRE(std::vector<uint8_t>(r.value().to_bytes().begin(), r.value().to_bytes().end()) == ok);

    for (size_t len : {0u, 15u, 17u}) {
        auto bad = Ulid::from_bytes(std::vector<uint8_t>(len, 0));
        REQUIRE(bad.is_err());
        REQUIRE(bad.error().code == UlidError::Length);
    }
}

TEST_CASE("Ulid from_bytes accepts any bit pattern", "[ulid]") {
    std::vector<uint8_t> ones(16, 0xFF);
    auto r = Ulid::from_bytes(ones);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().to_string() == "7ZZZZZZZZZZZZZZZZZZZZZZZZZ");
    REQUIRE(r.value().timestamp() == Ulid::MaxTimestamp);
}

// ===== Text form =====

TEST_CASE("Ulid parse known identifier", "[ulid]") {
    auto r = Ulid::parse("01ARZ3NDEKTSV4RRFFQ69G5FAV");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().timestamp() == 1469922850259);
    REQUIRE(r.value().to_string() == "01ARZ3NDEKTSV4RRFFQ69G5FAV");
}

TEST_CASE("Ulid parse normalizes lowercase to canonical text", "[ulid]") {
    auto r = Ulid::parse("01arz3ndektsv4rrffq69g5fav");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().to_string() == "01ARZ3NDEKTSV4RRFFQ69G5FAV");
}

TEST_CASE("Ulid parse rejects malformed text", "[ulid]") {
    for (const char* s : {"", "01ARZ3NDEKTSV4RRFFQ69G5FA", "01ARZ3NDEKTSV4RRFFQ69G5FAVV",
                          "01ARZ3NDEKTSV4RRFFQ69G5FAI", "01ARZ3NDEKTSV4RRFFQ69G5FAL",
                          "01ARZ3NDEKTSV4RRFFQ69G5FAO", "01ARZ3NDEKTSV4RRFFQ69G5FAU",
                          "81ARZ3NDEKTSV4RRFFQ69G5FAV"}) {
        auto r = Ulid::parse(s);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == UlidError::Format);
    }
}

TEST_CASE("Ulid text and binary forms round-trip", "[ulid]") {
    std::vector<Ulid> samples = {
        Ulid::null(),
        make(Ulid::MaxTimestamp, std::vector<uint8_t>(10, 0xFF)),
        make(1, {0x80, 0, 0, 0, 0, 0, 0, 0, 0, 1}),
        make(1609459200000, {0xDE, 0xAD, 0xBE, 0xEF, 0x01, 0x23, 0x45, 0x67, 0x89, 0xAB}),
    };
    for (const auto& u : samples) {
        auto text = u.to_string();
        REQUIRE(text.size() == Ulid::TextSize);
        auto parsed = Ulid::parse(text);
        REQUIRE(parsed.is_ok());
        REQUIRE(parsed.value() == u);

        auto bin = Ulid::from_bytes(u.to_bytes().data(), u.to_bytes().size());
        REQUIRE(bin.is_ok());
        REQUIRE(bin.value() == u);
    }
}

// ===== write =====

TEST_CASE("Ulid write copies into a large enough buffer", "[ulid]") {
    auto u = make(7, {1, 2, 3, 4, 5, 6, 7, 8, 9, 10});
    uint8_t buf[20] = {};
    REQUIRE(u.write(buf, sizeof(buf)).is_ok());
    for (size_t i = 0; i < Ulid::ByteSize; ++i) {
        REQUIRE(buf[i] == u.to_bytes()[i]);
    }
    REQUIRE(buf[16] == 0);
}

TEST_CASE("Ulid write rejects a short buffer", "[ulid]") {
    uint8_t buf[15] = {};
    auto s = Ulid::null().write(buf, sizeof(buf));
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == UlidError::Length);
}

// ===== Ordering =====

TEST_CASE("Ulid earlier timestamp sorts first regardless of randomness", "[ulid]") {
    auto a = make(1000, std::vector<uint8_t>(10, 0xFF));
    auto b = make(1001, std::vector<uint8_t>(10, 0x00));
    REQUIRE(a.compare(b) == -1);
    REQUIRE(b.compare(a) == 1);
    REQUIRE(a < b);
    REQUIRE(a <= b);
    REQUIRE(b > a);
    REQUIRE(b >= a);
    REQUIRE(a.to_string() < b.to_string());
}

TEST_CASE("Ulid equal timestamps order by randomness bytes", "[ulid]") {
    auto a = make(5000, {0, 0, 0, 0, 0, 0, 0, 0, 1, 0xFF});
    auto b = make(5000, {0, 0, 0, 0, 0, 0, 0, 0, 2, 0x00});
    REQUIRE(a.compare(b) < 0);
    REQUIRE(a.to_string() < b.to_string());
    REQUIRE(a.compare(a) == 0);
}

TEST_CASE("Ulid text order matches byte order", "[ulid]") {
    std::vector<Ulid> ids = {
        make(3, std::vector<uint8_t>(10, 0x00)),
        make(1, std::vector<uint8_t>(10, 0x7F)),
        make(2, std::vector<uint8_t>(10, 0x10)),
        make(2, std::vector<uint8_t>(10, 0x0F)),
        Ulid::null(),
    };
    std::set<Ulid> by_value(ids.begin(), ids.end());
    std::set<std::string> by_text;
    for (const auto& u : ids) by_text.insert(u.to_string());

    auto t = by_text.begin();
    for (const auto& u : by_value) {
        REQUIRE(u.to_string() == *t++);
    }
}

TEST_CASE("Ulid equality operators", "[ulid]") {
    auto a = make(99, std::vector<uint8_t>(10, 0x11));
    auto b = a; // copy
    REQUIRE(a == b);
    REQUIRE_FALSE(a != b);

    auto c = make(99, std::vector<uint8_t>(10, 0x12));
    REQUIRE(a != c);
    REQUIRE_FALSE(a == c);
}

// ===== Hashing =====

TEST_CASE("Ulid equal values hash equal", "[ulid]") {
    auto a = Ulid::parse("01ARZ3NDEKTSV4RRFFQ69G5FAV").value();
    auto b = Ulid::parse("01arz3ndektsv4rrffq69g5fav").value();
    REQUIRE(a.hash() == b.hash());
    REQUIRE(std::hash<Ulid>{}(a) == a.hash());
}

TEST_CASE("Ulid works as an unordered_set key", "[ulid]") {
    std::unordered_set<Ulid> seen;
    for (uint8_t i = 0; i < 50; ++i) {
        seen.insert(make(i, std::vector<uint8_t>(10, i)));
    }
    seen.insert(make(0, std::vector<uint8_t>(10, 0)));
    REQUIRE(seen.size() == 50);
}
