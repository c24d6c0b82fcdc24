#include <catch2/catch.hpp>

#include "patchgrade_harness/content_hash.hpp"

#include <algorithm>
#include <initializer_list>
#include <stdexcept>
#include <string>

using namespace patchgrade::harness;

namespace {

std::string digest_of(std::initializer_list<std::string> fields) {
    ContentHasher h;
    for (const auto& f : fields) h.field(f);
    return h.hex_digest();
}

}  // namespace

TEST_CASE("Digest is 64 lowercase hex characters", "[hash]") {
    const auto d = digest_of({"python:3.11", "pytest"});
    REQUIRE(d.size() == 64);
    REQUIRE(std::all_of(d.begin(), d.end(), [](char c) { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'); }));
}

TEST_CASE("No fields hashes the empty input", "[hash]") {
    REQUIRE(digest_of({}) == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE("Fields are length-prefixed", "[hash]") {
    REQUIRE(digest_of({"a"}) == digest_of({"a"}));
    REQUIRE(digest_of({"ab", "c"}) != digest_of({"a", "bc"}));
    REQUIRE(digest_of({"", "x"}) != digest_of({"x"}));
    REQUIRE(digest_of({"x", "y"}) != digest_of({"y", "x"}));
}

TEST_CASE("A finished hasher cannot be reused", "[hash]") {
    ContentHasher h;
    h.field("a");
    (void)h.hex_digest();
    REQUIRE_THROWS_AS(h.hex_digest(), std::logic_error);
    REQUIRE_THROWS_AS(h.field("b"), std::logic_error);
}
