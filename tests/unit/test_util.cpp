#include <catch2/catch.hpp>
#include "util/data_url.hpp"
#include "util/logger.hpp"
#include "util/request_id.hpp"
#include <regex>
#include <set>

using namespace devsnap::util;

namespace {

std::string as_string(const std::vector<uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

} // namespace

TEST_CASE("base64 decodes padded input", "[util]") {
    REQUIRE(as_string(*base64_decode("aGVsbG8=")) == "hello");
    REQUIRE(as_string(*base64_decode("aGk=")) == "hi");
    REQUIRE(as_string(*base64_decode("aGV5")) == "hey");
    REQUIRE(base64_decode("")->empty());
}

TEST_CASE("base64 rejects malformed input", "[util]") {
    REQUIRE_FALSE(base64_decode("aGVsbG8"));
    REQUIRE_FALSE(base64_decode("aGV*"));
}

TEST_CASE("Data URLs split into MIME type and bytes", "[util]") {
    auto decoded = decode_data_url("data:image/jpeg;base64,aGVsbG8=");
    REQUIRE(decoded);
    REQUIRE(decoded->mime_type == "image/jpeg");
    REQUIRE(as_string(decoded->bytes) == "hello");

    REQUIRE(decode_data_url("DATA:image/png;base64,aGk=")->mime_type == "image/png");
}

TEST_CASE("Data URLs without a base64 body are refused", "[util]") {
    REQUIRE_FALSE(decode_data_url(""));
    REQUIRE_FALSE(decode_data_url("http://example.com/a.png"));
    REQUIRE_FALSE(decode_data_url("data:image/png,rawtext"));
    REQUIRE_FALSE(decode_data_url("data:;base64,aGk="));
    REQUIRE_FALSE(decode_data_url("data:image/png;base64,%%%"));
}

TEST_CASE("Request ids are version 4 UUIDs", "[util]") {
    static const std::regex uuid("[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}");

    std::set<std::string> seen;
    for (int i = 0; i < 1000; i++) {
        auto id = generate_request_id();
        REQUIRE(std::regex_match(id, uuid));
        seen.insert(id);
    }
    REQUIRE(seen.size() == 1000);
}

TEST_CASE("Log levels parse by name", "[util]") {
    REQUIRE(parse_log_level("debug") == spdlog::level::debug);
    REQUIRE(parse_log_level("warn") == spdlog::level::warn);
    REQUIRE(parse_log_level("off") == spdlog::level::off);
    REQUIRE(parse_log_level("chatty") == spdlog::level::info);
}
