#include <catch2/catch.hpp>
#include "http/http_api.hpp"
#include "broker/command_dispatcher.hpp"
#include "broker/correlation_table.hpp"
#include "broker/session_registry.hpp"
#include "support/test_support.hpp"
#include <httplib.h>

using namespace devsnap;
using devsnap::test::ScriptedAgent;
using json = nlohmann::json;

namespace {

const char* kGifDataUrl = "data:image/gif;base64,R0lGODlhAQABAAAAACw=";

struct HttpFixture {
    broker::TimerQueue timers;
    broker::SessionRegistry registry;
    broker::CorrelationTable table{timers};
    broker::CommandDispatcher dispatcher{registry, table};
    facade::ChannelEventHandler events{registry, table};
    facade::SnapService service{registry, dispatcher, facade::ServiceDefaults{45'000, 300, 300}};
    http::HttpApi api{service, "/__snap/", 4};

    HttpFixture() {
        if (!api.start("127.0.0.1", 0)) {
            FAIL("HTTP API did not start");
        }
    }

    ~HttpFixture() {
        api.stop();
        table.close();
        timers.stop();
    }

    // Agent that answers dumps with a fixed page and pings with ok
    std::shared_ptr<ScriptedAgent> attach(const std::string& browser, const std::string& page) {
        auto agent = std::make_shared<ScriptedAgent>(events,
            [](ipc::EventType event, const json& command) -> std::optional<json> {
                json reply = {{"reqId", command["reqId"]}, {"ok", true}};
                if (event == ipc::EventType::PING) {
                    reply["payload"] = {{"ready", true}};
                    return reply;
                }
                json payload = json::object();
                for (const auto& type : command["types"]) {
                    if (type == "html") payload["html"] = "<h1>ok</h1>";
                    if (type == "console") payload["console"] = json::array({"a", "b"});
                    if (type == "network") payload["network"] = json::array();
                    if (type == "perf") payload["perf"] = json::array();
                    if (type == "screenshotDom") payload["screenshotDom"] = kGifDataUrl;
                }
                reply["payload"] = payload;
                return reply;
            });
        registry.upsert_on_hello({browser, page}, {"http://localhost:5173/", "Vite", "UA"}, agent);
        return agent;
    }
};

} // namespace

TEST_CASE("Status codes follow the failure kind", "[http]") {
    REQUIRE(http::status_for(facade::ErrorKind::BAD_REQUEST) == 400);
    REQUIRE(http::status_for(facade::ErrorKind::UNKNOWN_SESSION) == 404);
    REQUIRE(http::status_for(facade::ErrorKind::TIMEOUT) == 504);
    REQUIRE(http::status_for(facade::ErrorKind::AGENT_FAILURE) == 502);
    REQUIRE(http::status_for(facade::ErrorKind::CHANNEL_CLOSED) == 502);
    REQUIRE(http::status_for(facade::ErrorKind::SHUTDOWN) == 503);
}

TEST_CASE("GET sessions lists registered pages", "[http]") {
    HttpFixture f;
    f.attach("b1", "p1");
    httplib::Client cli("127.0.0.1", f.api.port());

    auto res = cli.Get("/__snap/sessions");
    REQUIRE(res);
    REQUIRE(res->status == 200);
    auto body = json::parse(res->body);
    REQUIRE(body["sessions"].size() == 1);
    REQUIRE(body["sessions"][0]["sid"] == "b1:p1");
    REQUIRE(body["sessions"][0]["url"] == "http://localhost:5173/");

    res = cli.Get("/__snap/sessions?active=1&activeMs=60000");
    REQUIRE(res);
    REQUIRE(json::parse(res->body)["sessions"].size() == 1);

    res = cli.Get("/__snap/sessions?activeMs=soon");
    REQUIRE(res);
    REQUIRE(res->status == 400);
}

TEST_CASE("POST dump returns the agent's envelope", "[http]") {
    HttpFixture f;
    f.attach("b1", "p1");
    httplib::Client cli("127.0.0.1", f.api.port());

    json request = {{"sid", "b1:p1"}, {"types", json::array({"console"})}, {"waitMs", 2000}};
    auto res = cli.Post("/__snap/dump", request.dump(), "application/json");
    REQUIRE(res);
    REQUIRE(res->status == 200);
    auto body = json::parse(res->body);
    REQUIRE(body["ok"] == true);
    REQUIRE(body["payload"]["console"] == json::array({"a", "b"}));
    REQUIRE_FALSE(body["payload"].contains("html"));
}

TEST_CASE("POST dump rejects malformed requests", "[http]") {
    HttpFixture f;
    f.attach("b1", "p1");
    httplib::Client cli("127.0.0.1", f.api.port());

    auto res = cli.Post("/__snap/dump", "{oops", "application/json");
    REQUIRE(res);
    REQUIRE(res->status == 400);
    REQUIRE(json::parse(res->body)["kind"] == "bad_request");

    res = cli.Post("/__snap/dump", R"({"sid":"b1:p1","types":"html"})", "application/json");
    REQUIRE(res->status == 400);

    res = cli.Post("/__snap/dump", R"({"sid":"b1:p1","types":["cookies"]})", "application/json");
    REQUIRE(res->status == 400);

    res = cli.Post("/__snap/dump", R"({"sid":"b1:p1","waitMs":"long"})", "application/json");
    REQUIRE(res->status == 400);

    res = cli.Post("/__snap/dump", R"({"types":["html"]})", "application/json");
    REQUIRE(res->status == 400);
}

TEST_CASE("POST dump accepts only in-range integer waits", "[http]") {
    HttpFixture f;
    auto agent = f.attach("b1", "p1");
    httplib::Client cli("127.0.0.1", f.api.port());

    for (const char* wait : {"1e300", "1.9", "18446744073709551615", "10000000000000"}) {
        auto res = cli.Post("/__snap/dump",
            std::string(R"({"sid":"b1:p1","types":["console"],"waitMs":)") + wait + "}", "application/json");
        INFO("waitMs " << wait);
        REQUIRE(res);
        REQUIRE(res->status == 400);
        REQUIRE(json::parse(res->body)["kind"] == "bad_request");
    }
    REQUIRE(agent->commands() == 0);

    auto res = cli.Get("/__snap/ping?sid=b1:p1&waitMs=99999999999999999999");
    REQUIRE(res);
    REQUIRE(res->status == 400);

    res = cli.Post("/__snap/dump", R"({"sid":"b1:p1","types":["console"],"waitMs":250})", "application/json");
    REQUIRE(res);
    REQUIRE(res->status == 200);
}

TEST_CASE("Unknown sessions answer 404", "[http]") {
    HttpFixture f;
    httplib::Client cli("127.0.0.1", f.api.port());

    auto res = cli.Get("/__snap/console?sid=ghost:tab");
    REQUIRE(res);
    REQUIRE(res->status == 404);
    auto body = json::parse(res->body);
    REQUIRE(body["kind"] == "unknown_session");
    REQUIRE(body["error"] == "no such session");
}

TEST_CASE("Convenience views shape their content", "[http]") {
    HttpFixture f;
    f.attach("b1", "p1");
    httplib::Client cli("127.0.0.1", f.api.port());

    auto html = cli.Get("/__snap/html?sid=b1:p1");
    REQUIRE(html);
    REQUIRE(html->status == 200);
    REQUIRE(html->get_header_value("Content-Type") == "text/html; charset=utf-8");
    REQUIRE(html->body == "<h1>ok</h1>");

    auto console = cli.Get("/__snap/console?sid=b1:p1");
    REQUIRE(json::parse(console->body) == json::array({"a", "b"}));

    auto network = cli.Get("/__snap/network?sid=b1:p1");
    auto body = json::parse(network->body);
    REQUIRE(body.contains("logs"));
    REQUIRE(body.contains("perf"));

    auto shot = cli.Get("/__snap/screenshot?sid=b1:p1");
    REQUIRE(shot->status == 200);
    REQUIRE(shot->get_header_value("Content-Type") == "image/gif");
    REQUIRE(shot->body.substr(0, 6) == "GIF89a");
}

TEST_CASE("Ping reports round trip time", "[http]") {
    HttpFixture f;
    f.attach("b1", "p1");
    httplib::Client cli("127.0.0.1", f.api.port());

    auto res = cli.Get("/__snap/ping?sid=b1:p1&waitMs=1000");
    REQUIRE(res);
    REQUIRE(res->status == 200);
    auto body = json::parse(res->body);
    REQUIRE(body["ok"] == true);
    REQUIRE(body["rttMs"].is_number());
    REQUIRE(body["payload"]["ready"] == true);

    res = cli.Get("/__snap/ping?sid=b1:p1&waitMs=abc");
    REQUIRE(res->status == 400);
}

TEST_CASE("Silent and failing agents map to gateway errors", "[http]") {
    HttpFixture f;
    auto silent = std::make_shared<ScriptedAgent>(f.events,
        [](ipc::EventType, const json&) -> std::optional<json> { return std::nullopt; });
    auto failing = std::make_shared<ScriptedAgent>(f.events,
        [](ipc::EventType, const json& command) -> std::optional<json> {
            return json{{"reqId", command["reqId"]}, {"ok", false}, {"error", "no canvas"}};
        });
    f.registry.upsert_on_hello({"b1", "silent"}, {}, silent);
    f.registry.upsert_on_hello({"b1", "failing"}, {}, failing);
    httplib::Client cli("127.0.0.1", f.api.port());

    auto timeout = cli.Get("/__snap/ping?sid=b1:silent&waitMs=200");
    REQUIRE(timeout);
    REQUIRE(timeout->status == 504);
    REQUIRE(json::parse(timeout->body)["kind"] == "timeout");

    auto failed = cli.Get("/__snap/screenshot?sid=b1:failing");
    REQUIRE(failed);
    REQUIRE(failed->status == 502);
    REQUIRE(json::parse(failed->body)["error"] == "no canvas");
}
