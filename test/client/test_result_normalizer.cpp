#include <catch2/catch_test_macros.hpp>

#include <mcp_adapter/client/result_normalizer.hpp>

using namespace mcp_adapter;
using json = nlohmann::json;

namespace {

json Text(const std::string& text) {
    return {{"type", "text"}, {"text", text}};
}

} // anonymous namespace

TEST_CASE("NormalizeCallResult: structuredContent wins over text", "[client][normalize]") {
    json result = {
        {"content", json::array({Text("12 degrees")})},
        {"structuredContent", {{"temperature", 12}, {"unit", "C"}}},
    };
    CHECK(NormalizeCallResult(result) == json{{"temperature", 12}, {"unit", "C"}});
}

TEST_CASE("NormalizeCallResult: sole result key is unwrapped", "[client][normalize]") {
    json result = {{"structuredContent", {{"result", {{"sum", 5}}}}}};
    CHECK(NormalizeCallResult(result) == json{{"sum", 5}});

    json not_sole = {{"structuredContent", {{"result", 1}, {"extra", 2}}}};
    CHECK(NormalizeCallResult(not_sole) == json{{"result", 1}, {"extra", 2}});
}

TEST_CASE("NormalizeCallResult: empty structuredContent falls through to text", "[client][normalize]") {
    json result = {
        {"content", json::array({Text("hello")})},
        {"structuredContent", json::object()},
    };
    CHECK(NormalizeCallResult(result) == "hello");
}

TEST_CASE("NormalizeCallResult: one text block gives a string", "[client][normalize]") {
    json result = {{"content", json::array({Text("only")})}};
    auto value = NormalizeCallResult(result);
    REQUIRE(value.is_string());
    CHECK(value == "only");
}

TEST_CASE("NormalizeCallResult: several text blocks give a list", "[client][normalize]") {
    json result = {{"content", json::array({Text("a"), Text("b"), Text("c")})}};
    CHECK(NormalizeCallResult(result) == json::array({"a", "b", "c"}));
}

TEST_CASE("NormalizeCallResult: value, markdown and bare string blocks count as text", "[client][normalize]") {
    json result = {{"content", json::array({
        {{"type", "data"}, {"value", "v"}},
        {{"type", "doc"}, {"markdown", "# m"}},
        "bare",
        {{"type", "image"}, {"data", "AAAA"}},
    })}};
    CHECK(NormalizeCallResult(result) == json::array({"v", "# m", "bare"}));
}

TEST_CASE("NormalizeCallResult: nothing usable gives raw", "[client][normalize]") {
    json images = {{"content", json::array({{{"type", "image"}, {"data", "AAAA"}}})}};
    CHECK(NormalizeCallResult(images) == json{{"raw", images}});

    CHECK(NormalizeCallResult(nullptr) == json{{"raw", nullptr}});
    CHECK(NormalizeCallResult(json::object()) == json{{"raw", json::object()}});
}

TEST_CASE("NormalizeCallResult: result without content blocks is returned as-is", "[client][normalize]") {
    json legacy = {{"forecast", "sunny"}};
    CHECK(NormalizeCallResult(legacy) == legacy);

    json wrapped = {{"result", json::array({1, 2})}};
    CHECK(NormalizeCallResult(wrapped) == json::array({1, 2}));
}

TEST_CASE("NormalizeCallResult: never throws on odd shapes", "[client][normalize]") {
    CHECK_NOTHROW(NormalizeCallResult(json::array({1, 2})));
    CHECK_NOTHROW(NormalizeCallResult("text"));
    CHECK_NOTHROW(NormalizeCallResult({{"content", "not a list"}}));
    CHECK_NOTHROW(NormalizeCallResult({{"content", json::array({nullptr, 3})}}));
}

TEST_CASE("ExtractContentText: collects text in order", "[client][normalize]") {
    json result = {{"content", json::array({Text("x"), Text("y")})}, {"isError", true}};
    auto texts = ExtractContentText(result);
    REQUIRE(texts.size() == 2);
    CHECK(texts[0] == "x");
    CHECK(texts[1] == "y");
}
