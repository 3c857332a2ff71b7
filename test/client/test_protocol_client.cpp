#include <catch2/catch_test_macros.hpp>

#include <mcp_adapter/client/negotiation.hpp>
#include <mcp_adapter/client/protocol_client.hpp>
#include <mcp_adapter/wire/wire_codec.hpp>

#include "../mocks/mock_server_process.hpp"

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace mcp_adapter;
using namespace std::chrono_literals;
using mcp_adapter::testing::MockServerProcess;
using json = nlohmann::json;

namespace {

using Responder = MockServerProcess::Responder;

ClientOptions FastOptions() {
    ClientOptions options;
    options.request_timeout = 200ms;
    options.call_timeout = 300ms;
    options.negotiation = ResolveNegotiation(std::nullopt, "test-client", "1.0");
    return options;
}

// For tests that keep a call pending while something else happens.
ClientOptions PatientOptions() {
    auto options = FastOptions();
    options.call_timeout = 5000ms;
    return options;
}

json TextResult(const std::string& text) {
    return {{"content", {{{"type", "text"}, {"text", text}}}}};
}

json ToolList(std::initializer_list<const char*> names) {
    auto tools = json::array();
    for (const char* name : names) {
        tools.push_back({{"name", name}, {"description", std::string("Tool ") + name},
                         {"inputSchema", {{"type", "object"}}}});
    }
    return tools;
}

// Accepts initialize, lists `tools`, and answers every tools/call with
// "called <name>".
Responder GoodServer(json tools) {
    return [tools](const json& sent) -> std::vector<json> {
        if (!sent.contains("id")) return {};
        auto method = sent.value("method", "");
        if (method == "initialize") {
            return {MakeResult(sent["id"], {{"serverInfo", {{"name", "mock"}}}})};
        }
        if (method == "tools/list") {
            return {MakeResult(sent["id"], {{"tools", tools}})};
        }
        if (method == "tools/call") {
            return {MakeResult(sent["id"],
                               TextResult("called " + sent["params"]["name"].get<std::string>()))};
        }
        return {};
    };
}

bool WaitFor(const std::function<bool()>& predicate,
             std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return predicate();
}

class ClientHarness {
public:
    explicit ClientHarness(Responder responder, ClientOptions options = FastOptions())
        : runtime(std::make_shared<ServerRuntime>("srv")) {
        REQUIRE(bridge.Start().IsOk());
        auto mock = std::make_unique<MockServerProcess>("srv", bridge, std::move(responder));
        process = mock.get();
        client = std::make_shared<ProtocolClient>(runtime, std::move(mock), bridge,
                                                  std::move(options));
    }

    ~ClientHarness() { bridge.Stop(2000ms); }

    bool StartAndSettle(std::chrono::milliseconds wait = 3000ms) {
        auto c = client;
        bridge.Post([c]() { c->Start(); });
        return runtime->WaitSettledUntil(std::chrono::steady_clock::now() + wait);
    }

    Result<json, Error> Call(const std::string& tool, json arguments = json::object()) {
        auto c = client;
        return bridge.RunSync<json>(
            [c, tool, arguments](EventLoopBridge::Completion<json> done) {
                c->CallTool(tool, arguments, std::move(done));
            },
            3000ms);
    }

    size_t Pending() {
        auto c = client;
        auto count = bridge.RunSync<size_t>(
            [c](EventLoopBridge::Completion<size_t> done) {
                done(Result<size_t, Error>::Ok(c->PendingCount()));
            },
            1000ms);
        REQUIRE(count.IsOk());
        return count.Value();
    }

    EventLoopBridge bridge;
    std::shared_ptr<ServerRuntime> runtime;
    MockServerProcess* process = nullptr;
    std::shared_ptr<ProtocolClient> client;
};

} // anonymous namespace

// ===========================================================================
// Handshake
// ===========================================================================

TEST_CASE("ProtocolClient: handshake sends exactly one initialized notification", "[client][handshake]") {
    ClientHarness h(GoodServer(ToolList({"alpha", "beta"})));
    REQUIRE(h.StartAndSettle());

    CHECK(h.client->State() == ClientState::Ready);
    CHECK(h.runtime->IsReady());
    CHECK(h.runtime->ToolCount() == 2);
    CHECK(h.runtime->ServerInfo()["name"] == "mock");

    auto inits = h.process->SentWithMethod("initialize");
    REQUIRE(inits.size() == 1);
    CHECK_FALSE(inits[0]["params"].contains("protocolVersion"));
    CHECK(inits[0]["params"]["clientInfo"]["name"] == "test-client");

    auto notes = h.process->SentWithMethod("notifications/initialized");
    REQUIRE(notes.size() == 1);
    CHECK_FALSE(notes[0].contains("id"));
}

TEST_CASE("ProtocolClient: rejected initialize variants are retried in order", "[client][handshake]") {
    auto rejected = std::make_shared<int>(0);
    auto good = GoodServer(ToolList({"alpha"}));
    ClientHarness h([rejected, good](const json& sent) -> std::vector<json> {
        if (sent.value("method", "") == "initialize" && *rejected < 2) {
            ++*rejected;
            return {MakeErrorReply(sent["id"], -32602, "unsupported version")};
        }
        return good(sent);
    });
    REQUIRE(h.StartAndSettle());

    auto inits = h.process->SentWithMethod("initialize");
    REQUIRE(inits.size() == 3);
    CHECK(inits[1]["params"]["protocolVersion"] == "2024-11-05");
    CHECK(inits[2]["params"]["protocolVersion"] == "2024-06-01");
    CHECK(h.process->SentWithMethod("notifications/initialized").size() == 1);
    CHECK(h.client->State() == ClientState::Ready);
}

TEST_CASE("ProtocolClient: all initialize variants rejected leaves the server failed", "[client][handshake]") {
    ClientHarness h([](const json& sent) -> std::vector<json> {
        if (!sent.contains("id")) return {};
        return {MakeErrorReply(sent["id"], -32602, "no")};
    });
    REQUIRE(h.StartAndSettle());

    CHECK(h.client->State() == ClientState::Failed);
    CHECK_FALSE(h.runtime->IsReady());
    CHECK(h.runtime->ToolCount() == 0);
    CHECK(h.process->SentWithMethod("initialize").size() == 3);
    CHECK(h.process->SentWithMethod("notifications/initialized").empty());
    CHECK(h.process->SentWithMethod("tools/list").empty());
    CHECK(h.process->TerminateCount() == 0);
}

TEST_CASE("ProtocolClient: silent server times out every initialize variant", "[client][handshake]") {
    ClientHarness h([](const json&) -> std::vector<json> { return {}; });
    REQUIRE(h.StartAndSettle());

    CHECK(h.client->State() == ClientState::Failed);
    CHECK(h.process->SentWithMethod("initialize").size() == 3);
    CHECK(h.Pending() == 0);
}

// ===========================================================================
// Discovery
// ===========================================================================

TEST_CASE("ProtocolClient: tools/list variants are tried until one returns tools", "[client][discovery]") {
    ClientHarness h([](const json& sent) -> std::vector<json> {
        if (!sent.contains("id")) return {};
        auto method = sent.value("method", "");
        if (method == "initialize") return {MakeResult(sent["id"], json::object())};
        if (method == "tools/list") {
            if (sent.contains("params") && sent["params"] == json{{"cursor", 0}}) {
                return {MakeResult(sent["id"], {{"tools", ToolList({"found"})}})};
            }
            return {MakeResult(sent["id"], {{"tools", json::array()}})};
        }
        return {};
    });
    REQUIRE(h.StartAndSettle());

    auto lists = h.process->SentWithMethod("tools/list");
    REQUIRE(lists.size() == 4);
    CHECK_FALSE(lists[0].contains("params"));
    CHECK(lists[1]["params"] == json::object());
    CHECK(lists[2]["params"] == json{{"cursor", nullptr}});
    CHECK(lists[3]["params"] == json{{"cursor", 0}});
    CHECK(h.runtime->ToolCount() == 1);
    CHECK(h.runtime->FindTool("found").has_value());
}

TEST_CASE("ProtocolClient: no tools from any variant leaves a ready server with zero tools", "[client][discovery]") {
    ClientHarness h(GoodServer(json::array()));
    REQUIRE(h.StartAndSettle());

    CHECK(h.client->State() == ClientState::Ready);
    CHECK(h.runtime->IsReady());
    CHECK(h.runtime->ToolCount() == 0);
    CHECK(h.process->SentWithMethod("tools/list").size() == 6);
}

TEST_CASE("ProtocolClient: follows nextCursor across pages", "[client][discovery]") {
    ClientHarness h([](const json& sent) -> std::vector<json> {
        if (!sent.contains("id")) return {};
        auto method = sent.value("method", "");
        if (method == "initialize") return {MakeResult(sent["id"], json::object())};
        if (method == "tools/list") {
            if (sent.contains("params") && sent["params"].value("cursor", json()) == "page-2") {
                return {MakeResult(sent["id"], {{"tools", ToolList({"c"})}})};
            }
            return {MakeResult(sent["id"], {{"tools", ToolList({"a", "b"})},
                                            {"nextCursor", "page-2"}})};
        }
        return {};
    });
    REQUIRE(h.StartAndSettle());

    auto tools = h.runtime->Tools();
    REQUIRE(tools.size() == 3);
    CHECK(tools[0].local_name == "a");
    CHECK(tools[1].local_name == "b");
    CHECK(tools[2].local_name == "c");
    CHECK(h.process->SentWithMethod("tools/list").size() == 2);
}

TEST_CASE("ProtocolClient: legacy schema key and nameless entries", "[client][discovery]") {
    json listing = json::array({
        {{"name", "legacy"}, {"description", "old style"},
         {"schema", {{"type", "object"}, {"properties", {{"q", {{"type", "string"}}}}}}}},
        {{"description", "no name"}},
        {{"name", "bare"}},
        {{"name", "legacy"}, {"description", "duplicate"}},
    });
    ClientHarness h(GoodServer(listing));
    REQUIRE(h.StartAndSettle());

    REQUIRE(h.runtime->ToolCount() == 2);
    auto legacy = h.runtime->FindTool("legacy");
    REQUIRE(legacy.has_value());
    CHECK(legacy->description == "old style");
    CHECK(legacy->input_schema["properties"].contains("q"));
    auto bare = h.runtime->FindTool("bare");
    REQUIRE(bare.has_value());
    CHECK(bare->input_schema == json::object());
}

// ===========================================================================
// Tool calls
// ===========================================================================

TEST_CASE("ProtocolClient: CallTool returns the normalized result", "[client][call]") {
    ClientHarness h(GoodServer(ToolList({"alpha"})));
    REQUIRE(h.StartAndSettle());

    auto result = h.Call("alpha", {{"x", 1}});
    REQUIRE(result.IsOk());
    CHECK(result.Value() == "called alpha");

    auto calls = h.process->SentWithMethod("tools/call");
    REQUIRE(calls.size() == 1);
    CHECK(calls[0]["params"]["name"] == "alpha");
    CHECK(calls[0]["params"]["arguments"] == json{{"x", 1}});

    auto no_args = h.Call("alpha", nullptr);
    REQUIRE(no_args.IsOk());
    CHECK(h.process->SentWithMethod("tools/call")[1]["params"]["arguments"] == json::object());
}

TEST_CASE("ProtocolClient: error reply becomes CallError with the server payload", "[client][call]") {
    auto good = GoodServer(ToolList({"boom"}));
    ClientHarness h([good](const json& sent) -> std::vector<json> {
        if (sent.value("method", "") == "tools/call") {
            return {MakeErrorReply(sent["id"], -32000, "boom exploded")};
        }
        return good(sent);
    });
    REQUIRE(h.StartAndSettle());

    auto result = h.Call("boom");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::CallError);
    CHECK(result.Error().server == "srv");
    CHECK(result.Error().message.find("boom exploded") != std::string::npos);
    REQUIRE(result.Error().remote_error.has_value());
    CHECK((*result.Error().remote_error)["code"] == -32000);
}

TEST_CASE("ProtocolClient: isError result becomes CallError", "[client][call]") {
    auto good = GoodServer(ToolList({"bad"}));
    ClientHarness h([good](const json& sent) -> std::vector<json> {
        if (sent.value("method", "") == "tools/call") {
            auto result = TextResult("bad input");
            result["isError"] = true;
            return {MakeResult(sent["id"], result)};
        }
        return good(sent);
    });
    REQUIRE(h.StartAndSettle());

    auto result = h.Call("bad");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::CallError);
    CHECK(result.Error().message == "bad input");
}

TEST_CASE("ProtocolClient: unanswered call times out and a late reply is ignored", "[client][call]") {
    auto good = GoodServer(ToolList({"fast", "slow"}));
    ClientHarness h([good](const json& sent) -> std::vector<json> {
        if (sent.value("method", "") == "tools/call" && sent["params"]["name"] == "slow") {
            return {};
        }
        return good(sent);
    });
    REQUIRE(h.StartAndSettle());

    auto started = std::chrono::steady_clock::now();
    auto result = h.Call("slow");
    auto elapsed = std::chrono::steady_clock::now() - started;
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::CallTimeout);
    CHECK(elapsed < 2000ms);
    CHECK(h.Pending() == 0);

    auto slow_call = h.process->SentWithMethod("tools/call").back();
    h.process->Deliver(MakeResult(slow_call["id"], TextResult("too late")));

    auto next = h.Call("fast");
    REQUIRE(next.IsOk());
    CHECK(next.Value() == "called fast");
}

TEST_CASE("ProtocolClient: process exit fails pending calls with ServerNotReady", "[client][call]") {
    auto good = GoodServer(ToolList({"hang"}));
    ClientHarness h([good](const json& sent) -> std::vector<json> {
        if (sent.value("method", "") == "tools/call") return {};
        return good(sent);
    }, PatientOptions());
    REQUIRE(h.StartAndSettle());

    auto pending = std::async(std::launch::async, [&h]() { return h.Call("hang"); });
    REQUIRE(WaitFor([&h]() { return h.process->SentWithMethod("tools/call").size() == 1; }));
    h.process->SimulateExit();

    auto result = pending.get();
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::ServerNotReady);
    CHECK(h.client->State() == ClientState::Stopped);
    CHECK(h.runtime->IsStopping());

    auto after = h.Call("hang");
    REQUIRE(after.IsErr());
    CHECK(after.Error().category == ErrorCategory::ServerNotReady);
}

TEST_CASE("ProtocolClient: CallTool before the handshake is refused", "[client][call]") {
    ClientHarness h(GoodServer(ToolList({"alpha"})));

    auto result = h.Call("alpha");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::ServerNotReady);
    CHECK(h.process->SentWithMethod("tools/call").empty());
}

TEST_CASE("ProtocolClient: replies are matched by id, not by arrival order", "[client][call]") {
    auto held = std::make_shared<json>();
    auto good = GoodServer(ToolList({"first", "second"}));
    ClientHarness h([held, good](const json& sent) -> std::vector<json> {
        if (sent.value("method", "") != "tools/call") return good(sent);
        if (held->is_null()) {
            *held = sent;
            return {};
        }
        // Answer the second request before the first.
        return {good(sent)[0], good(*held)[0]};
    }, PatientOptions());
    REQUIRE(h.StartAndSettle());

    auto first = std::async(std::launch::async, [&h]() { return h.Call("first"); });
    REQUIRE(WaitFor([&h]() { return h.process->SentWithMethod("tools/call").size() == 1; }));
    auto second = h.Call("second");

    auto first_result = first.get();
    REQUIRE(first_result.IsOk());
    REQUIRE(second.IsOk());
    CHECK(first_result.Value() == "called first");
    CHECK(second.Value() == "called second");
}

TEST_CASE("ProtocolClient: request ids are unique and increasing", "[client]") {
    ClientHarness h(GoodServer(ToolList({"alpha"})));
    REQUIRE(h.StartAndSettle());
    REQUIRE(h.Call("alpha").IsOk());
    REQUIRE(h.Call("alpha").IsOk());

    int64_t last = 0;
    int requests = 0;
    for (const auto& message : h.process->Sent()) {
        if (!message.contains("id")) continue;
        auto id = message["id"].get<int64_t>();
        CHECK(id > last);
        last = id;
        ++requests;
    }
    CHECK(requests == 4);
}

// ===========================================================================
// Server-initiated traffic
// ===========================================================================

TEST_CASE("ProtocolClient: answers ping and rejects other server requests", "[client]") {
    ClientHarness h(GoodServer(ToolList({"alpha"})));
    REQUIRE(h.StartAndSettle());
    auto before = h.process->Sent().size();

    h.process->Deliver({{"jsonrpc", "2.0"}, {"method", "notifications/progress"}});
    h.process->Deliver({{"jsonrpc", "2.0"}, {"id", "s-1"}, {"method", "ping"}});
    h.process->Deliver({{"jsonrpc", "2.0"}, {"id", 77}, {"method", "roots/list"}});
    REQUIRE(WaitFor([&]() { return h.process->Sent().size() == before + 2; }));

    auto sent = h.process->Sent();
    const auto& pong = sent[before];
    CHECK(pong["id"] == "s-1");
    CHECK(pong["result"] == json::object());
    const auto& refusal = sent[before + 1];
    CHECK(refusal["id"] == 77);
    CHECK(refusal["error"]["code"] == -32601);
}

// ===========================================================================
// Shutdown
// ===========================================================================

TEST_CASE("ProtocolClient: Shutdown fails pending calls and terminates the process", "[client][shutdown]") {
    auto good = GoodServer(ToolList({"hang"}));
    ClientHarness h([good](const json& sent) -> std::vector<json> {
        if (sent.value("method", "") == "tools/call") return {};
        return good(sent);
    }, PatientOptions());
    REQUIRE(h.StartAndSettle());

    auto pending = std::async(std::launch::async, [&h]() { return h.Call("hang"); });
    REQUIRE(WaitFor([&h]() { return h.process->SentWithMethod("tools/call").size() == 1; }));
    auto c = h.client;
    h.bridge.Post([c]() { c->Shutdown(); });

    auto result = pending.get();
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::ServerNotReady);
    REQUIRE(WaitFor([&h]() { return h.client->State() == ClientState::Stopped; }));
    CHECK(h.process->TerminateCount() == 1);
    CHECK(h.runtime->IsStopping());
}

TEST_CASE("ClientStateName: names every state", "[client]") {
    CHECK(std::string(ClientStateName(ClientState::Spawned)) == "spawned");
    CHECK(std::string(ClientStateName(ClientState::ListingTools)) == "listing_tools");
    CHECK(std::string(ClientStateName(ClientState::Failed)) == "failed");
}
