// Scripted stdio tool server used by the process and adapter integration
// tests. Behaviour is chosen with command-line flags:
//
//   --tool NAME              advertise only the named tools (repeatable)
//   --reject-initialize N    answer the first N initialize requests with an error
//   --hang-initialize        never answer initialize
//   --empty-list             answer every tools/list with no tools
//   --framing content-length write replies with Content-Length headers
//   --noise                  print banner lines on stdout and stderr first
//   --ping                   after initialization, send the client a ping and
//                            an unsupported request
//   --linger                 ignore SIGTERM and keep running after stdin closes
//
// Tools: echo, pair, structured, slow, fail, crash, env, stats.

#include <mcp_adapter/wire/wire_codec.hpp>

#include <nlohmann/json.hpp>

#include <cerrno>
#include <csignal>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <set>
#include <string>
#include <thread>

#include <unistd.h>

using mcp_adapter::FrameDecoder;
using mcp_adapter::MakeErrorReply;
using mcp_adapter::MakeResult;

namespace {

struct Options {
    std::set<std::string> tools;
    int reject_initialize = 0;
    bool hang_initialize = false;
    bool empty_list = false;
    bool content_length = false;
    bool noise = false;
    bool ping = false;
    bool linger = false;
};

struct Stats {
    int initialize_attempts = 0;
    int initialized_notifications = 0;
    bool pong_received = false;
    int unsupported_request_code = 0;
};

const char* const kAllTools[] = {
    "echo", "pair", "structured", "slow", "fail", "crash", "env", "stats",
};

class FakeServer {
public:
    explicit FakeServer(Options options) : options_(std::move(options)) {}

    void Run() {
        if (options_.noise) {
            std::cout << "fake server starting up" << std::endl;
            std::cerr << "fake server diagnostics on stderr" << std::endl;
        }

        FrameDecoder decoder;
        char buf[4096];
        for (;;) {
            ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
            if (n == 0) break;
            if (n < 0) {
                if (errno == EINTR) continue;
                break;
            }
            for (const auto& message : decoder.Feed(std::string_view(buf, n))) {
                HandleMessage(message);
            }
        }
        while (options_.linger) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }

private:
    void Write(const nlohmann::json& message) {
        std::cout << (options_.content_length ? mcp_adapter::EncodeFramed(message)
                                              : mcp_adapter::EncodeLine(message));
        std::cout.flush();
    }

    void HandleMessage(const nlohmann::json& message) {
        auto method = message.value("method", "");

        // Replies to our own requests.
        if (method.empty()) {
            auto id = message.value("id", nlohmann::json());
            if (id == "srv-ping" && message.contains("result")) {
                stats_.pong_received = true;
            } else if (id == "srv-unsupported" && message.contains("error")) {
                stats_.unsupported_request_code = message["error"].value("code", 0);
            }
            return;
        }

        if (!message.contains("id")) {
            if (method == "notifications/initialized") {
                ++stats_.initialized_notifications;
                if (options_.ping) {
                    Write({{"jsonrpc", "2.0"}, {"id", "srv-ping"}, {"method", "ping"}});
                    Write({{"jsonrpc", "2.0"}, {"id", "srv-unsupported"},
                           {"method", "sampling/createMessage"}, {"params", {}}});
                }
            }
            return;
        }

        const auto& id = message["id"];
        auto params = message.value("params", nlohmann::json::object());
        if (method == "initialize") {
            HandleInitialize(params, id);
        } else if (method == "tools/list") {
            HandleToolsList(params, id);
        } else if (method == "tools/call") {
            HandleToolsCall(params, id);
        } else {
            Write(MakeErrorReply(id, -32601, "Method not found: " + method));
        }
    }

    void HandleInitialize(const nlohmann::json& params, const nlohmann::json& id) {
        ++stats_.initialize_attempts;
        if (options_.hang_initialize) {
            return;
        }
        if (stats_.initialize_attempts <= options_.reject_initialize) {
            Write(MakeErrorReply(id, -32602, "Unsupported protocol version"));
            return;
        }
        Write(MakeResult(id, {
            {"protocolVersion", params.value("protocolVersion", "2024-11-05")},
            {"capabilities", {{"tools", nlohmann::json::object()}}},
            {"serverInfo", {{"name", "fake-mcp-server"}, {"version", "1.0"}}},
        }));
    }

    void HandleToolsList(const nlohmann::json& /*params*/, const nlohmann::json& id) {
        auto tools = nlohmann::json::array();
        if (!options_.empty_list) {
            for (const char* name : kAllTools) {
                if (!options_.tools.empty() && options_.tools.count(name) == 0) continue;
                tools.push_back({
                    {"name", name},
                    {"description", std::string("Fake ") + name + " tool"},
                    {"inputSchema", {
                        {"type", "object"},
                        {"properties", {{"message", {{"type", "string"}}}}},
                    }},
                });
            }
        }
        Write(MakeResult(id, {{"tools", tools}}));
    }

    void HandleToolsCall(const nlohmann::json& params, const nlohmann::json& id) {
        auto name = params.value("name", "");
        auto arguments = params.value("arguments", nlohmann::json::object());

        if (name == "echo") {
            Write(MakeResult(id, {{"content", {
                {{"type", "text"}, {"text", arguments.value("message", "")}},
            }}}));
        } else if (name == "pair") {
            Write(MakeResult(id, {{"content", {
                {{"type", "text"}, {"text", "first"}},
                {{"type", "text"}, {"text", "second"}},
            }}}));
        } else if (name == "structured") {
            int a = arguments.value("a", 0);
            int b = arguments.value("b", 0);
            Write(MakeResult(id, {
                {"content", {{{"type", "text"}, {"text", std::to_string(a + b)}}}},
                {"structuredContent", {{"result", {{"sum", a + b}}}}},
            }));
        } else if (name == "slow") {
            std::this_thread::sleep_for(std::chrono::milliseconds(arguments.value("ms", 1000)));
            Write(MakeResult(id, {{"content", {{{"type", "text"}, {"text", "done"}}}}}));
        } else if (name == "fail") {
            Write(MakeResult(id, {
                {"content", {{{"type", "text"}, {"text", "the tool failed"}}}},
                {"isError", true},
            }));
        } else if (name == "crash") {
            std::exit(3);
        } else if (name == "env") {
            auto key = arguments.value("name", "");
            const char* value = std::getenv(key.c_str());
            Write(MakeResult(id, {
                {"structuredContent", {{"value", value ? nlohmann::json(value) : nlohmann::json()}}},
            }));
        } else if (name == "stats") {
            Write(MakeResult(id, {{"structuredContent", {
                {"initialize_attempts", stats_.initialize_attempts},
                {"initialized_notifications", stats_.initialized_notifications},
                {"pong_received", stats_.pong_received},
                {"unsupported_request_code", stats_.unsupported_request_code},
            }}}));
        } else {
            Write(MakeErrorReply(id, -32602, "Unknown tool: " + name));
        }
    }

    Options options_;
    Stats stats_;
};

} // anonymous namespace

int main(int argc, char* argv[]) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--tool" && i + 1 < argc) {
            options.tools.insert(argv[++i]);
        } else if (arg == "--reject-initialize" && i + 1 < argc) {
            options.reject_initialize = std::atoi(argv[++i]);
        } else if (arg == "--hang-initialize") {
            options.hang_initialize = true;
        } else if (arg == "--empty-list") {
            options.empty_list = true;
        } else if (arg == "--framing" && i + 1 < argc) {
            options.content_length = std::string(argv[++i]) == "content-length";
        } else if (arg == "--noise") {
            options.noise = true;
        } else if (arg == "--ping") {
            options.ping = true;
        } else if (arg == "--linger") {
            options.linger = true;
            std::signal(SIGTERM, SIG_IGN);
        } else {
            std::cerr << "unknown flag: " << arg << std::endl;
            return 2;
        }
    }

    FakeServer server(std::move(options));
    server.Run();
    return 0;
}
