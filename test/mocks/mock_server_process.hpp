#pragma once

#include <mcp_adapter/process/i_server_process.hpp>
#include <mcp_adapter/runtime/event_loop_bridge.hpp>

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_adapter {
namespace testing {

// ---------------------------------------------------------------------------
// MockServerProcess: scripted stand-in for a tool server subprocess.
//
// Usage:
//   auto process = std::make_unique<MockServerProcess>("srv", bridge,
//       [](const nlohmann::json& sent) -> std::vector<nlohmann::json> {
//           return {MakeResult(sent["id"], {{"serverInfo", {}}})};
//       });
//   ProtocolClient client(runtime, std::move(process), bridge, options);
//
// Every message sent to the process is recorded and handed to the
// responder; the messages it returns are delivered back through the event
// loop, in order, as if read from the server's stdout.
// ---------------------------------------------------------------------------
class MockServerProcess : public IServerProcess {
public:
    using Responder = std::function<std::vector<nlohmann::json>(const nlohmann::json& sent)>;

    MockServerProcess(std::string name, EventLoopBridge& bridge, Responder responder = {})
        : name_(std::move(name)), bridge_(bridge), responder_(std::move(responder)) {}

    const std::string& Name() const override { return name_; }

    void Start(MessageHandler on_message, ClosedHandler on_closed) override {
        on_message_ = std::move(on_message);
        on_closed_ = std::move(on_closed);
    }

    Result<void, Error> Send(const nlohmann::json& message) override {
        if (terminated_ || closed_) {
            return Result<void, Error>::Err(Error::Make(
                ErrorCategory::ServerNotReady, "MockServerProcess::Send", name_,
                "mock process is not running"));
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sent_.push_back(message);
        }
        if (responder_) {
            for (auto& reply : responder_(message)) {
                Deliver(std::move(reply));
            }
        }
        return Result<void, Error>::Ok();
    }

    void Terminate() override {
        terminated_ = true;
        ++terminate_count_;
    }

    bool IsRunning() const override { return !terminated_ && !closed_; }
    int Pid() const override { return 4242; }

    // -- Scripting (any thread) ---------------------------------------------

    // Deliver a message as if the server had written it.
    void Deliver(nlohmann::json message) {
        bridge_.Post([this, message = std::move(message)]() {
            if (on_message_ && !terminated_) on_message_(message);
        });
    }

    // Behave as if the server's stdout reached EOF.
    void SimulateExit() {
        bridge_.Post([this]() {
            closed_ = true;
            if (on_closed_) on_closed_();
        });
    }

    // -- Inspection (any thread) --------------------------------------------

    std::vector<nlohmann::json> Sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    std::vector<nlohmann::json> SentWithMethod(const std::string& method) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<nlohmann::json> out;
        for (const auto& m : sent_) {
            if (m.value("method", "") == method) out.push_back(m);
        }
        return out;
    }

    int TerminateCount() const { return terminate_count_; }

private:
    std::string name_;
    EventLoopBridge& bridge_;
    Responder responder_;
    MessageHandler on_message_;
    ClosedHandler on_closed_;

    mutable std::mutex mutex_;
    std::vector<nlohmann::json> sent_;
    std::atomic<bool> terminated_{false};
    std::atomic<bool> closed_{false};
    std::atomic<int> terminate_count_{0};
};

} // namespace testing
} // namespace mcp_adapter
