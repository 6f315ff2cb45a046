/// Echo server: minimal MCP server exposing a single `echo` tool.
/// Usage: ./echo_server
/// Communicates over stdio (newline-delimited JSON-RPC). Stops on EOF,
/// SIGINT or SIGTERM.

#include <mcplink/mcplink.hpp>
#include <csignal>
#include <pthread.h>
#include <thread>

namespace {

class EchoTools : public mcplink::DefaultToolHandler {
public:
    nlohmann::json list(const std::optional<std::string>&,
                        const mcplink::CancellationToken&) override {
        return {{"tools", {{
            {"name", "echo"},
            {"description", "Echo the input text back to the caller"},
            {"inputSchema", {
                {"type", "object"},
                {"properties", {{"text", {{"type", "string"}, {"description", "The text to echo"}}}}},
                {"required", {"text"}}
            }}
        }}}};
    }

    nlohmann::json call(const std::string& name, const nlohmann::json& arguments,
                        const mcplink::CancellationToken&) override {
        if (name != "echo") {
            throw mcplink::RpcProtocolError(mcplink::error::InvalidParams, "Unknown tool: " + name);
        }
        if (!arguments.contains("text") || !arguments.at("text").is_string()) {
            throw mcplink::RpcProtocolError(mcplink::error::InvalidParams, "echo requires a string 'text'");
        }
        return {{"content", {{{"type", "text"}, {"text", arguments.at("text")}}}}};
    }
};

} // namespace

int main() {
    std::signal(SIGPIPE, SIG_IGN);

    // Route SIGINT/SIGTERM to a dedicated thread; every other thread
    // inherits the blocked mask.
    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);

    mcplink::CancellationSource shutdown;
    std::thread signal_thread([&stop_signals, shutdown]() mutable {
        int sig = 0;
        if (sigwait(&stop_signals, &sig) == 0) {
            mcplink::log::logger()->info("received signal {}, shutting down", sig);
            shutdown.cancel();
        }
    });

    auto server = mcplink::Server::Builder()
        .with_server_info({"echo-server", std::nullopt, "1.0.0"})
        .with_tool_handler(std::make_shared<EchoTools>())
        .build();

    int status = 0;
    try {
        server.serve_stdio(shutdown.token());
    } catch (const mcplink::TransportError& e) {
        mcplink::log::logger()->error("transport failure: {}", e.what());
        status = 1;
    }

    // Release the signal thread if serve() ended on EOF.
    if (!shutdown.is_cancelled()) {
        pthread_kill(signal_thread.native_handle(), SIGTERM);
    }
    signal_thread.join();
    return status;
}
