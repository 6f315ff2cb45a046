#include <gtest/gtest.h>
#include "mcplink/server.hpp"
#include "mcplink/client.hpp"
#include "mcplink/error.hpp"
#include "mcplink/transport/stdio_transport.hpp"
#include <unistd.h>
#include <atomic>
#include <csignal>
#include <chrono>
#include <future>
#include <thread>

using namespace mcplink;

namespace {

// tools/call blocks until released or until the server shuts down.
class GatedTools : public DefaultToolHandler {
public:
    nlohmann::json call(const std::string&, const nlohmann::json&,
                        const CancellationToken& cancel) override {
        std::promise<void> done;
        auto fut = done.get_future();
        auto registration = cancel.on_cancel([&done] { done.set_value(); });
        if (!cancel.is_cancelled()) {
            (void)fut.wait_for(std::chrono::seconds(10));
        }
        if (cancel.is_cancelled()) {
            saw_shutdown = true;
            throw RpcProtocolError(error::InternalError, "shutting down");
        }
        return {{"content", nlohmann::json::array()}};
    }

    std::atomic<bool> saw_shutdown{false};
};

class SlowTools : public DefaultToolHandler {
public:
    explicit SlowTools(std::chrono::milliseconds delay) : delay_(delay) {}

    nlohmann::json call(const std::string& name, const nlohmann::json&,
                        const CancellationToken&) override {
        std::this_thread::sleep_for(delay_);
        return {{"content", {{{"type", "text"}, {"text", name}}}}};
    }

private:
    std::chrono::milliseconds delay_;
};

class CancellationTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::signal(SIGPIPE, SIG_IGN);
        ASSERT_EQ(pipe(c2s_), 0);
        ASSERT_EQ(pipe(s2c_), 0);
        server_transport_ = std::make_unique<StdioTransport>(c2s_[0], s2c_[1]);
    }

    void TearDown() override {
        shutdown_.cancel();
        if (server_thread_.joinable()) server_thread_.join();
    }

    void start_server(std::shared_ptr<ToolHandler> tools) {
        server_ = std::make_unique<Server>(Server::Builder().with_tool_handler(std::move(tools)).build());
        server_thread_ = std::thread([this] {
            server_->serve(*server_transport_, shutdown_.token());
        });
    }

    std::unique_ptr<Client> connect(std::chrono::milliseconds timeout) {
        Client::Options opts;
        opts.client_info = {"cancel-client", std::nullopt, "1.0"};
        opts.request_timeout = timeout;
        auto client = std::make_unique<Client>(
            std::make_unique<StdioTransport>(s2c_[0], c2s_[1]), opts);
        client->initialize();
        return client;
    }

    int c2s_[2]{-1, -1};
    int s2c_[2]{-1, -1};
    std::unique_ptr<StdioTransport> server_transport_;
    std::unique_ptr<Server> server_;
    CancellationSource shutdown_;
    std::thread server_thread_;
};

} // namespace

TEST_F(CancellationTest, CallerCancelsWhileServerIsBusy) {
    start_server(std::make_shared<SlowTools>(std::chrono::milliseconds(300)));
    auto client = connect(std::chrono::seconds(5));

    CancellationSource cancel;
    std::thread canceller([&cancel] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        cancel.cancel();
    });
    EXPECT_THROW((void)client->call_tool("slow", nlohmann::json::object(), cancel.token()),
                 CancelledError);
    canceller.join();
    EXPECT_EQ(client->pending_count(), 0u);

    // The late result is dropped and the next call is paired correctly.
    auto result = client->call_tool("after");
    EXPECT_EQ(result.at("content")[0].at("text"), "after");
}

TEST_F(CancellationTest, TimeoutThenRecovery) {
    start_server(std::make_shared<SlowTools>(std::chrono::milliseconds(300)));
    auto client = connect(std::chrono::milliseconds(100));

    EXPECT_THROW((void)client->call_tool("slow"), TimeoutError);
    EXPECT_EQ(client->pending_count(), 0u);

    // Wait out the stale response before issuing a call that fits the timeout.
    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    EXPECT_NO_THROW(client->ping());
}

TEST_F(CancellationTest, ShutdownReachesRunningHandler) {
    auto tools = std::make_shared<GatedTools>();
    start_server(tools);
    auto client = connect(std::chrono::seconds(5));

    auto pending = client->send("tools/call", RawJson(R"({"name":"gated"})"));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    shutdown_.cancel();

    // The handler observes the shutdown and its error is still delivered.
    try {
        (void)client->await(pending);
        FAIL() << "expected an error response";
    } catch (const RpcProtocolError& e) {
        EXPECT_EQ(e.code, error::InternalError);
        EXPECT_STREQ(e.what(), "shutting down");
    }
    server_thread_.join();
    EXPECT_TRUE(tools->saw_shutdown);
}

TEST_F(CancellationTest, ServerExitFailsPendingCalls) {
    start_server(std::make_shared<SlowTools>(std::chrono::milliseconds(0)));
    auto client = connect(std::chrono::seconds(5));

    shutdown_.cancel();
    server_thread_.join();
    // Dropping the server's transport closes its end of both pipes.
    server_transport_.reset();

    EXPECT_THROW(client->ping(), TransportError);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (client->state() != SessionState::Closed && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(client->state(), SessionState::Closed);
}
