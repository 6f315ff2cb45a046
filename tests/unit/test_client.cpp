#include <gtest/gtest.h>
#include "mcplink/client.hpp"
#include "mcplink/codec.hpp"
#include "mcplink/error.hpp"
#include "mcplink/transport/stdio_transport.hpp"
#include <unistd.h>
#include <atomic>
#include <csignal>
#include <future>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace mcplink;

namespace {

// The server end of a pipe pair, driven by hand from the test.
class ScriptedPeer {
public:
    explicit ScriptedPeer(std::unique_ptr<StdioTransport> transport)
        : transport_(std::move(transport)) {}

    JsonRpcMessage next() {
        std::string line;
        while (true) {
            auto status = transport_->read_line(line);
            if (status == ReadStatus::Line) return Codec::decode(line);
            if (status == ReadStatus::Eof) throw std::runtime_error("client closed the stream");
        }
    }

    JsonRpcRequest expect_request(const std::string& method) {
        auto msg = next();
        const auto* req = std::get_if<JsonRpcRequest>(&msg);
        if (!req || req->method != method) throw std::runtime_error("expected request " + method);
        return *req;
    }

    JsonRpcNotification expect_notification(const std::string& method) {
        auto msg = next();
        const auto* notif = std::get_if<JsonRpcNotification>(&msg);
        if (!notif || notif->method != method) throw std::runtime_error("expected " + method);
        return *notif;
    }

    JsonRpcResponse expect_response() {
        auto msg = next();
        const auto* resp = std::get_if<JsonRpcResponse>(&msg);
        if (!resp) throw std::runtime_error("expected a response");
        return *resp;
    }

    void send(const JsonRpcMessage& msg) { transport_->write_line(Codec::encode(msg)); }
    void send_raw(const std::string& line) { transport_->write_line(line); }
    void hang_up() { transport_->close_write(); }

private:
    std::unique_ptr<StdioTransport> transport_;
};

class ClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::signal(SIGPIPE, SIG_IGN);
        int c2s[2], s2c[2];
        ASSERT_EQ(pipe(c2s), 0);
        ASSERT_EQ(pipe(s2c), 0);
        client_transport_ = std::make_unique<StdioTransport>(s2c[0], c2s[1]);
        peer_ = std::make_unique<ScriptedPeer>(std::make_unique<StdioTransport>(c2s[0], s2c[1]));
    }

    std::unique_ptr<Client> make_client(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        Client::Options opts;
        opts.client_info = {"unit-client", std::nullopt, "1.0"};
        opts.request_timeout = timeout;
        return std::make_unique<Client>(std::move(client_transport_), opts);
    }

    // Run the handshake with a canned initialize result.
    void handshake(Client& client) {
        std::thread server([this] {
            auto req = peer_->expect_request("initialize");
            peer_->send(make_result(req.id, {{"protocolVersion", "2024-11-05"},
                                             {"serverInfo", {{"name", "peer"}, {"version", "1"}}},
                                             {"capabilities", nlohmann::json::object()}}));
            peer_->expect_notification("notifications/initialized");
        });
        client.initialize();
        server.join();
    }

    std::unique_ptr<StdioTransport> client_transport_;
    std::unique_ptr<ScriptedPeer> peer_;
};

} // namespace

TEST_F(ClientTest, CallsBeforeInitializeFailFast) {
    auto client = make_client();
    EXPECT_THROW(client->ping(), NotInitializedError);
    EXPECT_THROW((void)client->send("tools/list"), NotInitializedError);
    EXPECT_EQ(client->state(), SessionState::Uninitialized);
    EXPECT_EQ(client->pending_count(), 0u);
}

TEST_F(ClientTest, InitializeHandshake) {
    auto client = make_client();
    std::thread server([this] {
        auto req = peer_->expect_request("initialize");
        auto params = req.params->parse();
        EXPECT_EQ(params.at("protocolVersion"), "2024-11-05");
        EXPECT_EQ(params.at("clientInfo").at("name"), "unit-client");
        EXPECT_TRUE(params.at("capabilities").is_object());
        peer_->send(make_result(req.id, {{"protocolVersion", "2024-11-05"},
                                         {"serverInfo", {{"name", "peer"}, {"version", "1"}}}}));
        peer_->expect_notification("notifications/initialized");
    });

    auto result = client->initialize();
    server.join();

    EXPECT_EQ(result.at("serverInfo").at("name"), "peer");
    EXPECT_EQ(client->state(), SessionState::Ready);
    EXPECT_EQ(client->server_info().at("protocolVersion"), "2024-11-05");
    EXPECT_THROW(client->initialize(), RpcError);
}

TEST_F(ClientTest, FailedInitializeCanBeRetried) {
    auto client = make_client();
    std::thread server([this] {
        auto req = peer_->expect_request("initialize");
        peer_->send(make_error(req.id, error::InvalidParams, "unsupported version"));
    });
    try {
        client->initialize();
        FAIL() << "initialize should have failed";
    } catch (const RpcProtocolError& e) {
        EXPECT_EQ(e.code, error::InvalidParams);
        EXPECT_STREQ(e.what(), "unsupported version");
    }
    server.join();
    EXPECT_EQ(client->state(), SessionState::Uninitialized);

    handshake(*client);
    EXPECT_EQ(client->state(), SessionState::Ready);
}

TEST_F(ClientTest, ErrorResponseBecomesProtocolError) {
    auto client = make_client();
    handshake(*client);

    std::thread server([this] {
        auto req = peer_->expect_request("resources/read");
        peer_->send(make_error(req.id, error::ResourceNotFound, "Resource not found",
                               nlohmann::json{{"uri", "file:///nope"}}));
    });
    try {
        (void)client->read_resource("file:///nope");
        FAIL() << "expected RpcProtocolError";
    } catch (const RpcProtocolError& e) {
        EXPECT_EQ(e.code, error::ResourceNotFound);
        ASSERT_TRUE(e.data.has_value());
        EXPECT_EQ(e.data->at("uri"), "file:///nope");
    }
    server.join();
}

TEST_F(ClientTest, TypedMethodsSendExpectedParams) {
    auto client = make_client();
    handshake(*client);

    std::thread server([this] {
        auto call = peer_->expect_request("tools/call");
        auto params = call.params->parse();
        EXPECT_EQ(params.at("name"), "echo");
        EXPECT_EQ(params.at("arguments").at("text"), "hi");
        peer_->send(make_result(call.id, {{"content", nlohmann::json::array()}}));

        auto list = peer_->expect_request("prompts/list");
        EXPECT_EQ(list.params->parse().at("cursor"), "p2");
        peer_->send(make_result(list.id, {{"prompts", nlohmann::json::array()}}));

        auto level = peer_->expect_request("logging/setLevel");
        EXPECT_EQ(level.params->parse().at("level"), "error");
        peer_->send(make_result(level.id, nlohmann::json::object()));
    });

    EXPECT_TRUE(client->call_tool("echo", {{"text", "hi"}}).at("content").is_array());
    EXPECT_TRUE(client->list_prompts(std::string("p2")).at("prompts").is_array());
    client->set_logging_level(LogLevel::Error);
    server.join();
}

TEST_F(ClientTest, ServerRequestAnsweredWithMethodNotFound) {
    auto client = make_client();
    handshake(*client);

    peer_->send_raw(R"({"jsonrpc":"2.0","id":"s-1","method":"sampling/createMessage","params":{}})");
    auto resp = peer_->expect_response();
    EXPECT_EQ(std::get<std::string>(resp.id), "s-1");
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, error::MethodNotFound);
}

TEST_F(ClientTest, NotificationCallbacks) {
    auto client = make_client();
    std::promise<std::string> got;
    client->on_notification("notifications/resources/updated", [&got](const Notification& n) {
        got.set_value(n.params.at("uri").get<std::string>());
    });
    handshake(*client);

    EXPECT_THROW(client->on_notification("notifications/other", [](const Notification&) {}),
                 std::logic_error);

    peer_->send_raw(R"({"jsonrpc":"2.0","method":"notifications/resources/updated","params":{"uri":"file:///a"}})");
    auto fut = got.get_future();
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(fut.get(), "file:///a");
}

TEST_F(ClientTest, MalformedLinesAreSkipped) {
    auto client = make_client();
    handshake(*client);

    std::thread server([this] {
        auto req = peer_->expect_request("ping");
        peer_->send_raw("garbage");
        peer_->send_raw(R"({"jsonrpc":"1.0","id":1,"result":{}})");
        peer_->send(make_result(RequestId{int64_t{424242}}, nlohmann::json::object()));
        peer_->send(make_result(req.id, nlohmann::json::object()));
    });
    EXPECT_NO_THROW(client->ping());
    server.join();
}

TEST_F(ClientTest, CorruptResultBodyIsSkipped) {
    auto client = make_client();
    handshake(*client);

    std::thread server([this] {
        auto req = peer_->expect_request("tools/list");
        auto id = std::get<int64_t>(req.id);
        peer_->send_raw(R"({"jsonrpc":"2.0","id":)" + std::to_string(id) + R"(,"result":{"a":tru}})");
        peer_->send(make_result(req.id, {{"tools", nlohmann::json::array()}}));
    });
    // Only the well-formed response for the id reaches the caller.
    EXPECT_TRUE(client->list_tools().at("tools").is_array());
    server.join();
    EXPECT_EQ(client->pending_count(), 0u);
}

TEST_F(ClientTest, ConcurrentInitializeSendsOneHandshake) {
    auto client = make_client();
    std::atomic<int> handshakes{0};
    std::thread server([this, &handshakes] {
        auto req = peer_->expect_request("initialize");
        ++handshakes;
        peer_->send(make_result(req.id, {{"protocolVersion", "2024-11-05"}}));
        // Anything other than the initialized notification would be a second handshake.
        auto msg = peer_->next();
        if (!std::holds_alternative<JsonRpcNotification>(msg)) ++handshakes;
    });

    std::atomic<int> succeeded{0};
    std::atomic<int> rejected{0};
    auto attempt = [&] {
        try {
            client->initialize();
            ++succeeded;
        } catch (const RpcError&) {
            ++rejected;
        }
    };
    std::thread first(attempt);
    std::thread second(attempt);
    first.join();
    second.join();
    server.join();

    EXPECT_EQ(succeeded.load(), 1);
    EXPECT_EQ(rejected.load(), 1);
    EXPECT_EQ(handshakes.load(), 1);
    EXPECT_EQ(client->state(), SessionState::Ready);
}

TEST_F(ClientTest, TimeoutRemovesPendingEntry) {
    auto client = make_client(std::chrono::milliseconds(100));
    handshake(*client);

    std::thread server([this] { (void)peer_->expect_request("tools/list"); });
    EXPECT_THROW((void)client->list_tools(), TimeoutError);
    server.join();
    EXPECT_EQ(client->pending_count(), 0u);
}

TEST_F(ClientTest, CancellationBeforeResponse) {
    auto client = make_client();
    handshake(*client);

    auto pending = client->send("tools/list");
    auto id = pending.id;
    (void)peer_->expect_request("tools/list");

    CancellationSource cancel;
    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        cancel.cancel();
    });
    EXPECT_THROW(client->await(pending, cancel.token()), CancelledError);
    canceller.join();
    EXPECT_EQ(client->pending_count(), 0u);

    // The late response finds no waiter; the connection keeps working.
    peer_->send(make_result(RequestId{id}, nlohmann::json::object()));
    std::thread server([this] {
        auto req = peer_->expect_request("ping");
        peer_->send(make_result(req.id, nlohmann::json::object()));
    });
    EXPECT_NO_THROW(client->ping());
    server.join();
}

TEST_F(ClientTest, AlreadyCancelledTokenFailsImmediately) {
    auto client = make_client();
    handshake(*client);

    CancellationSource cancel;
    cancel.cancel();
    auto pending = client->send("ping");
    EXPECT_THROW(client->await(pending, cancel.token()), CancelledError);
}

TEST_F(ClientTest, PeerHangUpFailsPendingCalls) {
    auto client = make_client();
    handshake(*client);

    auto pending = client->send("tools/list");
    (void)peer_->expect_request("tools/list");
    peer_->hang_up();

    EXPECT_THROW(client->await(pending), ConnectionClosedError);
    EXPECT_EQ(client->state(), SessionState::Closed);
    EXPECT_THROW((void)client->send("ping"), ConnectionClosedError);
}

TEST_F(ClientTest, CloseFailsPendingCalls) {
    auto client = make_client();
    handshake(*client);

    auto pending = client->send("tools/list");
    client->close();
    EXPECT_THROW(client->await(pending), ConnectionClosedError);
    EXPECT_NO_THROW(client->close());
}
