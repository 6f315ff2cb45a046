/// Client example: launches an MCP server as a child process and talks to it
/// over the child's stdin/stdout.
/// Usage: ./client_example <server_command> [args...]
/// Example: ./client_example ./echo_server

#include <mcplink/mcplink.hpp>
#include <csignal>
#include <iostream>
#include <string>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace {

struct ChildProcess {
    pid_t pid{-1};
    int read_fd{-1};   // child's stdout
    int write_fd{-1};  // child's stdin
};

ChildProcess spawn(const std::string& command, const std::vector<std::string>& args) {
    int in_pipe[2], out_pipe[2];
    if (pipe(in_pipe) < 0) {
        throw mcplink::TransportError("Failed to create pipes");
    }
    if (pipe(out_pipe) < 0) {
        close(in_pipe[0]);
        close(in_pipe[1]);
        throw mcplink::TransportError("Failed to create pipes");
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(in_pipe[0]); close(in_pipe[1]);
        close(out_pipe[0]); close(out_pipe[1]);
        throw mcplink::TransportError("Failed to fork process");
    }
    if (pid == 0) {
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        close(in_pipe[0]); close(in_pipe[1]);
        close(out_pipe[0]); close(out_pipe[1]);

        std::vector<char*> argv;
        std::string cmd = command;
        argv.push_back(cmd.data());
        std::vector<std::string> args_copy = args;
        for (auto& a : args_copy) argv.push_back(a.data());
        argv.push_back(nullptr);

        execvp(command.c_str(), argv.data());
        _exit(127);
    }

    close(in_pipe[0]);
    close(out_pipe[1]);
    return ChildProcess{pid, out_pipe[0], in_pipe[1]};
}

void print_names(const nlohmann::json& page, const char* key) {
    const auto& items = page.at(key);
    if (items.empty()) {
        std::cout << "  (none)\n";
    }
    for (const auto& item : items) {
        std::cout << "  " << item.value("name", item.value("uri", std::string("?")));
        if (item.contains("description")) std::cout << " - " << item.at("description").get<std::string>();
        std::cout << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <server_command> [args...]\n";
        std::cerr << "Example: " << argv[0] << " ./echo_server\n";
        return 1;
    }
    std::signal(SIGPIPE, SIG_IGN);

    std::string command = argv[1];
    std::vector<std::string> args(argv + 2, argv + argc);

    int status = 0;
    pid_t child = -1;
    try {
        std::cout << "Launching: " << command << "\n";
        auto proc = spawn(command, args);
        child = proc.pid;

        mcplink::Client::Options opts;
        opts.client_info = {"example-client", std::nullopt, "1.0.0"};
        opts.request_timeout = std::chrono::milliseconds(10000);
        mcplink::Client client(
            std::make_unique<mcplink::StdioTransport>(proc.read_fd, proc.write_fd), opts);

        client.on_notification("notifications/message", [](const mcplink::Notification& n) {
            std::cout << "[log] " << n.params.dump() << "\n";
        });

        auto init = client.initialize();
        std::cout << "Connected to: " << init.at("serverInfo").value("name", std::string("?"))
                  << " v" << init.at("serverInfo").value("version", std::string("?"))
                  << " (protocol " << init.value("protocolVersion", std::string("?")) << ")\n";

        std::cout << "\n--- Tools ---\n";
        auto tools = client.list_tools();
        print_names(tools, "tools");

        for (const auto& tool : tools.at("tools")) {
            if (tool.value("name", "") != "echo") continue;
            std::cout << "\n--- Calling echo tool ---\n";
            auto result = client.call_tool("echo", {{"text", "Hello from mcplink!"}});
            for (const auto& content : result.at("content")) {
                if (content.value("type", "") == "text") {
                    std::cout << "  Response: " << content.at("text").get<std::string>() << "\n";
                }
            }
        }

        std::cout << "\n--- Resources ---\n";
        print_names(client.list_resources(), "resources");

        std::cout << "\n--- Prompts ---\n";
        print_names(client.list_prompts(), "prompts");

        std::cout << "\nPing... ";
        client.ping();
        std::cout << "OK\n";

        client.close();
        std::cout << "Disconnected.\n";
    } catch (const mcplink::RpcProtocolError& e) {
        std::cerr << "Server error " << e.code << ": " << e.what() << "\n";
        status = 1;
    } catch (const mcplink::RpcError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        status = 1;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Unexpected result shape: " << e.what() << "\n";
        status = 1;
    }

    if (child > 0) {
        int child_status = 0;
        waitpid(child, &child_status, 0);
    }
    return status;
}
