#include <catch2/catch_test_macros.hpp>

#include "ipc_protocol.hpp"
#include "platform/linux/ipc_presenter.hpp"
#include "platform/linux/unix_socket_client.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <unistd.h>

using json = nlohmann::json;

namespace {

std::string tmp_socket_path() {
    return "/tmp/voxkey_test_ipc_" + std::to_string(getpid()) + ".sock";
}

// The server socket is non-blocking, so poll briefly for data to arrive.
IpcServer::ReadStatus read_with_retry(UnixSocketServer& server, int fd, json& cmd) {
    auto status = IpcServer::ReadStatus::Pending;
    for (int i = 0; i < 50 && status == IpcServer::ReadStatus::Pending; ++i) {
        status = server.read_command(fd, cmd);
        if (status == IpcServer::ReadStatus::Pending) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
    return status;
}

} // namespace

TEST_CASE("IPC transport", "[ipc]") {
    auto sock_path = tmp_socket_path();

    SECTION("ServerStartStop") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        REQUIRE(std::filesystem::exists(sock_path));
        server.stop();
        REQUIRE_FALSE(std::filesystem::exists(sock_path));
    }

    SECTION("RoundTrip") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        REQUIRE(client.send({{"cmd", "set"}, {"mode", "ask"}}));

        json received;
        REQUIRE(read_with_retry(server, client_fd, received) == IpcServer::ReadStatus::Message);
        REQUIRE(received["cmd"] == "set");
        REQUIRE(received["mode"] == "ask");

        REQUIRE(server.send_response(client_fd, ipc::ok("recording")));

        auto client_resp = client.recv(1000);
        REQUIRE(client_resp);
        REQUIRE((*client_resp)["status"] == "ok");
        REQUIRE((*client_resp)["message"] == "recording");

        REQUIRE(server.client_count() == 1);
        server.close_client(client_fd);
        REQUIRE(server.client_count() == 0);
        client.close();
        server.stop();
    }

    SECTION("LargeReplyIsDeliveredWhole") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        // Larger than the default socket buffer, so the writer has to wait for the reader.
        std::string text(1 << 20, 'x');
        bool sent = false;
        std::thread writer([&] { sent = server.send_response(client_fd, {{"text", text}}); });

        auto reply = client.recv(5000);
        writer.join();
        REQUIRE(sent);
        REQUIRE(reply);
        REQUIRE((*reply)["text"].get<std::string>().size() == text.size());

        server.stop();
    }

    SECTION("TwoCommandsInOneWrite") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        REQUIRE(client.send({{"cmd", "status"}}));
        REQUIRE(client.send({{"cmd", "last"}}));
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

        json first, second;
        REQUIRE(read_with_retry(server, client_fd, first) == IpcServer::ReadStatus::Message);
        REQUIRE(read_with_retry(server, client_fd, second) == IpcServer::ReadStatus::Message);
        REQUIRE(first["cmd"] == "status");
        REQUIRE(second["cmd"] == "last");

        server.stop();
    }

    SECTION("ClientReadsBackToBackFrames") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        for (int i = 0; i < 3; ++i) {
            REQUIRE(server.send_response(client_fd, {{"seq", i}}));
        }
        for (int i = 0; i < 3; ++i) {
            auto frame = client.recv(1000);
            REQUIRE(frame);
            REQUIRE((*frame)["seq"] == i);
        }

        server.stop();
    }

    SECTION("ClientDisconnect") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        client.close();
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

        json cmd;
        REQUIRE(server.read_command(client_fd, cmd) == IpcServer::ReadStatus::Closed);

        server.close_client(client_fd);
        server.stop();
    }

    SECTION("RequestReportsTimeout") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        auto reply = client.request({{"cmd", "status"}}, 20);
        REQUIRE_FALSE(reply);
        REQUIRE(reply.error() == IpcClient::describe(IpcClient::RecvError::Timeout));

        server.close_client(client_fd);
        reply = client.request({{"cmd", "status"}}, 1000);
        REQUIRE_FALSE(reply);

        server.stop();
    }

    SECTION("MalformedLineClosesClient") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        // A bare string is valid JSON but not a command object.
        REQUIRE(client.send("not an object"));
        json cmd;
        REQUIRE(read_with_retry(server, client_fd, cmd) == IpcServer::ReadStatus::Closed);

        server.stop();
    }

    SECTION("PresenterBroadcastsToWatchers") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        IpcPresenter presenter(server);

        UnixSocketClient watcher;
        REQUIRE(watcher.connect(sock_path));
        int watcher_fd = server.accept_client();
        REQUIRE(watcher_fd >= 0);
        presenter.add_watcher(watcher_fd);
        REQUIRE(presenter.is_watcher(watcher_fd));

        StatusView view;
        view.state = SessionState::Recording;
        view.options.mode = Mode::Code;
        presenter.show(view);
        presenter.level(0.25f);
        presenter.hide();

        auto frame = watcher.recv(1000);
        REQUIRE(frame);
        REQUIRE((*frame)["event"] == "status");
        REQUIRE((*frame)["state"] == "recording");
        REQUIRE((*frame)["mode"] == "code");
        frame = watcher.recv(1000);
        REQUIRE(frame);
        REQUIRE((*frame)["event"] == "level");
        REQUIRE((*frame)["value"] == 0.25);
        frame = watcher.recv(1000);
        REQUIRE(frame);
        REQUIRE((*frame)["event"] == "hide");

        presenter.remove_watcher(watcher_fd);
        REQUIRE_FALSE(presenter.is_watcher(watcher_fd));
        server.stop();
    }
}

TEST_CASE("Status frame", "[ipc]") {
    StatusView view;
    view.options.language = "ru";
    view.options.routing = OutputRouting::ShowInChat;
    view.clipboard = ClipboardSnapshot::Kind::Image;
    view.has_terminology = true;
    view.history_turns = 2;

    SECTION("IdleOmitsDurationAndMessage") {
        auto j = ipc::status_json(view);
        REQUIRE(j["status"] == "ok");
        REQUIRE(j["state"] == "idle");
        REQUIRE(j["language"] == "ru");
        REQUIRE(j["output"] == "chat");
        REQUIRE(j["clipboard"] == "image");
        REQUIRE(j["has_terminology"] == true);
        REQUIRE(j["history_turns"] == 2);
        REQUIRE_FALSE(j.contains("duration"));
        REQUIRE_FALSE(j.contains("message"));
    }

    SECTION("ErrorCarriesMessage") {
        view.state = SessionState::Error;
        view.message = "No API key configured";
        auto j = ipc::status_json(view);
        REQUIRE(j["state"] == "error");
        REQUIRE(j["message"] == "No API key configured");
    }

    SECTION("RecordingCarriesDuration") {
        view.state = SessionState::Recording;
        view.recording_s = 1.5;
        REQUIRE(ipc::status_json(view)["duration"] == 1.5);
    }
}
