#include "repl_client.hpp"
#include "ws_transport.hpp"
#include <gtest/gtest.h>
#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

using namespace webrepl;

namespace {

using Server = websocketpp::server<websocketpp::config::asio>;
using websocketpp::frame::opcode::binary;
using websocketpp::frame::opcode::text;

// Loopback stand-in for a board: password login, then serves one GET.
class FakeBoard {
public:
    FakeBoard(asio::io_context& io, std::string password)
        : password_(std::move(password)) {
        srv_.clear_access_channels(websocketpp::log::alevel::all);
        srv_.clear_error_channels(websocketpp::log::elevel::all);
        websocketpp::lib::error_code ec;
        srv_.init_asio(&io, ec);
        srv_.set_reuse_addr(true);
        srv_.set_open_handler([this](websocketpp::connection_hdl hdl) {
            send(hdl, "Password: ", text);
        });
        srv_.set_message_handler([this](websocketpp::connection_hdl hdl, Server::message_ptr msg) {
            on_message(hdl, msg);
        });
        srv_.listen(asio::ip::tcp::endpoint(asio::ip::address_v4::loopback(), 0), ec);
        if (!ec)
            srv_.start_accept(ec);
        ok_ = !ec;
    }

    bool ok() const { return ok_; }
    uint16_t port() {
        std::error_code ec;
        return srv_.get_local_endpoint(ec).port();
    }
    void stop_listening() {
        websocketpp::lib::error_code ec;
        srv_.stop_listening(ec);
    }

    std::string file{"hi"};
    std::vector<std::string> requests;
    int acks{0};

private:
    void send(websocketpp::connection_hdl hdl, const std::string& payload,
              websocketpp::frame::opcode::value op) {
        websocketpp::lib::error_code ec;
        srv_.send(hdl, payload, op, ec);
    }

    void on_message(websocketpp::connection_hdl hdl, Server::message_ptr msg) {
        const std::string& p = msg->get_payload();
        if (msg->get_opcode() == text) {
            if (p == password_ + "\r")
                send(hdl, "\r\nWebREPL connected\r\n>>> ", text);
            else
                send(hdl, "\r\nAccess denied\r\n", text);
            return;
        }
        const std::string ok("WB\0\0", 4);
        if (p.size() == kRequestFrameSize) {
            requests.push_back(p);
            send(hdl, ok, binary);
            return;
        }
        ++acks;
        if (acks == 1) {
            std::string chunk{(char)file.size(), 0};
            send(hdl, chunk + file, binary);
        } else if (acks == 2) {
            send(hdl, std::string("\0\0", 2), binary);
            send(hdl, ok, binary);
        }
    }

    Server srv_;
    std::string password_;
    bool ok_{false};
};

struct Run {
    std::vector<LoginState> logins;
    std::vector<Completion> completions;
    std::vector<std::string> close_reasons;
};

// Connects a ReplClient to the board and fetches "a.txt" after login.
Run fetch(asio::io_context& io, uint16_t port, const std::string& password) {
    Run run;
    WsTransport transport(io, "127.0.0.1", port);
    asio::steady_timer guard(io, std::chrono::seconds(5));
    guard.async_wait([&](std::error_code ec) {
        if (!ec)
            io.stop();
    });

    ClientConfig cfg;
    cfg.password = password;
    ReplClient* client_ptr = nullptr;
    ReplClient::Callbacks cb;
    cb.on_login = [&](LoginState st) {
        run.logins.push_back(st);
        if (st == LoginState::LoggedIn)
            EXPECT_EQ(client_ptr->get("a.txt"), Error::None);
        else
            transport.close();
    };
    cb.on_complete = [&](const Completion& c) {
        run.completions.push_back(c);
        transport.close();
    };
    ReplClient client(transport, cfg, std::move(cb));
    client_ptr = &client;

    transport.set_handlers([] {}, [&](Message&& m) { client.on_message(m); },
                           [&](const std::string& reason) {
                               run.close_reasons.push_back(reason);
                               guard.cancel();
                               io.stop();
                           });
    transport.start();
    io.run();
    return run;
}

} // namespace

TEST(WsTransport, LogsInAndFetchesFile) {
    asio::io_context io;
    FakeBoard board(io, "pw");
    ASSERT_TRUE(board.ok());

    Run run = fetch(io, board.port(), "pw");
    ASSERT_EQ(run.logins.size(), 1u);
    EXPECT_EQ(run.logins[0], LoginState::LoggedIn);
    ASSERT_EQ(board.requests.size(), 1u);
    EXPECT_EQ(board.requests[0][2], 2);
    EXPECT_EQ(board.acks, 2);
    ASSERT_EQ(run.completions.size(), 1u);
    EXPECT_TRUE(run.completions[0].ok);
    EXPECT_EQ(std::string(run.completions[0].data.begin(), run.completions[0].data.end()), "hi");
    ASSERT_EQ(run.close_reasons.size(), 1u);
    EXPECT_TRUE(run.close_reasons[0].empty());
}

TEST(WsTransport, WrongPasswordIsReported) {
    asio::io_context io;
    FakeBoard board(io, "pw");
    ASSERT_TRUE(board.ok());

    Run run = fetch(io, board.port(), "nope");
    ASSERT_EQ(run.logins.size(), 1u);
    EXPECT_EQ(run.logins[0], LoginState::Denied);
    EXPECT_TRUE(board.requests.empty());
    EXPECT_TRUE(run.completions.empty());
}

TEST(WsTransport, RefusedConnectionReportsReason) {
    asio::io_context io;
    uint16_t port = 0;
    {
        asio::ip::tcp::acceptor spare(io, asio::ip::tcp::endpoint(asio::ip::address_v4::loopback(), 0));
        port = spare.local_endpoint().port();
    }
    Run run = fetch(io, port, "pw");
    EXPECT_TRUE(run.logins.empty());
    ASSERT_EQ(run.close_reasons.size(), 1u);
    EXPECT_FALSE(run.close_reasons[0].empty());
}
