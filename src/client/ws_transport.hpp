#pragma once
#include <asio.hpp>
#include <functional>
#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_no_tls_client.hpp>
#include "transport.hpp"

namespace webrepl {

// Upper bound for one reassembled message.
constexpr size_t kMaxMessageBytes = 16u * 1024u * 1024u;

class WsTransport : public Transport {
public:
    using Client = websocketpp::client<websocketpp::config::asio_client>;
    using MessageHandler = std::function<void(Message&&)>;
    using OpenHandler = std::function<void()>;
    using CloseHandler = std::function<void(const std::string& reason)>;

    WsTransport(asio::io_context& io, const std::string& host, uint16_t port);
    void set_handlers(OpenHandler on_open, MessageHandler on_message, CloseHandler on_close);
    void start();

    void send_text(const std::string& text) override;
    void send_binary(std::vector<uint8_t> data) override;
    void close() override;

private:
    void on_ws_message(websocketpp::connection_hdl hdl, Client::message_ptr msg);
    void on_ws_fail(websocketpp::connection_hdl hdl);
    void on_ws_close(websocketpp::connection_hdl hdl);
    void finish(const std::string& reason);

    Client client_;
    websocketpp::connection_hdl hdl_;
    std::string uri_;
    bool open_{false};
    bool closing_{false};
    bool closed_{false};

    OpenHandler on_open_;
    MessageHandler on_message_;
    CloseHandler on_close_;
};

} // namespace webrepl
