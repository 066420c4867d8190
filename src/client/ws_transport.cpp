#include "ws_transport.hpp"
#include "logging.hpp"

namespace webrepl {

static const char *kTag = "ws";

WsTransport::WsTransport(asio::io_context &io, const std::string &host,
                         uint16_t port)
    : uri_("ws://" + host + ":" + std::to_string(port) + "/") {
  // our Logger reports connection events; keep the library quiet
  client_.clear_access_channels(websocketpp::log::alevel::all);
  client_.clear_error_channels(websocketpp::log::elevel::all);
  websocketpp::lib::error_code ec;
  client_.init_asio(&io, ec);
  if (ec)
    Logger::instance().log(LogLevel::ERROR, kTag, "asio init failed: %s",
                           ec.message().c_str());

  client_.set_open_handler([this](websocketpp::connection_hdl) {
    open_ = true;
    Logger::instance().log(LogLevel::INFO, kTag, "connected to %s",
                           uri_.c_str());
    if (on_open_)
      on_open_();
  });
  client_.set_message_handler(
      [this](websocketpp::connection_hdl hdl, Client::message_ptr msg) {
        on_ws_message(hdl, msg);
      });
  client_.set_fail_handler(
      [this](websocketpp::connection_hdl hdl) { on_ws_fail(hdl); });
  client_.set_close_handler(
      [this](websocketpp::connection_hdl hdl) { on_ws_close(hdl); });
}

void WsTransport::set_handlers(OpenHandler on_open, MessageHandler on_message,
                               CloseHandler on_close) {
  on_open_ = std::move(on_open);
  on_message_ = std::move(on_message);
  on_close_ = std::move(on_close);
}

void WsTransport::start() {
  websocketpp::lib::error_code ec;
  Client::connection_ptr con = client_.get_connection(uri_, ec);
  if (ec)
    return finish("bad address " + uri_ + ": " + ec.message());
  con->set_max_message_size(kMaxMessageBytes);
  hdl_ = con->get_handle();
  client_.connect(con);
}

void WsTransport::on_ws_message(websocketpp::connection_hdl,
                                Client::message_ptr msg) {
  if (!on_message_)
    return;
  const std::string &payload = msg->get_payload();
  if (msg->get_opcode() == websocketpp::frame::opcode::text)
    on_message_(TextMessage{payload});
  else
    on_message_(BinaryMessage{std::vector<uint8_t>(payload.begin(),
                                                   payload.end())});
}

void WsTransport::on_ws_fail(websocketpp::connection_hdl hdl) {
  Client::connection_ptr con = client_.get_con_from_hdl(hdl);
  finish("connection to " + uri_ + " failed: " + con->get_ec().message());
}

void WsTransport::on_ws_close(websocketpp::connection_hdl hdl) {
  if (closing_)
    return finish(std::string());
  Client::connection_ptr con = client_.get_con_from_hdl(hdl);
  finish("connection closed by device (" +
         std::to_string(con->get_remote_close_code()) + ")");
}

void WsTransport::send_text(const std::string &text) {
  if (!open_ || closing_) {
    Logger::instance().log(LogLevel::WARN, kTag,
                           "send_text on closed connection");
    return;
  }
  websocketpp::lib::error_code ec;
  client_.send(hdl_, text, websocketpp::frame::opcode::text, ec);
  if (ec)
    Logger::instance().log(LogLevel::WARN, kTag, "send_text failed: %s",
                           ec.message().c_str());
}

void WsTransport::send_binary(std::vector<uint8_t> data) {
  if (!open_ || closing_) {
    Logger::instance().log(LogLevel::WARN, kTag,
                           "send_binary on closed connection");
    return;
  }
  websocketpp::lib::error_code ec;
  client_.send(hdl_, data.data(), data.size(),
               websocketpp::frame::opcode::binary, ec);
  if (ec)
    Logger::instance().log(LogLevel::WARN, kTag, "send_binary failed: %s",
                           ec.message().c_str());
}

void WsTransport::close() {
  if (!open_ || closing_ || closed_)
    return;
  closing_ = true;
  websocketpp::lib::error_code ec;
  client_.close(hdl_, websocketpp::close::status::normal, "", ec);
  if (ec) {
    Logger::instance().log(LogLevel::WARN, kTag, "close failed: %s",
                           ec.message().c_str());
    finish(std::string());
  }
}

void WsTransport::finish(const std::string &reason) {
  if (closed_)
    return;
  closed_ = true;
  open_ = false;
  if (!reason.empty())
    Logger::instance().log(LogLevel::ERROR, kTag, "%s", reason.c_str());
  if (on_close_)
    on_close_(reason);
}

} // namespace webrepl
