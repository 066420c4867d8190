#include "repl_client.hpp"
#include "logging.hpp"

namespace webrepl {

static const char *kTag = "client";

ReplClient::ReplClient(Transport &transport, const ClientConfig &cfg,
                       Callbacks cb)
    : transport_(transport), cb_(std::move(cb)), engine_(cfg.name_policy),
      console_(cfg.password) {}

void ReplClient::on_message(const Message &msg) {
  if (auto *b = std::get_if<BinaryMessage>(&msg))
    on_binary(*b);
  else
    on_text(std::get<TextMessage>(msg));
}

void ReplClient::on_binary(const BinaryMessage &m) {
  Step st = engine_.on_binary(m.data);
  if (!st.consumed) {
    Logger::instance().log(LogLevel::TRACE, kTag,
                           "ignoring %zu binary bytes while idle",
                           m.data.size());
    return;
  }
  flush(st);
}

void ReplClient::on_text(const TextMessage &m) {
  ConsoleAction act = console_.on_text(m.text);
  if (!act.reply.empty())
    transport_.send_text(act.reply);
  if (act.login_changed && cb_.on_login)
    cb_.on_login(console_.login_state());
  if (cb_.on_output)
    cb_.on_output(m.text);
}

void ReplClient::flush(Step &st) {
  for (auto &out : st.outbound)
    transport_.send_binary(std::move(out));
  st.outbound.clear();
  if (st.done && cb_.on_complete)
    cb_.on_complete(*st.done);
}

Error ReplClient::put(const std::string &remote_name,
                      std::vector<uint8_t> data) {
  Step st;
  Error err = engine_.start_put(remote_name, std::move(data), st);
  if (err == Error::None)
    flush(st);
  return err;
}

Error ReplClient::get(const std::string &remote_name) {
  Step st;
  Error err = engine_.start_get(remote_name, st);
  if (err == Error::None)
    flush(st);
  return err;
}

Error ReplClient::version() {
  Step st;
  Error err = engine_.start_version_query(st);
  if (err == Error::None)
    flush(st);
  return err;
}

void ReplClient::exec(const std::string &command) {
  transport_.send_text(exec_command(command));
}

void ReplClient::stop() { transport_.send_text(kStop); }

void ReplClient::soft_reset() { transport_.send_text(webrepl::soft_reset()); }

void ReplClient::remove(const std::string &remote_name) {
  transport_.send_text(remove_file(remote_name));
}

void ReplClient::abandon() { engine_.reset(); }

} // namespace webrepl
