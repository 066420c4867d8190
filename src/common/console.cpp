#include "console.hpp"
#include "logging.hpp"

namespace webrepl {

static const char *kTag = "console";

ConsoleAction ConsoleHandler::on_text(const std::string &text) {
  ConsoleAction act;
  if (text == kPasswordPrompt) {
    if (login_ == LoginState::PasswordSent) {
      // prompted again, the last password was refused
      Logger::instance().log(LogLevel::ERROR, kTag, "password rejected by device");
      login_ = LoginState::Denied;
      act.login_changed = true;
      return act;
    }
    if (login_ == LoginState::Pending) {
      Logger::instance().log(LogLevel::DEBUG, kTag, "answering password prompt");
      act.reply = password_ + "\r";
      login_ = LoginState::PasswordSent;
    }
    return act;
  }
  // after login everything is user output, even text that looks like a banner
  if (login_ == LoginState::LoggedIn || login_ == LoginState::Denied)
    return act;
  if (text.find(kLoginBanner) != std::string::npos) {
    login_ = LoginState::LoggedIn;
    act.login_changed = true;
  } else if (text.find(kAccessDenied) != std::string::npos) {
    Logger::instance().log(LogLevel::ERROR, kTag, "access denied by device");
    login_ = LoginState::Denied;
    act.login_changed = true;
  }
  return act;
}

std::string exec_command(const std::string &cmd) { return cmd + "\r"; }

std::string soft_reset() { return std::string(kStop) + kReset; }

std::string raw_exec(const std::string &code) {
  return std::string(kStop) + kEnterRaw + code + kExitRaw;
}

std::string remove_file(const std::string &filename) {
  std::string quoted;
  quoted.reserve(filename.size());
  for (char c : filename) {
    if (c == '\\' || c == '\'')
      quoted.push_back('\\');
    quoted.push_back(c);
  }
  return raw_exec("from os import remove\nremove('" + quoted + "')");
}

} // namespace webrepl
