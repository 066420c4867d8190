#pragma once
#include <string>
#include <utility>

namespace webrepl {

constexpr const char* kPasswordPrompt = "Password: ";
constexpr const char* kLoginBanner    = "WebREPL connected";
constexpr const char* kAccessDenied   = "Access denied";

// Control sequences understood by the device console.
constexpr const char* kStop     = "\r\x03";       // CTRL-C
constexpr const char* kReset    = "\r\x04";       // CTRL-D
constexpr const char* kEnterRaw = "\r\x01";       // CTRL-A
constexpr const char* kExitRaw  = "\r\x04\r\x02"; // CTRL-D + CTRL-B

enum class LoginState { Pending, PasswordSent, LoggedIn, Denied };

struct ConsoleAction {
    std::string reply;      // text to send back, empty for none
    bool login_changed{false};
};

class ConsoleHandler {
public:
    explicit ConsoleHandler(std::string password) : password_(std::move(password)) {}
    ConsoleAction on_text(const std::string& text);
    LoginState login_state() const { return login_; }
private:
    std::string password_;
    LoginState login_{LoginState::Pending};
};

std::string exec_command(const std::string& cmd);
std::string soft_reset();
std::string raw_exec(const std::string& code);
std::string remove_file(const std::string& filename);

} // namespace webrepl
