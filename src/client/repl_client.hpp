#pragma once
#include <functional>
#include <string>
#include "console.hpp"
#include "protocol.hpp"
#include "transfer.hpp"
#include "transport.hpp"

namespace webrepl {

struct ClientConfig {
    std::string host{"192.168.4.1"};
    uint16_t port{kDefaultPort};
    std::string password{"micropythoN"};
    int timeout_sec{30};
    FilenamePolicy name_policy{FilenamePolicy::Strict};
};

// Routes each message to the transfer engine or the console handler and
// sends whatever they answer.
class ReplClient {
public:
    struct Callbacks {
        std::function<void(const std::string&)> on_output;
        std::function<void(LoginState)> on_login;
        std::function<void(const Completion&)> on_complete;
    };

    ReplClient(Transport& transport, const ClientConfig& cfg, Callbacks cb);

    void on_message(const Message& msg);

    Error put(const std::string& remote_name, std::vector<uint8_t> data);
    Error get(const std::string& remote_name);
    Error version();

    void exec(const std::string& command);
    void stop();
    void soft_reset();
    void remove(const std::string& remote_name);

    // Drops a stalled transfer without telling the device.
    void abandon();

    bool busy() const { return !engine_.idle(); }
    LoginState login_state() const { return console_.login_state(); }
    const TransferEngine& engine() const { return engine_; }

private:
    void on_binary(const BinaryMessage& m);
    void on_text(const TextMessage& m);
    void flush(Step& st);

    Transport& transport_;
    Callbacks cb_;
    TransferEngine engine_;
    ConsoleHandler console_;
};

} // namespace webrepl
