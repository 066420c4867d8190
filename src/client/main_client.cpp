#include "logging.hpp"
#include "repl_client.hpp"
#include "util.hpp"
#include "ws_transport.hpp"
#include <asio.hpp>
#include <cstdlib>
#include <iostream>

using namespace webrepl;

static const char *kTag = "cli";

static void usage() {
  std::cerr
      << "usage: webrepl_cli [options] <command> [args]\n"
         "commands:\n"
         "  put <local> [remote]   copy a file to the device\n"
         "  get <remote> [local]   copy a file from the device\n"
         "  version                query the WebREPL version\n"
         "  exec <code>            run one line at the prompt\n"
         "  rm <remote>            delete a file on the device\n"
         "  reset                  interrupt and soft-reset the device\n"
         "options:\n"
         "  --host ip[:port]       device address (192.168.4.1:8266)\n"
         "  --password pw          WebREPL password (or WEBREPL_PASSWORD)\n"
         "  --timeout sec          give up on a stalled command (30)\n"
         "  --truncate-names       cut remote names at 64 bytes\n"
         "  --log-level lvl        trace|debug|info|warn|error\n";
}

int main(int argc, char **argv) {
  ClientConfig cfg;
  if (const char *pw = std::getenv("WEBREPL_PASSWORD"))
    cfg.password = pw;
  std::string host = cfg.host;
  std::vector<std::string> args;

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(1);
    };
    if (a == "--host")
      host = next(i);
    else if (a == "--password")
      cfg.password = next(i);
    else if (a == "--timeout") {
      try {
        cfg.timeout_sec = std::stoi(next(i));
      } catch (const std::exception &) {
        std::cerr << "bad timeout" << std::endl;
        return 1;
      }
    } else if (a == "--truncate-names")
      cfg.name_policy = FilenamePolicy::Truncate;
    else if (a == "--log-level") {
      LogLevel lvl;
      if (!parse_log_level(next(i), lvl)) {
        std::cerr << "bad log level" << std::endl;
        return 1;
      }
      Logger::instance().set_level(lvl);
    } else if (a == "-h" || a == "--help") {
      usage();
      return 0;
    } else
      args.push_back(a);
  }

  if (!parse_host_port(host, cfg.host, cfg.port)) {
    std::cerr << "bad host" << std::endl;
    return 1;
  }
  if (args.empty()) {
    usage();
    return 1;
  }
  const std::string cmd = args[0];
  auto arg = [&](size_t i) {
    return i < args.size() ? args[i] : std::string();
  };
  bool console_cmd = cmd == "exec" || cmd == "rm" || cmd == "reset";
  if ((cmd == "put" || cmd == "get" || console_cmd) && arg(1).empty() &&
      cmd != "reset") {
    usage();
    return 1;
  }
  if (!console_cmd && cmd != "put" && cmd != "get" && cmd != "version") {
    std::cerr << "unknown command: " << cmd << std::endl;
    return 1;
  }

  std::vector<uint8_t> put_data;
  if (cmd == "put") {
    std::string err;
    if (!read_file(arg(1), put_data, err)) {
      std::cerr << err << std::endl;
      return 1;
    }
  }
  std::string remote = cmd == "put" ? (arg(2).empty() ? base_name(arg(1)) : arg(2))
                                    : arg(1);
  std::string local = cmd == "get" ? (arg(2).empty() ? base_name(arg(1)) : arg(2))
                                   : std::string();

  asio::io_context io;
  WsTransport transport(io, cfg.host, cfg.port);
  asio::steady_timer deadline(io);
  asio::steady_timer quiet(io);
  int rc = 1;
  bool finished = false;

  auto finish = [&](int code) {
    if (finished)
      return;
    rc = code;
    finished = true;
    quiet.cancel();
    transport.close();
    // the device may never answer the close frame
    deadline.expires_after(std::chrono::seconds(2));
    deadline.async_wait([&](std::error_code ec) {
      if (!ec)
        io.stop();
    });
  };

  // console commands have no completion frame; leave once output settles
  auto arm_quiet = [&]() {
    quiet.expires_after(std::chrono::milliseconds(800));
    quiet.async_wait([&](std::error_code ec) {
      if (!ec)
        finish(0);
    });
  };

  ReplClient::Callbacks cb;
  bool started = false;
  ReplClient *client_ptr = nullptr;

  cb.on_output = [&](const std::string &text) {
    if (!started || !console_cmd)
      return;
    std::cout << text << std::flush;
    arm_quiet();
  };
  cb.on_login = [&](LoginState st) {
    if (st != LoginState::LoggedIn) {
      std::cerr << "login failed" << std::endl;
      return finish(1);
    }
    started = true;
    ReplClient &client = *client_ptr;
    Error err = Error::None;
    if (cmd == "put")
      err = client.put(remote, std::move(put_data));
    else if (cmd == "get")
      err = client.get(remote);
    else if (cmd == "version")
      err = client.version();
    else if (cmd == "exec")
      client.exec(arg(1));
    else if (cmd == "rm")
      client.remove(arg(1));
    else
      client.soft_reset();
    if (err != Error::None) {
      std::cerr << cmd << " " << remote << ": " << error_str(err) << std::endl;
      return finish(1);
    }
    if (console_cmd)
      arm_quiet();
  };
  cb.on_complete = [&](const Completion &c) {
    if (!c.ok) {
      std::cerr << "failed: " << error_str(c.error);
      if (c.error == Error::RemoteRejected)
        std::cerr << " (status " << c.remote_status << ")";
      std::cerr << std::endl;
      return finish(1);
    }
    if (c.kind == TransferKind::Get) {
      std::string err;
      if (!write_file(local, c.data, err)) {
        std::cerr << err << std::endl;
        return finish(1);
      }
      std::cout << "Got " << remote << ", " << c.bytes << " bytes" << std::endl;
    } else if (c.kind == TransferKind::Put) {
      std::cout << "Sent " << remote << ", " << c.bytes << " bytes"
                << std::endl;
    } else if (c.data.size() == 3) {
      std::cout << (int)c.data[0] << "." << (int)c.data[1] << "."
                << (int)c.data[2] << std::endl;
    } else {
      std::cout << bytes_to_hex(c.data) << std::endl;
    }
    finish(0);
  };

  ReplClient client(transport, cfg, std::move(cb));
  client_ptr = &client;

  transport.set_handlers(
      [] {}, [&](Message &&m) { client.on_message(m); },
      [&](const std::string &reason) {
        deadline.cancel();
        quiet.cancel();
        if (!finished)
          rc = 1;
        if (client.busy())
          client.abandon();
      });

  deadline.expires_after(std::chrono::seconds(cfg.timeout_sec));
  deadline.async_wait([&](std::error_code ec) {
    if (ec)
      return;
    Logger::instance().log(LogLevel::ERROR, kTag, "timed out after %d s",
                           cfg.timeout_sec);
    client.abandon();
    rc = 1;
    io.stop();
  });

  transport.start();
  io.run();
  return rc;
}
