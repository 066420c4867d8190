#include "console.hpp"
#include <gtest/gtest.h>

using namespace webrepl;

TEST(ConsoleHandler, AnswersPasswordPrompt) {
  ConsoleHandler h("secret");
  ConsoleAction a = h.on_text("Password: ");
  EXPECT_EQ(a.reply, "secret\r");
  EXPECT_FALSE(a.login_changed);
  EXPECT_EQ(h.login_state(), LoginState::PasswordSent);
}

TEST(ConsoleHandler, PromptMustMatchExactly) {
  ConsoleHandler h("secret");
  EXPECT_TRUE(h.on_text("Password:").reply.empty());
  EXPECT_TRUE(h.on_text(">>> print('Password: ')").reply.empty());
  EXPECT_EQ(h.login_state(), LoginState::Pending);
}

TEST(ConsoleHandler, LoginBanner) {
  ConsoleHandler h("secret");
  h.on_text("Password: ");
  ConsoleAction a = h.on_text("\r\nWebREPL connected\r\n>>> ");
  EXPECT_TRUE(a.login_changed);
  EXPECT_TRUE(a.reply.empty());
  EXPECT_EQ(h.login_state(), LoginState::LoggedIn);
  EXPECT_FALSE(h.on_text("WebREPL connected").login_changed);
}

TEST(ConsoleHandler, AccessDenied) {
  ConsoleHandler h("wrong");
  h.on_text("Password: ");
  ConsoleAction a = h.on_text("\r\nAccess denied\r\n");
  EXPECT_TRUE(a.login_changed);
  EXPECT_EQ(h.login_state(), LoginState::Denied);
}

TEST(ConsoleHandler, SecondPromptMeansRefused) {
  ConsoleHandler h("wrong");
  h.on_text("Password: ");
  ConsoleAction a = h.on_text("Password: ");
  EXPECT_TRUE(a.reply.empty());
  EXPECT_TRUE(a.login_changed);
  EXPECT_EQ(h.login_state(), LoginState::Denied);
}

TEST(ConsoleCommands, ControlSequences) {
  EXPECT_EQ(exec_command("print(1)"), "print(1)\r");
  EXPECT_EQ(soft_reset(), "\r\x03\r\x04");
  EXPECT_EQ(raw_exec("x=1"), std::string("\r\x03\r\x01x=1\r\x04\r\x02"));
}

TEST(ConsoleCommands, RemoveFileEscapesName) {
  std::string cmd = remove_file("it's.py");
  EXPECT_NE(cmd.find("from os import remove\nremove('it\\'s.py')"),
            std::string::npos);
  EXPECT_EQ(cmd.compare(0, 4, "\r\x03\r\x01"), 0);
}

TEST(ConsoleHandler, OutputAfterLoginNeverChangesLoginState) {
  ConsoleHandler h("secret");
  h.on_text("Password: ");
  h.on_text("\r\nWebREPL connected\r\n>>> ");
  ASSERT_EQ(h.login_state(), LoginState::LoggedIn);

  ConsoleAction a = h.on_text("print('Access denied')\r\nAccess denied\r\n>>> ");
  EXPECT_FALSE(a.login_changed);
  EXPECT_TRUE(a.reply.empty());
  a = h.on_text("Password: ");
  EXPECT_FALSE(a.login_changed);
  EXPECT_TRUE(a.reply.empty());
  EXPECT_EQ(h.login_state(), LoginState::LoggedIn);
}
