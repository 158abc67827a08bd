// tests/unit/session/test_session_config.cpp - Session configuration tests
//
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "workroot/session/session_config.hpp"

using namespace workroot;

namespace
{

SessionConfig valid_config()
{
  SessionConfig config;
  config.name = "clangd";
  config.cmd = {"clangd"};
  config.root_dir = "/proj";
  return config;
}

}  // namespace

TEST(ExitListeners, NotifyRunsInListOrder)
{
  std::vector<int> order;
  ExitListeners listeners;
  listeners.append([&](const ExitEvent &) { order.push_back(2); });
  listeners.append([&](const ExitEvent &) { order.push_back(3); });
  listeners.prepend([&](const ExitEvent &) { order.push_back(1); });

  listeners.notify();
  EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(ExitListeners, EventIsPassedThrough)
{
  ExitEvent seen;
  ExitListeners listeners;
  listeners.append([&](const ExitEvent & e) { seen = e; });
  listeners.notify(ExitEvent{1, 15});
  EXPECT_EQ(seen.exit_code, 1);
  EXPECT_EQ(seen.signal, 15);
}

TEST(ExitListeners, EmptyCallablesAreIgnored)
{
  ExitListeners listeners;
  listeners.append(ExitListener{});
  listeners.prepend(nullptr);
  EXPECT_TRUE(listeners.empty());
  EXPECT_NO_THROW(listeners.notify());
}

TEST(ExitListeners, CopiesAreIndependent)
{
  int count = 0;
  ExitListeners a;
  a.append([&](const ExitEvent &) { ++count; });
  ExitListeners b = a;
  b.append([&](const ExitEvent &) { ++count; });

  EXPECT_EQ(a.size(), 1U);
  EXPECT_EQ(b.size(), 2U);
  a.notify();
  EXPECT_EQ(count, 1);
}

TEST(ValidateSessionConfig, AcceptsCompleteConfig)
{
  EXPECT_NO_THROW(validate_session_config(valid_config()));
}

TEST(ValidateSessionConfig, RequiresCommand)
{
  auto config = valid_config();
  config.cmd.clear();
  EXPECT_THROW(validate_session_config(config), ConfigurationError);

  config.cmd = {""};
  EXPECT_THROW(validate_session_config(config), ConfigurationError);
}

TEST(ValidateSessionConfig, RequiresRootDir)
{
  auto config = valid_config();
  config.root_dir.clear();
  try {
    validate_session_config(config);
    FAIL() << "expected ConfigurationError";
  } catch (const ConfigurationError & e) {
    const std::string msg = e.what();
    EXPECT_NE(msg.find("root_dir"), std::string::npos) << msg;
    EXPECT_NE(msg.find("clangd"), std::string::npos) << msg;
  }
}

TEST(ValidateSessionConfig, RejectsEmptyWorkingDirectory)
{
  auto config = valid_config();
  config.cmd_cwd = std::string();
  EXPECT_THROW(validate_session_config(config), ConfigurationError);

  config.cmd_cwd = std::string("/proj/build");
  EXPECT_NO_THROW(validate_session_config(config));
}

TEST(ValidateSessionConfig, SettingsMustBeObjects)
{
  auto config = valid_config();
  config.settings = nlohmann::json::array({1, 2});
  EXPECT_THROW(validate_session_config(config), ConfigurationError);

  config = valid_config();
  config.init_options = "text";
  EXPECT_THROW(validate_session_config(config), ConfigurationError);
}
