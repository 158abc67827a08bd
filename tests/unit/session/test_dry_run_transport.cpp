// tests/unit/session/test_dry_run_transport.cpp - In-process transport tests
//
#include <gtest/gtest.h>

#include <vector>

#include "workroot/test_support/temp_tree.hpp"

#include "workroot/session/dry_run_transport.hpp"

using namespace workroot;
using workroot::test_support::TempTree;

namespace
{

SessionConfig config_for(const std::string & root, std::vector<std::string> cmd = {"srv"})
{
  SessionConfig config;
  config.name = "srv";
  config.cmd = std::move(cmd);
  config.root_dir = root;
  return config;
}

}  // namespace

TEST(DryRunTransport, IdsAreSequentialFromOne)
{
  DryRunTransport transport;
  EXPECT_EQ(transport.start_session(config_for("/a")), 1);
  EXPECT_EQ(transport.start_session(config_for("/b")), 2);
  EXPECT_EQ(transport.start_count(), 2U);
  EXPECT_EQ(transport.live_ids(), (std::vector<SessionId>{1, 2}));
}

TEST(DryRunTransport, GetSessionDescribesLiveSession)
{
  DryRunTransport transport;
  const SessionId id = transport.start_session(config_for("/a"));

  const auto session = transport.get_session(id);
  ASSERT_NE(session, nullptr);
  EXPECT_EQ(session->id, id);
  EXPECT_EQ(session->name, "srv");
  EXPECT_EQ(session->root_dir, "/a");

  EXPECT_EQ(transport.get_session(999), nullptr);
}

TEST(DryRunTransport, TerminateNotifiesOnceAndForgets)
{
  DryRunTransport transport;
  int calls = 0;
  auto config = config_for("/a");
  config.on_exit.append([&](const ExitEvent & e) {
    EXPECT_EQ(e.signal, 9);
    ++calls;
  });
  const SessionId id = transport.start_session(std::move(config));

  EXPECT_TRUE(transport.terminate(id, ExitEvent{0, 9}));
  EXPECT_FALSE(transport.terminate(id));
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(transport.get_session(id), nullptr);
  EXPECT_FALSE(transport.config_of(id).has_value());
}

TEST(DryRunTransport, ListenerMayCallBackIntoTransport)
{
  DryRunTransport transport;
  bool still_live = true;
  auto config = config_for("/a");
  SessionId id = 0;
  config.on_exit.append([&](const ExitEvent &) { still_live = transport.get_session(id) != nullptr; });
  id = transport.start_session(std::move(config));

  transport.terminate(id);
  EXPECT_FALSE(still_live);
}

TEST(DryRunTransport, TerminateAllEndsEverySession)
{
  DryRunTransport transport;
  int exits = 0;
  for (const char * root : {"/a", "/b", "/c"}) {
    auto config = config_for(root);
    config.on_exit.append([&](const ExitEvent &) { ++exits; });
    (void)transport.start_session(std::move(config));
  }

  transport.terminate_all();
  EXPECT_EQ(exits, 3);
  EXPECT_TRUE(transport.live_ids().empty());
}

TEST(DryRunTransport, MissingExecutableFailsStartSynchronously)
{
  DryRunOptions options;
  options.check_executables = true;
  DryRunTransport transport(options);

  int code = -1;
  auto config = config_for("/a", {"/nonexistent/workroot-test-server"});
  config.on_exit.append([&](const ExitEvent & e) { code = e.exit_code; });

  const SessionId id = transport.start_session(std::move(config));
  EXPECT_GT(id, 0);
  EXPECT_EQ(code, 127);
  EXPECT_EQ(transport.get_session(id), nullptr);
  EXPECT_EQ(transport.start_count(), 1U);
}

TEST(DryRunTransport, ExecutableCheckIsOffByDefault)
{
  DryRunTransport transport;
  const SessionId id = transport.start_session(config_for("/a", {"/nonexistent/server"}));
  EXPECT_NE(transport.get_session(id), nullptr);
}

TEST(DryRunTransport, ConfigOfKeepsStartConfiguration)
{
  DryRunTransport transport;
  auto config = config_for("/a");
  config.settings = {{"formatting", true}};
  const SessionId id = transport.start_session(std::move(config));

  const auto stored = transport.config_of(id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->settings["formatting"], true);
}

TEST(DryRunTransport, MissingWorkingDirectoryFailsStart)
{
  TempTree tree("workroot_dry_run_cwd");
  DryRunOptions options;
  options.check_executables = true;
  DryRunTransport transport(options);

  int code = -1;
  auto config = config_for(tree.path(), {"/bin/sh"});
  config.cmd_cwd = tree.path("missing");
  config.on_exit.append([&](const ExitEvent & e) { code = e.exit_code; });
  const SessionId failed = transport.start_session(std::move(config));
  EXPECT_EQ(code, 127);
  EXPECT_EQ(transport.get_session(failed), nullptr);

  auto good = config_for(tree.path(), {"/bin/sh"});
  good.cmd_cwd = tree.dir("build");
  EXPECT_NE(transport.get_session(transport.start_session(std::move(good))), nullptr);
}
