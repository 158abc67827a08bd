// tests/unit/install/test_install_layout.cpp - Install layout tests
//
#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

#include "workroot/install/install_layout.hpp"
#include "workroot/test_support/temp_tree.hpp"

using namespace workroot;
using workroot::test_support::TempTree;

namespace
{

InstallSpec pyright_spec()
{
  InstallSpec spec;
  spec.server_name = "pyright";
  spec.packages = {"pyright", "typescript"};
  spec.binaries = {"pyright-langserver", "pyright"};
  return spec;
}

/// Sets an environment variable for the lifetime of the guard.
class ScopedEnv
{
public:
  ScopedEnv(const char * name, const char * value) : name_(name)
  {
    if (const char * old = std::getenv(name)) {
      old_ = std::string(old);
    }
    if (value != nullptr) {
      ::setenv(name, value, 1);
    } else {
      ::unsetenv(name);
    }
  }

  ~ScopedEnv()
  {
    if (old_) {
      ::setenv(name_.c_str(), old_->c_str(), 1);
    } else {
      ::unsetenv(name_.c_str());
    }
  }

  ScopedEnv(const ScopedEnv &) = delete;
  ScopedEnv & operator=(const ScopedEnv &) = delete;

private:
  std::string name_;
  std::optional<std::string> old_;
};

}  // namespace

TEST(InstallLayout, DirectoriesDeriveFromBaseAndName)
{
  const InstallLayout layout("/cache/workroot/", pyright_spec());
  EXPECT_EQ(layout.install_dir(), "/cache/workroot/pyright");
  EXPECT_EQ(layout.bin_dir(), "/cache/workroot/pyright/node_modules/.bin");
  EXPECT_EQ(layout.bin_path("pyright"), "/cache/workroot/pyright/node_modules/.bin/pyright");
}

TEST(InstallLayout, RejectsIncompleteInstallSpec)
{
  EXPECT_THROW(InstallLayout("", pyright_spec()), std::invalid_argument);

  auto spec = pyright_spec();
  spec.server_name.clear();
  EXPECT_THROW(InstallLayout("/cache", spec), std::invalid_argument);

  spec = pyright_spec();
  spec.packages.clear();
  EXPECT_THROW(InstallLayout("/cache", spec), std::invalid_argument);

  spec = pyright_spec();
  spec.binaries.clear();
  EXPECT_THROW(InstallLayout("/cache", spec), std::invalid_argument);
}

TEST(InstallLayout, InfoReportsMissingBinaries)
{
  TempTree tree("workroot_install_missing");
  const InstallLayout layout(tree.path(), pyright_spec());

  const InstallInfo info = layout.info();
  EXPECT_FALSE(info.is_installed);
  EXPECT_EQ(info.install_dir, layout.install_dir());
  EXPECT_EQ(info.bin_dir, layout.bin_dir());
  ASSERT_EQ(info.binaries.size(), 2U);
  EXPECT_EQ(info.binaries.at("pyright-langserver"), layout.bin_path("pyright-langserver"));
}

TEST(InstallLayout, InstalledOnlyWhenEveryBinaryIsExecutable)
{
  namespace fs = std::filesystem;
  TempTree tree("workroot_install_present");
  const InstallLayout layout(tree.path(), pyright_spec());

  const std::string first = tree.file("pyright/node_modules/.bin/pyright-langserver", "#!/bin/sh\n");
  fs::permissions(first, fs::perms::owner_all);
  EXPECT_FALSE(layout.info().is_installed);

  const std::string second = tree.file("pyright/node_modules/.bin/pyright", "#!/bin/sh\n");
  fs::permissions(second, fs::perms::owner_all);
  EXPECT_TRUE(layout.info().is_installed);
}

TEST(InstallLayout, InstallScriptInstallsPackagesIntoInstallDir)
{
  auto spec = pyright_spec();
  spec.post_install_script = "ln -s foo bar";
  const InstallLayout layout("/cache", spec);

  const std::string script = layout.install_script();
  EXPECT_EQ(script.rfind("set -e\n", 0), 0U) << script;
  EXPECT_NE(script.find("mkdir -p \"/cache/pyright\""), std::string::npos) << script;
  EXPECT_NE(script.find("cd \"/cache/pyright\""), std::string::npos) << script;
  EXPECT_NE(script.find("npm install pyright typescript\n"), std::string::npos) << script;
  EXPECT_NE(script.find("ln -s foo bar"), std::string::npos) << script;
}

TEST(DefaultBaseInstallDir, PrefersXdgCacheHome)
{
  ScopedEnv xdg("XDG_CACHE_HOME", "/xdg/cache");
  ScopedEnv home("HOME", "/home/someone");
  EXPECT_EQ(default_base_install_dir(), std::optional<std::string>("/xdg/cache/workroot"));
}

TEST(DefaultBaseInstallDir, FallsBackToHome)
{
  ScopedEnv xdg("XDG_CACHE_HOME", nullptr);
  ScopedEnv home("HOME", "/home/someone");
  EXPECT_EQ(default_base_install_dir(), std::optional<std::string>("/home/someone/.cache/workroot"));
}

TEST(DefaultBaseInstallDir, NothingWithoutEnvironment)
{
  ScopedEnv xdg("XDG_CACHE_HOME", "");
  ScopedEnv home("HOME", nullptr);
  EXPECT_FALSE(default_base_install_dir().has_value());
}

TEST(VspackageUrl, BuildsMarketplaceUrl)
{
  EXPECT_EQ(
    vspackage_url("ms-python.python"),
    std::optional<std::string>(
      "https://marketplace.visualstudio.com/_apis/public/gallery/publishers/ms-python/"
      "vsextensions/python/latest/vspackage"));
}

TEST(VspackageUrl, RejectsMalformedNames)
{
  EXPECT_FALSE(vspackage_url("python").has_value());
  EXPECT_FALSE(vspackage_url(".python").has_value());
  EXPECT_FALSE(vspackage_url("ms-python.").has_value());
  EXPECT_FALSE(vspackage_url("a.b.c").has_value());
}
