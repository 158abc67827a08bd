// workroot/test_support/temp_tree.hpp - Scratch directory trees for tests
//
#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

namespace workroot::test_support
{

/**
 * Temporary directory removed on destruction.
 *
 * root() is already resolved to its real path, so it compares equal to what
 * the root resolver returns for paths inside it.
 */
class TempTree
{
public:
  explicit TempTree(std::string_view prefix)
  {
    static std::atomic<int> counter{0};
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    const std::filesystem::path dir =
      std::filesystem::temp_directory_path() /
      (std::string(prefix) + "_" + std::to_string(now) + "_" + std::to_string(counter++));
    std::filesystem::create_directories(dir);
    root_ = std::filesystem::canonical(dir);
  }

  ~TempTree()
  {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  TempTree(const TempTree &) = delete;
  TempTree & operator=(const TempTree &) = delete;

  [[nodiscard]] const std::filesystem::path & root() const noexcept { return root_; }

  /// Absolute path of `rel` inside the tree (not created).
  [[nodiscard]] std::string path(std::string_view rel = {}) const
  {
    if (rel.empty()) {
      return root_.string();
    }
    return (root_ / std::filesystem::path(rel)).string();
  }

  /// Create a directory (and parents); returns its path.
  std::string dir(std::string_view rel) const
  {
    const std::string p = path(rel);
    std::filesystem::create_directories(p);
    return p;
  }

  /// Create a file (and parent directories); returns its path.
  std::string file(std::string_view rel, std::string_view content = {}) const
  {
    const std::filesystem::path p = path(rel);
    std::filesystem::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary);
    out << content;
    return p.string();
  }

private:
  std::filesystem::path root_;
};

}  // namespace workroot::test_support
