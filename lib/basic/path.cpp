// workroot/basic/path.cpp - Filesystem path primitives
//
#include "workroot/basic/path.hpp"

#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace workroot::path
{

namespace
{

bool is_not_found(const std::error_code & ec)
{
  return ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory;
}

FileKind kind_of(const fs::file_status & st)
{
  switch (st.type()) {
    case fs::file_type::regular:
      return FileKind::File;
    case fs::file_type::directory:
      return FileKind::Directory;
    case fs::file_type::not_found:
    case fs::file_type::none:
      return FileKind::None;
    default:
      return FileKind::Other;
  }
}

}  // namespace

// ============================================================================
// Existence
// ============================================================================

FileKind exists(const std::string & path, std::error_code & ec) noexcept
{
  ec.clear();
  if (path.empty()) {
    return FileKind::None;
  }

  const fs::file_status st = fs::status(path, ec);
  if (st.type() == fs::file_type::not_found || (ec && is_not_found(ec))) {
    ec.clear();
    return FileKind::None;
  }
  if (ec) {
    return FileKind::None;
  }
  return kind_of(st);
}

FileKind exists(const std::string & path)
{
  std::error_code ec;
  const FileKind kind = exists(path, ec);
  if (ec) {
    throw fs::filesystem_error("cannot stat path", fs::path(path), ec);
  }
  return kind;
}

bool is_dir(const std::string & path) { return exists(path) == FileKind::Directory; }

bool is_file(const std::string & path) { return exists(path) == FileKind::File; }

// ============================================================================
// Path Strings
// ============================================================================

bool is_fs_root(std::string_view path) noexcept
{
#ifdef _WIN32
  if (path.size() == 1 && path[0] == k_separator) {
    return true;
  }
  return path.size() == 2 && std::isalpha(static_cast<unsigned char>(path[0])) != 0 &&
         path[1] == ':';
#else
  return path.size() == 1 && path[0] == k_separator;
#endif
}

std::string root_path() { return std::string(1, k_separator); }

std::string dirname(const std::string & path)
{
  std::string_view rest = path;
  if (!rest.empty() && rest.back() == k_separator) {
    rest.remove_suffix(1);
  }

  const auto sep = rest.rfind(k_separator);
  if (sep == std::string_view::npos) {
    return root_path();
  }
  rest = rest.substr(0, sep);
  if (rest.empty()) {
    return root_path();
  }
  return std::string(rest);
}

std::string dirname(const char * path) { return dirname(std::string(path)); }

std::optional<std::string> dirname(const std::optional<std::string> & path)
{
  if (!path) {
    return std::nullopt;
  }
  return dirname(*path);
}

std::string join_parts(const std::vector<std::string> & parts)
{
  std::string joined;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      joined.push_back(k_separator);
    }
    joined += parts[i];
  }

  std::string out;
  out.reserve(joined.size());
  for (const char c : joined) {
    if (c == k_separator && !out.empty() && out.back() == k_separator) {
      continue;
    }
    out.push_back(c);
  }
  return out;
}

// ============================================================================
// Resolution
// ============================================================================

std::optional<std::string> real_path(const std::string & path)
{
  if (path.empty()) {
    return std::nullopt;
  }

  std::error_code ec;
  const fs::path resolved = fs::canonical(path, ec);
  if (ec) {
    if (is_not_found(ec)) {
      return std::nullopt;
    }
    throw fs::filesystem_error("cannot resolve real path", fs::path(path), ec);
  }
  return resolved.string();
}

// ============================================================================
// Traversal
// ============================================================================

std::optional<TraversalHit> traverse_parents(
  const std::string & path, const ParentVisitor & visit)
{
  const auto resolved = real_path(path);
  if (!resolved) {
    return std::nullopt;
  }

  std::optional<std::string> dir = resolved;
  for (int i = 0; i < k_max_parent_ascents; ++i) {
    dir = dirname(dir);
    if (!dir) {
      return std::nullopt;
    }
    if (visit(*dir, *resolved)) {
      return TraversalHit{*dir, *resolved};
    }
    if (is_fs_root(*dir)) {
      break;
    }
  }
  return std::nullopt;
}

ParentRange::ParentRange(const std::string & start)
{
  if (auto resolved = real_path(start)) {
    resolved_ = std::move(*resolved);
  }
}

ParentRange::iterator ParentRange::begin()
{
  if (!started_) {
    started_ = true;
    current_ = resolved_;
    if (current_.empty()) {
      done_ = true;
    } else {
      advance();
    }
  }
  return iterator(this);
}

void ParentRange::advance()
{
  if (done_) {
    return;
  }
  if (is_fs_root(current_) || steps_ >= k_max_parent_ascents) {
    done_ = true;
    return;
  }

  std::string next = dirname(current_);
  if (is_fs_root(next)) {
    done_ = true;
    return;
  }
  current_ = std::move(next);
  ++steps_;
}

ParentRange iterate_parents(const std::string & path) { return ParentRange(path); }

}  // namespace workroot::path
