// workroot/basic/path.hpp - Filesystem path primitives
//
// Existence checks, separator-normalized join/dirname, real-path resolution and
// the two upward traversal primitives used by root discovery.
//
#pragma once

#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

namespace workroot::path
{

// ============================================================================
// Constants
// ============================================================================

#ifdef _WIN32
inline constexpr char k_separator = '\\';
#else
inline constexpr char k_separator = '/';
#endif

/// Upper bound on ascents performed by a single traversal.
inline constexpr int k_max_parent_ascents = 100;

// ============================================================================
// Existence
// ============================================================================

enum class FileKind {
  None,       ///< Nothing at this path
  File,       ///< Regular file
  Directory,  ///< Directory
  Other,      ///< Symlink target of another type, socket, fifo, device...
};

/**
 * Stat a path.
 *
 * A missing path (or a path through a non-directory) is FileKind::None.
 *
 * @throws std::filesystem::filesystem_error for any other stat failure
 */
[[nodiscard]] FileKind exists(const std::string & path);

/**
 * Non-throwing variant. Faults other than "not found" are stored in `ec` and
 * reported as FileKind::None.
 */
[[nodiscard]] FileKind exists(const std::string & path, std::error_code & ec) noexcept;

[[nodiscard]] bool is_dir(const std::string & path);
[[nodiscard]] bool is_file(const std::string & path);

// ============================================================================
// Path Strings
// ============================================================================

/// True for the filesystem root representation: a lone separator, or a bare drive "C:" on Windows.
[[nodiscard]] bool is_fs_root(std::string_view path) noexcept;

/// Representation returned by dirname() when nothing is left (a lone separator).
[[nodiscard]] std::string root_path();

/**
 * Strip one trailing separator, then the final segment.
 *
 * "/a/b/" -> "/a", "/a" -> "/", "/" -> "/".
 */
[[nodiscard]] std::string dirname(const std::string & path);
[[nodiscard]] std::string dirname(const char * path);

/// Absence propagates: dirname(nullopt) is nullopt.
[[nodiscard]] std::optional<std::string> dirname(const std::optional<std::string> & path);

/// Concatenate with the separator and collapse separator runs.
[[nodiscard]] std::string join_parts(const std::vector<std::string> & parts);

namespace detail
{

inline void flatten_into(std::vector<std::string> & out, std::string_view s)
{
  out.emplace_back(s);
}

inline void flatten_into(std::vector<std::string> & out, const std::string & s)
{
  out.push_back(s);
}

inline void flatten_into(std::vector<std::string> & out, const char * s) { out.emplace_back(s); }

template <typename T>
void flatten_into(std::vector<std::string> & out, const std::vector<T> & group)
{
  for (const auto & item : group) {
    flatten_into(out, item);
  }
}

}  // namespace detail

/**
 * Join any mix of strings and (nested) vectors of strings, in argument order.
 *
 *   join("/a/", std::vector<std::string>{"b", "c"}, "d") == "/a/b/c/d"
 */
template <typename... Parts>
[[nodiscard]] std::string join(const Parts &... parts)
{
  std::vector<std::string> flat;
  (detail::flatten_into(flat, parts), ...);
  return join_parts(flat);
}

// ============================================================================
// Resolution
// ============================================================================

/**
 * Resolve to an absolute, symlink-free path.
 *
 * @return nullopt if the path does not exist
 * @throws std::filesystem::filesystem_error for other failures
 */
[[nodiscard]] std::optional<std::string> real_path(const std::string & path);

// ============================================================================
// Traversal
// ============================================================================

/// Visitor for traverse_parents: (candidate_dir, resolved_start) -> accept?
using ParentVisitor = std::function<bool(const std::string &, const std::string &)>;

struct TraversalHit
{
  std::string dir;       ///< Accepted ancestor
  std::string resolved;  ///< Real path of the starting point
};

/**
 * Ascend from the real path of `path`, calling `visit` for each parent.
 *
 * The filesystem root is visited once, then traversal stops. Returns nullopt when
 * nothing accepted, when `path` cannot be resolved, or after k_max_parent_ascents.
 */
[[nodiscard]] std::optional<TraversalHit> traverse_parents(
  const std::string & path, const ParentVisitor & visit);

/**
 * Lazy ancestor sequence.
 *
 * Yields dirname(start), dirname(dirname(start)), ... and ends before the
 * filesystem root would be yielded. Single pass: iterators share the range's
 * cursor, so a ParentRange is exhausted after one walk.
 */
class ParentRange
{
public:
  class iterator
  {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = std::string;
    using difference_type = std::ptrdiff_t;
    using pointer = const std::string *;
    using reference = const std::string &;

    iterator() = default;

    reference operator*() const { return range_->current_; }
    pointer operator->() const { return &range_->current_; }

    iterator & operator++()
    {
      range_->advance();
      return *this;
    }

    void operator++(int) { ++*this; }

    friend bool operator==(const iterator & a, const iterator & b)
    {
      return a.at_end() == b.at_end();
    }
    friend bool operator!=(const iterator & a, const iterator & b) { return !(a == b); }

  private:
    friend class ParentRange;
    explicit iterator(ParentRange * range) : range_(range) {}

    [[nodiscard]] bool at_end() const { return range_ == nullptr || range_->done_; }

    ParentRange * range_ = nullptr;
  };

  /// Resolves `start`; an unresolvable start gives an empty range.
  explicit ParentRange(const std::string & start);

  ParentRange(const ParentRange &) = delete;
  ParentRange & operator=(const ParentRange &) = delete;
  ParentRange(ParentRange &&) = default;
  ParentRange & operator=(ParentRange &&) = default;

  iterator begin();
  iterator end() { return iterator{}; }

  /// Real path of the starting point (empty if it could not be resolved).
  [[nodiscard]] const std::string & resolved() const noexcept { return resolved_; }

  /// Number of ancestors produced so far.
  [[nodiscard]] int steps() const noexcept { return steps_; }

private:
  void advance();

  std::string resolved_;
  std::string current_;
  int steps_ = 0;
  bool started_ = false;
  bool done_ = false;
};

[[nodiscard]] ParentRange iterate_parents(const std::string & path);

}  // namespace workroot::path
