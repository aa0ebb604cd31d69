// dml/model/expr_context.hpp - Arena for expressions and interned strings
//
// Uses std::pmr::monotonic_buffer_resource; expressions are never freed
// individually and must be trivially destructible.
//
#pragma once

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <gsl/span>
#include <memory>
#include <memory_resource>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

#include "dml/model/expr.hpp"

namespace dml
{

class ExprContext
{
public:
  static constexpr size_t k_default_buffer_size = size_t{64} * size_t{1024};

  explicit ExprContext(size_t initial_buffer_size = k_default_buffer_size)
  : arena_(initial_buffer_size), string_pool_(&arena_)
  {
  }

  ExprContext(const ExprContext &) = delete;
  ExprContext & operator=(const ExprContext &) = delete;
  ExprContext(ExprContext &&) = delete;
  ExprContext & operator=(ExprContext &&) = delete;

  /**
   * Create an expression node in the arena.
   *
   * @return Non-owning pointer, valid as long as the context lives
   */
  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<Expr, T>, "T must derive from Expr");
    static_assert(
      std::is_trivially_destructible_v<T>,
      "Expressions must be trivially destructible to live in the arena");

    void * const mem = arena_.allocate(sizeof(T), alignof(T));
    return new (mem) T(std::forward<Args>(args)...);
  }

  /// Intern a string; the returned view stays valid as long as the context.
  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    auto it = string_pool_.find(s);
    if (it != string_pool_.end()) {
      return *it;
    }
    char * const ptr = static_cast<char *>(arena_.allocate(s.size() + 1, 1));
    std::memcpy(ptr, s.data(), s.size());
    ptr[s.size()] = '\0';
    const std::string_view stored(ptr, s.size());
    string_pool_.insert(stored);
    return stored;
  }

  /// Value-initialized array in the arena.
  template <typename T>
  [[nodiscard]] gsl::span<T> allocate_array(size_t size)
  {
    if (size == 0) return {};
    T * const ptr = static_cast<T *>(
      arena_.allocate(sizeof(T) * size, alignof(T)));  // NOLINT(bugprone-sizeof-expression)
    std::uninitialized_value_construct_n(ptr, size);
    return gsl::span<T>(ptr, size);
  }

  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & vec)
  {
    auto span = allocate_array<T>(vec.size());
    std::copy(vec.begin(), vec.end(), span.begin());
    return span;
  }

  // ===========================================================================
  // Convenience builders
  // ===========================================================================

  /// Single-step or multi-step reference built from plain ids.
  RefExpr * make_ref(const std::vector<std::string_view> & ids, SourceLocation loc = {});

  /// Reference already bound to `target` (used for generated references).
  RefExpr * make_bound_ref(
    const std::vector<std::string_view> & ids, NodeId target, SourceLocation loc = {});

  LiteralExpr * make_literal(LiteralKind kind, std::string_view text, SourceLocation loc = {});

private:
  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::unordered_set<std::string_view> string_pool_;
};

// ============================================================================
// Deep copy
// ============================================================================

/**
 * Callback used while cloning: may return a replacement for a reference
 * (or nullptr to copy it unchanged).
 */
class RefRewriter
{
public:
  virtual ~RefRewriter() = default;
  virtual RefExpr * rewrite(const RefExpr & ref) = 0;
};

/**
 * Structurally clone an expression into the same arena. Resolution cells of
 * copied references keep their result; step nodes are copied.
 */
[[nodiscard]] Expr * clone_expr(ExprContext & ctx, const Expr * expr, RefRewriter * rewriter = nullptr);

}  // namespace dml
