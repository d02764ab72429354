// purets/ast/ast_context.hpp - AST arena allocator and string pool
//
// This header provides the AstContext class which owns all AST nodes
// and interned strings of one parsed file.
//
// Uses std::pmr::monotonic_buffer_resource for arena allocation.
//
#pragma once

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

namespace purets
{

class AstNode;

// ============================================================================
// AstContext - PMR Arena Allocator and String Pool
// ============================================================================

/**
 * Context that owns all AST nodes and interned strings using PMR.
 *
 * All AST nodes created through this context are valid as long as the
 * context is alive. Memory is released all at once when the context is
 * destroyed; nodes must therefore be trivially destructible.
 *
 * Example:
 * @code
 *   AstContext ctx;
 *   auto * id = ctx.create<IdentifierExpr>(ctx.intern("foo"), range);
 * @endcode
 */
class AstContext
{
public:
  /// Default initial buffer size (64KB)
  static constexpr size_t k_default_buffer_size = size_t{64} * size_t{1024};

  explicit AstContext(size_t initialBufferSize = k_default_buffer_size)
  : arena_(initialBufferSize), stringPool_(&arena_)
  {
  }

  ~AstContext() = default;

  // Non-copyable and non-movable (PMR resources are not movable)
  AstContext(const AstContext &) = delete;
  AstContext & operator=(const AstContext &) = delete;
  AstContext(AstContext &&) = delete;
  AstContext & operator=(AstContext &&) = delete;

  // ===========================================================================
  // Node Creation
  // ===========================================================================

  /**
   * Create a new AST node of type T in the arena.
   *
   * @return Non-owning pointer valid for the lifetime of the context
   */
  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<AstNode, T>, "T must derive from AstNode");

    static_assert(
      std::is_trivially_destructible_v<T>,
      "AST Node must be trivially destructible to be managed by Arena! "
      "Use std::string_view instead of std::string, gsl::span instead of std::vector.");

    void * const mem = arena_.allocate(sizeof(T), alignof(T));
    return new (mem) T(std::forward<Args>(args)...);
  }

  // ===========================================================================
  // String Interning
  // ===========================================================================

  /**
   * Intern a string and return a stable string_view.
   *
   * Views into the source buffer do not need interning; this is for text
   * the parser synthesizes (decoded string literals, dotted type names).
   */
  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    auto it = stringPool_.find(s);
    if (it != stringPool_.end()) {
      return *it;
    }

    char * const ptr = static_cast<char *>(arena_.allocate(s.empty() ? 1 : s.size(), 1));
    std::memcpy(ptr, s.data(), s.size());

    const std::string_view stored_view(ptr, s.size());
    stringPool_.insert(stored_view);

    return stored_view;
  }

  // ===========================================================================
  // Array Allocation
  // ===========================================================================

  /// Allocate a value-initialized array of T from the arena.
  template <typename T>
  [[nodiscard]] gsl::span<T> allocate_array(size_t size)
  {
    if (size == 0) return {};
    T * const ptr = static_cast<T *>(
      arena_.allocate(sizeof(T) * size, alignof(T)));  // NOLINT(bugprone-sizeof-expression)
    std::uninitialized_value_construct_n(ptr, size);
    return gsl::span<T>(ptr, size);
  }

  /// Copy elements from a vector to an arena-allocated array.
  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & vec)
  {
    auto span = allocate_array<T>(vec.size());
    std::uninitialized_copy(vec.begin(), vec.end(), span.begin());
    return span;
  }

private:
  std::pmr::monotonic_buffer_resource arena_;

  /// Interned strings - keys are string_views pointing to arena memory
  std::pmr::unordered_set<std::string_view> stringPool_;
};

}  // namespace purets
