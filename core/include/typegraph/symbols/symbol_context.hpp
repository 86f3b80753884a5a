// typegraph/symbols/symbol_context.hpp - Symbol arena allocator and string pool
//
// SymbolContext owns every symbol, attribute record and interned string
// of one loaded symbol graph.
//
// Uses std::pmr::monotonic_buffer_resource for arena allocation.
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

namespace typegraph
{

class Symbol;

// ============================================================================
// SymbolContext - PMR Arena Allocator and String Pool
// ============================================================================

/**
 * Context that owns all symbols and interned strings using PMR.
 *
 * Everything created through this context is valid as long as the context
 * is alive. There is no individual deallocation.
 *
 * Example:
 * @code
 *   SymbolContext ctx;
 *   auto * type = ctx.create<NamedTypeSymbol>();
 *   type->name = ctx.intern("List");
 * @endcode
 */
class SymbolContext
{
public:
  /// Default initial buffer size (64KB)
  static constexpr size_t k_default_buffer_size = size_t{64} * size_t{1024};

  explicit SymbolContext(size_t initialBufferSize = k_default_buffer_size)
  : arena_(initialBufferSize), stringPool_(&arena_)
  {
  }

  ~SymbolContext() = default;

  // Non-copyable and non-movable (PMR resources are not movable)
  SymbolContext(const SymbolContext &) = delete;
  SymbolContext & operator=(const SymbolContext &) = delete;
  SymbolContext(SymbolContext &&) = delete;
  SymbolContext & operator=(SymbolContext &&) = delete;

  // ===========================================================================
  // Symbol Creation
  // ===========================================================================

  /**
   * Create a new symbol of type T in the arena.
   *
   * @return Non-owning pointer, valid until the context is destroyed
   */
  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<Symbol, T>, "T must derive from Symbol");
    return emplace<T>(std::forward<Args>(args)...);
  }

  /**
   * Create a plain arena value (attribute constants and the like).
   */
  template <typename T, typename... Args>
  T * create_value(Args &&... args)
  {
    return emplace<T>(std::forward<Args>(args)...);
  }

  // ===========================================================================
  // String Interning
  // ===========================================================================

  /**
   * Intern a string and return a stable string_view.
   *
   * The returned view is valid as long as the context is alive.
   */
  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    auto it = stringPool_.find(s);
    if (it != stringPool_.end()) {
      return *it;
    }

    char * const ptr = static_cast<char *>(arena_.allocate(s.size(), 1));
    std::memcpy(ptr, s.data(), s.size());

    const std::string_view stored_view(ptr, s.size());
    stringPool_.insert(stored_view);

    return stored_view;
  }

  // ===========================================================================
  // Array Allocation
  // ===========================================================================

  /**
   * Allocate a value-initialized array of type T from the arena.
   */
  template <typename T>
  [[nodiscard]] gsl::span<T> allocate_array(size_t size)
  {
    if (size == 0) return {};
    T * const ptr = static_cast<T *>(
      arena_.allocate(sizeof(T) * size, alignof(T)));  // NOLINT(bugprone-sizeof-expression)
    std::uninitialized_value_construct_n(ptr, size);
    return gsl::span<T>(ptr, size);
  }

  /**
   * Copy elements from a vector to an arena-allocated array.
   */
  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & vec)
  {
    auto span = allocate_array<T>(vec.size());
    std::copy(vec.begin(), vec.end(), span.begin());
    return span;
  }

  [[nodiscard]] size_t get_string_count() const noexcept { return stringPool_.size(); }

private:
  template <typename T, typename... Args>
  T * emplace(Args &&... args)
  {
    static_assert(
      std::is_trivially_destructible_v<T>,
      "Arena values must be trivially destructible! "
      "Use std::string_view instead of std::string, gsl::span instead of std::vector.");

    void * const mem = arena_.allocate(sizeof(T), alignof(T));
    return new (mem) T(std::forward<Args>(args)...);
  }

  /// Arena allocator - memory is freed only when destroyed
  std::pmr::monotonic_buffer_resource arena_;

  /// Interned strings - keys are string_views pointing to arena memory
  std::pmr::unordered_set<std::string_view> stringPool_;
};

}  // namespace typegraph
