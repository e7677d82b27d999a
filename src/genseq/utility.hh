#pragma once

#include <genseq/fwd.hh>
#include <genseq/macros.hh>

#include <cstddef>
#include <type_traits>
#include <utility> // std::declval

// =========================================================================================================
// Utility functions for common operations
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//
// Object lifetime:
//   placement_new               - tag for "new (gs::placement_new, ptr) T(...)"
//   storage_for<T>              - uninitialized, properly aligned storage for a single T
//
// Invocation:
//   invoke(f, args...)                            - calls f, also supports member (function) pointers
//   is_invocable<F, Args...>                      - true iff invoke(f, args...) is well-formed
//   invoke_with_optional_idx(idx, f, args...)     - calls f(idx, args...) if possible, otherwise f(args...)
//   regular_invoke_with_optional_idx(...)         - same but void results are returned as gs::unit
//
// Ranges:
//   begin(range) / end(range)   - member begin/end or array bounds
//   sentinel                    - lightweight end-of-range sentinel type
//

namespace gs
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
/// Usage:
///   T b = gs::move(a);  // move construct b from a
template <class T>
[[nodiscard]] GS_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Perfect forwarding for template arguments
/// Preserves value category (lvalue/rvalue) when forwarding arguments
/// Usage:
///   template<class T>
///   void wrapper(T&& arg) {
///       foo(gs::forward<T>(arg));
///   }
template <class T>
[[nodiscard]] GS_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] GS_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>&& value) noexcept // NOLINT
{
    static_assert(!std::is_lvalue_reference_v<T>, "cannot forward an rvalue as an lvalue");
    return static_cast<T&&>(value);
}

// =========================================================================================================
// Object lifetime
// =========================================================================================================

/// Tag type selecting the genseq placement new overload
/// Avoids including <new> in every header
struct placement_new_tag
{
};
inline constexpr placement_new_tag placement_new = {};

/// Uninitialized storage for a single T
/// The owner decides when .value is alive and is responsible for constructing and destroying it
/// Trivially copyable and destructible iff T is
template <class T>
union storage_for
{
    T value;

    constexpr storage_for() {}

    ~storage_for()
        requires std::is_trivially_destructible_v<T>
    = default;
    ~storage_for()
        requires(!std::is_trivially_destructible_v<T>)
    {
    }
};

// =========================================================================================================
// Invocation
// =========================================================================================================

/// Empty result type standing in for "void" where a value is needed
struct unit
{
};

namespace impl
{
template <class F, class Obj, class... Args>
concept member_function_invocable
    = std::is_member_function_pointer_v<F>
   && (requires(F f, Obj&& obj, Args&&... args) { (gs::forward<Obj>(obj).*f)(gs::forward<Args>(args)...); }
       || requires(F f, Obj&& obj, Args&&... args) { ((*gs::forward<Obj>(obj)).*f)(gs::forward<Args>(args)...); });

template <class F, class Obj>
concept member_object_invocable = std::is_member_object_pointer_v<F>
                               && (requires(F f, Obj&& obj) { gs::forward<Obj>(obj).*f; }
                                   || requires(F f, Obj&& obj) { (*gs::forward<Obj>(obj)).*f; });

// member pointers need an object as first argument
template <class F, class... Args>
constexpr bool is_member_invocable = false;
template <class F, class Obj, class... Args>
constexpr bool is_member_invocable<F, Obj, Args...>
    = member_function_invocable<F, Obj, Args...> || (sizeof...(Args) == 0 && member_object_invocable<F, Obj>);

template <class F, class Obj, class... Args>
constexpr decltype(auto) invoke_member(F f, Obj&& obj, Args&&... args)
{
    if constexpr (std::is_member_function_pointer_v<F>)
    {
        if constexpr (requires { (gs::forward<Obj>(obj).*f)(gs::forward<Args>(args)...); })
            return (gs::forward<Obj>(obj).*f)(gs::forward<Args>(args)...);
        else
            return ((*gs::forward<Obj>(obj)).*f)(gs::forward<Args>(args)...);
    }
    else
    {
        if constexpr (requires { gs::forward<Obj>(obj).*f; })
            return (gs::forward<Obj>(obj).*f);
        else
            return ((*gs::forward<Obj>(obj)).*f);
    }
}
} // namespace impl

/// True iff gs::invoke(f, args...) is well-formed
template <class F, class... Args>
concept is_invocable = requires(F&& f, Args&&... args) { gs::forward<F>(f)(gs::forward<Args>(args)...); }
                    || impl::is_member_invocable<std::remove_cvref_t<F>, Args...>;

/// Calls f with args
/// Supports regular callables, pointer-to-member-functions and pointer-to-member-objects
/// Member pointers accept the object by reference or anything dereferenceable (raw and smart pointers)
/// Usage:
///   gs::invoke(fn, 1, 2);
///   gs::invoke(&node::parent, node_ptr);   // node_ptr->parent
template <class F, class... Args>
    requires is_invocable<F, Args...>
constexpr decltype(auto) invoke(F&& f, Args&&... args)
{
    if constexpr (std::is_member_pointer_v<std::remove_cvref_t<F>>)
        return impl::invoke_member(f, gs::forward<Args>(args)...);
    else
        return gs::forward<F>(f)(gs::forward<Args>(args)...);
}

template <class F, class... Args>
using invoke_result_t = decltype(gs::invoke(std::declval<F>(), std::declval<Args>()...));

/// Calls f(idx, args...) if that is well-formed, otherwise f(args...)
/// Lets reductions offer the element index without forcing every callback to take it
template <class F, class... Args>
constexpr decltype(auto) invoke_with_optional_idx(isize idx, F&& f, Args&&... args)
{
    if constexpr (is_invocable<F&, isize, Args...>)
        return gs::invoke(f, idx, gs::forward<Args>(args)...);
    else
        return gs::invoke(f, gs::forward<Args>(args)...);
}

/// Same as invoke_with_optional_idx but maps a void result to gs::unit
/// so that callers can always store the result
template <class F, class... Args>
constexpr decltype(auto) regular_invoke_with_optional_idx(isize idx, F&& f, Args&&... args)
{
    using R = decltype(gs::invoke_with_optional_idx(idx, f, gs::forward<Args>(args)...));
    if constexpr (std::is_void_v<R>)
    {
        gs::invoke_with_optional_idx(idx, f, gs::forward<Args>(args)...);
        return unit{};
    }
    else
        return gs::invoke_with_optional_idx(idx, f, gs::forward<Args>(args)...);
}

// =========================================================================================================
// Ranges
// =========================================================================================================

template <class Range>
[[nodiscard]] constexpr auto begin(Range&& range)
{
    if constexpr (std::is_array_v<std::remove_reference_t<Range>>)
        return range + 0;
    else
        return range.begin();
}

template <class Range>
[[nodiscard]] constexpr auto end(Range&& range)
{
    if constexpr (std::is_array_v<std::remove_reference_t<Range>>)
        return range + std::extent_v<std::remove_reference_t<Range>>;
    else
        return range.end();
}

/// A generic end-of-range sentinel type
/// Used as a lightweight alternative to a full iterator for range end
/// Usage:
///   struct my_range {
///       my_iterator begin() const { return ...; }
///       gs::sentinel end() const { return {}; }
///   };
///   struct my_iterator {
///       bool operator==(gs::sentinel) const { return is_exhausted(); }
///       // ... other iterator operations ...
///   };
struct sentinel
{
};
} // namespace gs

/// Placement new with a dedicated tag, see gs::placement_new
inline void* operator new(std::size_t, gs::placement_new_tag, void* buffer) noexcept
{
    return buffer;
}
inline void operator delete(void*, gs::placement_new_tag, void*) noexcept {}
