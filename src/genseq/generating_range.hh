#pragma once

#include <genseq/assert.hh>
#include <genseq/fwd.hh>
#include <genseq/optional.hh>
#include <genseq/utility.hh>

#include <iterator> // std::input_iterator_tag
#include <type_traits>

// -----------------------------------------------------------------------------
// generating ranges – production protocol
// -----------------------------------------------------------------------------
//
// A generating range is the pair (initial producer, successor function):
//   initial()          -> T | optional<T>
//   successor(T const&) -> optional<T>   (nullopt ends the sequence)
//
// The range itself is only a description. Nothing is evaluated until a traversal advances:
//   - constructing the range calls nothing
//   - traverse() / begin() call nothing
//   - the 1st advance calls initial() exactly once
//   - every later advance calls successor(current) exactly once
//   - once a step yields "no value", the traversal is terminated for good
//
// Traversals are independent: each holds its own current value and state, so the same
// range can be walked any number of times, also interleaved.
// If initial/successor close over external mutable state (e.g. a live parent pointer),
// each traversal observes that state at the time it advances. There is no snapshot.
//
// Only the current value is retained. A traversal over an unbounded chain needs O(1) memory,
// but anything requiring the end (count, last, to_vector, ...) never returns for it.
//
// Pointer element types may use the null pointer as termination marker instead of optional:
//   successor = [](node const* n) { return n->parent; }
// A null pointer can then never be a real element.
//
// Exceptions thrown by initial or successor propagate unchanged out of advance().
// The traversal is terminated afterwards: advance() returns false, current() is a usage error.

/// Lifecycle of a single traversal
/// not_started -> active -> ... -> active -> terminated
/// not_started -> terminated (initial producer yielded no value)
enum class gs::traversal_state
{
    // no advance yet, neither function has been called
    not_started,
    // current() is valid
    active,
    // end reached, sticky
    terminated,
};

namespace gs::impl
{
// the element type is whatever the initial producer yields, minus a wrapping optional
template <class R>
struct generated_element
{
    using type = R;
};
template <class T>
struct generated_element<gs::optional<T>>
{
    using type = T;
};
template <class R>
using generated_element_t = typename generated_element<std::remove_cvref_t<R>>::type;

// normalizes a producer/successor result into a step: value or nullopt
template <class T, class R>
gs::optional<T> to_step(R&& result)
{
    using result_t = std::remove_cvref_t<R>;

    if constexpr (std::is_same_v<result_t, gs::nullopt_t>)
    {
        return gs::nullopt;
    }
    else if constexpr (impl::is_optional<result_t>)
    {
        if (!result.has_value())
            return gs::nullopt;
        return gs::optional<T>(gs::forward<R>(result).value());
    }
    else if constexpr (std::is_pointer_v<T>)
    {
        static_assert(std::is_convertible_v<R, T>, "successor must return the element pointer type or optional");
        T const ptr = result;
        if (ptr == nullptr)
            return gs::nullopt;
        return ptr;
    }
    else
    {
        // never terminates on its own
        static_assert(std::is_constructible_v<T, R>, "successor must return the element type or optional of it");
        return gs::optional<T>(gs::forward<R>(result));
    }
}
} // namespace gs::impl

/// The restartable description of a generated sequence
/// Holds the initial producer and the successor function and never mutates either:
/// both are only invoked through const access, so they must be const-callable.
/// (They can still refer to external mutable state via references or pointers.)
/// Traversals refer back to their range, the range must outlive them.
template <class InitF, class NextF>
struct gs::generating_range
{
public:
    static_assert(gs::is_invocable<InitF const&>, "initial producer must be callable with no arguments (and const)");

    using element_t = impl::generated_element_t<gs::invoke_result_t<InitF const&>>;

    static_assert(!std::is_same_v<element_t, gs::nullopt_t>, "initial producer must yield a typed value");
    static_assert(!std::is_void_v<element_t>, "initial producer must not return void");
    static_assert(gs::is_invocable<NextF const&, element_t const&>,
                  "successor must be callable with the current element (and const)");

    using cursor = gs::generating_cursor<generating_range>;
    using iterator = gs::generating_iterator<generating_range>;

    // traversal
public:
    /// a fresh traversal in state not_started
    /// does not call any function
    [[nodiscard]] cursor traverse() const { return cursor(*this); }

    /// input iterator over a fresh traversal, see generating_iterator
    [[nodiscard]] iterator begin() const { return iterator(this->traverse()); }
    [[nodiscard]] gs::sentinel end() const { return {}; }

    // production
    // (called by the cursor, exactly once per position)
public:
    [[nodiscard]] gs::optional<element_t> produce_initial() const
    {
        return impl::to_step<element_t>(gs::invoke(_initial));
    }

    [[nodiscard]] gs::optional<element_t> produce_successor(element_t const& current) const
    {
        return impl::to_step<element_t>(gs::invoke(_next, current));
    }

    // ctors
public:
    generating_range(InitF initial, NextF next) : _initial(gs::move(initial)), _next(gs::move(next)) {}

private:
    InitF _initial;
    NextF _next;
};

/// One traversal of a generating range (a cursor)
/// Explicit protocol:
///
///   auto c = range.traverse();
///   while (c.advance())
///       use(c.current());
///
/// Copying a cursor forks the traversal: both copies continue independently from the same position.
template <class RangeT>
struct gs::generating_cursor
{
public:
    using element_t = typename RangeT::element_t;

    // protocol
public:
    /// moves to the next position and returns true iff a value is available
    /// the first call invokes the initial producer, later calls invoke the successor
    /// returns false without calling anything once terminated
    /// if initial or successor throws, the exception propagates and the traversal is terminated
    bool advance()
    {
        switch (_state)
        {
        case gs::traversal_state::terminated:
            return false;

        // terminated until the call returns: a throwing producer ends the traversal for good
        case gs::traversal_state::not_started:
            _state = gs::traversal_state::terminated;
            _current = _range->produce_initial();
            break;

        case gs::traversal_state::active:
            _state = gs::traversal_state::terminated;
            _current = _range->produce_successor(_current.value());
            break;
        }

        _state = _current.has_value() ? gs::traversal_state::active : gs::traversal_state::terminated;
        return _state == gs::traversal_state::active;
    }

    /// the value at the current position
    /// reading before the first advance() or after termination is a usage error
    [[nodiscard]] element_t const& current() const
    {
        GS_ASSERT_ALWAYS(_state != gs::traversal_state::not_started, "no current value: advance() was never called");
        GS_ASSERT_ALWAYS(_state != gs::traversal_state::terminated, "no current value: traversal already terminated");
        return _current.value();
    }

    [[nodiscard]] gs::traversal_state state() const { return _state; }
    [[nodiscard]] bool is_started() const { return _state != gs::traversal_state::not_started; }
    [[nodiscard]] bool is_active() const { return _state == gs::traversal_state::active; }
    [[nodiscard]] bool is_terminated() const { return _state == gs::traversal_state::terminated; }

    // ctors
public:
    /// an already terminated cursor that belongs to no range
    generating_cursor() = default;

    explicit generating_cursor(RangeT const& range) : _range(&range), _state(gs::traversal_state::not_started) {}

private:
    RangeT const* _range = nullptr;
    // engaged if _state == active (may keep a stale value after a throwing producer)
    gs::optional<element_t> _current;
    gs::traversal_state _state = gs::traversal_state::terminated;
};

/// Input iterator adapter for range-for and std::ranges
/// Advancing is deferred: the cursor only advances when the iterator is compared or dereferenced
/// after construction or ++. Thus begin() calls nothing and breaking out of a loop after
/// reading an element never evaluates the successor of that element.
template <class RangeT>
struct gs::generating_iterator
{
public:
    using value_type = typename RangeT::element_t;
    using difference_type = gs::isize;
    using iterator_concept = std::input_iterator_tag;

public:
    [[nodiscard]] value_type const& operator*() const
    {
        sync();
        return _cursor.current();
    }

    [[nodiscard]] value_type const* operator->() const { return &**this; }

    generating_iterator& operator++()
    {
        sync();
        _pending_advance = true;
        return *this;
    }

    void operator++(int) { ++*this; }

    [[nodiscard]] bool operator==(gs::sentinel) const
    {
        sync();
        return _cursor.is_terminated();
    }

    /// the underlying traversal, without triggering a pending advance
    [[nodiscard]] gs::generating_cursor<RangeT> const& cursor() const { return _cursor; }

public:
    generating_iterator() = default;
    explicit generating_iterator(gs::generating_cursor<RangeT> traversal)
      : _cursor(gs::move(traversal)), _pending_advance(!_cursor.is_terminated())
    {
    }

private:
    void sync() const
    {
        if (_pending_advance)
        {
            _pending_advance = false;
            _cursor.advance();
        }
    }

    // mutable: comparison and dereference perform the deferred advance
    mutable gs::generating_cursor<RangeT> _cursor;
    mutable bool _pending_advance = false;
};
