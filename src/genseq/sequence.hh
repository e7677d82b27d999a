#pragma once

#include <genseq/assert.hh>
#include <genseq/fwd.hh>
#include <genseq/optional.hh>
#include <genseq/utility.hh>

#include <type_traits>
#include <utility> // std::declval
#include <vector>

// -----------------------------------------------------------------------------
// gs::sequence – reduction model, condensed
// -----------------------------------------------------------------------------

// 1) External iteration (range-for / begin-end) is the universal basis.
//    Every wrapped range provides it, generating ranges included.

// 2) The core primitive is an early-outable fold.
//    No wrapper types; control flow is expressed directly in C++.

// 3) try_fold(step) -> sequence_fold_result
//    - step(idx?, elem) -> bool (true = early stop) or void (never stops)
//    - returns enum { empty, stopped, completed }

// 4) fold_first(init, step) -> optional<State>
//    - init(idx?, first_elem) creates the state from the first element
//    - step(idx?, state&, elem) -> bool/void updates it
//    - empty sequence -> nullopt

// 5) All reductions (count/any/all/first/last/index_of/...) are implemented in terms of these.

// 6) Every reduction starts a fresh pass over the range.
//    For generating ranges that means a fresh traversal: initial producer first, then successors.
//    Early-out reductions (first, any, all, index_of, contains, is_empty) stop evaluating
//    as soon as the result is known.

// 7) Reductions that need the end (count, last, accumulate, to_container, ...) never return
//    on an infinite range. Detecting this is the caller's job.

// tri-state result of a try_fold operation
enum class gs::sequence_fold_result
{
    // sequence is empty
    empty,
    // step function returned true, fold was stopped
    stopped,
    // step function never returned true, sequence was fully traversed
    completed,
};

// a lazy forward sequence with functional reductions on top of a simple underlying range
// the range only needs begin() const / end() const
// since ranges are restartable descriptions here, every reduction is const and repeatable
//
// important design decisions:
// - sequence is the rich-api layer, the range stays minimal
// - elements are handed to callbacks as const references that are only valid during the call
//   (a generating range only holds its current element)
// - NOT copyable or movable, factory results rely on guaranteed copy elision
// - these sequences _can_ be infinite!
template <class RangeT>
struct gs::sequence
{
private:
    // the underlying range we consume from
    RangeT _range;

    //
    // traits & typedefs
    //
public:
    // value type for the elements
    // e.g. generating range of "node const*" -> node const*
    using element_t = std::remove_cvref_t<decltype(*gs::begin(std::declval<RangeT const&>()))>;

    using range_t = RangeT;

    //
    // reductions
    // (structure-consuming, value-producing)
    //
public:
    [[nodiscard]] isize count() const
    {
        return this->accumulate( //
            isize(0),            //
            [](isize& cnt, auto const&) { ++cnt; });
    }

    [[nodiscard]] isize count_if(auto&& predicate) const
    {
        return this->accumulate( //
            isize(0),
            [&predicate](isize idx, isize& cnt, auto const& elem)
            {
                if (gs::invoke_with_optional_idx(idx, predicate, elem))
                    ++cnt;
            });
    }

    // only evaluates the first element (for generating ranges: only the initial producer)
    [[nodiscard]] bool is_empty() const
    {
        return this->try_fold([](auto const&) { return true; }) == sequence_fold_result::empty;
    }

    [[nodiscard]] bool any(auto&& predicate) const
    {
        return this->try_fold([&](isize idx, auto const& elem)
                              { return bool(gs::invoke_with_optional_idx(idx, predicate, elem)); })
            == sequence_fold_result::stopped; // stopped => we found one with "true", so any is true
    }

    [[nodiscard]] bool all(auto&& predicate) const
    {
        return this->try_fold([&](isize idx, auto const& elem)
                              { return !bool(gs::invoke_with_optional_idx(idx, predicate, elem)); })
            != sequence_fold_result::stopped; // stopped => we found one with "false", so all is false
    }

    [[nodiscard]] bool contains(auto const& value) const
    {
        return this->any([&](auto const& elem) { return bool(elem == value); });
    }

    [[nodiscard]] gs::optional<isize> index_of(auto&& predicate) const
    {
        gs::optional<isize> result;
        this->try_fold(
            [&](isize idx, auto const& elem)
            {
                if (gs::invoke_with_optional_idx(idx, predicate, elem))
                {
                    result = idx;
                    return true; // stop
                }
                else
                    return false;
            });
        return result;
    }

    [[nodiscard]] gs::optional<element_t> first() const
    {
        gs::optional<element_t> result;
        this->try_fold(
            [&](auto const& elem)
            {
                result.emplace(elem);
                return true; // stop
            });
        return result;
    }

    [[nodiscard]] gs::optional<element_t> last() const
    {
        return this->fold_first([](auto const& elem) { return element_t(elem); },
                                [](element_t& state, auto const& elem) { state = elem; });
    }

    // apply : (idx?, accum&, elem)
    [[nodiscard]] auto accumulate(auto init, auto&& apply) const
    {
        this->try_fold([&](isize idx, auto const& elem) { gs::invoke_with_optional_idx(idx, apply, init, elem); });
        return init;
    }

    // calls fun on each element (optional with index first)
    void each(auto&& fun) const
    {
        this->try_fold([&](isize idx, auto const& elem) { gs::invoke_with_optional_idx(idx, fun, elem); });
    }

    //
    // materialization
    // (terminal, produces owning containers)
    //
public:
    template <class ContainerT>
    [[nodiscard]] ContainerT to_container() const
    {
        static_assert(sizeof(ContainerT) > 0, "ContainerT must be complete (did you forget to include its header?)");

        ContainerT container;
        this->push_to(container);
        return container;
    }

    // map : (idx?, elem) -> container value
    template <class ContainerT>
    [[nodiscard]] ContainerT to_container(auto&& map) const
    {
        static_assert(sizeof(ContainerT) > 0, "ContainerT must be complete (did you forget to include its header?)");

        ContainerT container;
        this->each([&](isize idx, auto const& elem)
                   { container.push_back(gs::invoke_with_optional_idx(idx, map, elem)); });
        return container;
    }

    [[nodiscard]] std::vector<element_t> to_vector() const { return this->to_container<std::vector<element_t>>(); }

    // appends all elements to an existing container
    void push_to(auto& container) const
    {
        this->each([&](auto const& elem) { container.push_back(elem); });
    }

    //
    // operational basis
    // i.e. all reductions are implemented in terms of these
    //
public:
    // step : (idx?, elem) -> bool/void
    // if step returns true, we early-out of the fold
    sequence_fold_result try_fold(auto&& step) const
    {
        auto it = gs::begin(_range);
        auto const end = gs::end(_range);

        if (it == end)
            return sequence_fold_result::empty;

        isize idx = 0;

        do
        {
            auto res = gs::regular_invoke_with_optional_idx(idx, step, *it);
            if constexpr (!std::is_same_v<decltype(res), gs::unit>)
                if (res)
                    return sequence_fold_result::stopped;

            idx++;
            ++it;
        } while (it != end);

        return sequence_fold_result::completed;
    }

    // init : (idx?, first elem) -> State
    // step : (idx?, State&, elem) -> bool/void, true stops the fold
    // returns the final state or nullopt for an empty sequence
    template <class InitF, class StepF>
    [[nodiscard]] auto fold_first(InitF&& init, StepF&& step) const
    {
        using state_t = std::remove_cvref_t<decltype(gs::invoke_with_optional_idx(isize(0), init, std::declval<element_t const&>()))>;

        gs::optional<state_t> state;
        this->try_fold(
            [&](isize idx, auto const& elem)
            {
                if (!state.has_value())
                {
                    state.emplace(gs::invoke_with_optional_idx(idx, init, elem));
                    return false;
                }

                auto res = gs::regular_invoke_with_optional_idx(idx, step, state.value(), elem);
                if constexpr (std::is_same_v<decltype(res), gs::unit>)
                    return false;
                else
                    return bool(res);
            });
        return state;
    }

    //
    // range access
    //
public:
    // iteration over the wrapped range, each begin() is a fresh pass
    [[nodiscard]] auto begin() const { return gs::begin(_range); }
    [[nodiscard]] auto end() const { return gs::end(_range); }

    // the wrapped range, e.g. for the explicit traverse()/advance()/current() protocol
    [[nodiscard]] RangeT const& range() const { return _range; }

    //
    // ctors, fringe api
    //
public:
    explicit sequence(RangeT range) : _range(gs::move(range)) {}

    // non-moveable, non-copyable
    sequence(sequence&&) = delete;
    sequence(sequence const&) = delete;
    sequence& operator=(sequence&&) = delete;
    sequence& operator=(sequence const&) = delete;
    ~sequence() = default;
};
