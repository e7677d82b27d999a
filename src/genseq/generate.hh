#pragma once

#include <genseq/fwd.hh>
#include <genseq/generating_range.hh>
#include <genseq/sequence.hh>
#include <genseq/utility.hh>

#include <type_traits>

namespace gs
{
/// Creates the lazy sequence: initial(), successor(initial()), successor(successor(initial())), ...
/// until the successor yields no value (gs::nullopt, or nullptr for pointer elements).
/// Neither function is called here. Each traversal calls initial() once on its first advance.
///
/// Usage:
///   // 1, 2, 3, 4, 5
///   auto const small = gs::make_generating_sequence(
///       [] { return 1; },
///       [](int x) -> gs::optional<int> { return x < 5 ? gs::optional<int>(x + 1) : gs::nullopt; });
///
///   // this node and all its ancestors, observing the parent pointers at traversal time
///   auto ancestors() const
///   {
///       return gs::make_generating_sequence([this] { return this; }, &node::parent);
///   }
///
/// Callables are stored by value (decayed) and must be const-callable.
template <class InitF, class NextF>
[[nodiscard]] auto make_generating_sequence(InitF&& initial, NextF&& successor)
{
    using range_t = gs::generating_range<std::decay_t<InitF>, std::decay_t<NextF>>;
    return gs::sequence<range_t>(range_t(gs::forward<InitF>(initial), gs::forward<NextF>(successor)));
}

/// The bare range without the sequence api on top
/// Copyable (if the callables are), e.g. to store it as a member or to hand out independent copies.
template <class InitF, class NextF>
[[nodiscard]] auto make_generating_range(InitF&& initial, NextF&& successor)
{
    return gs::generating_range<std::decay_t<InitF>, std::decay_t<NextF>>(gs::forward<InitF>(initial),
                                                                           gs::forward<NextF>(successor));
}
} // namespace gs
