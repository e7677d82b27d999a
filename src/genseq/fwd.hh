#pragma once

#include <cstddef>
#include <cstdint>


namespace gs
{

//
// Primitives
//

using i64 = int64_t;

// signed size type
// Sizes, counts and indices are signed: "count - 1" on an empty sequence must not wrap around.
using isize = i64;

//
// Step type
//

struct nullopt_t;
template <class T>
struct optional;

//
// Sequences
//

enum class sequence_fold_result;
template <class RangeT>
struct sequence;

enum class traversal_state;
template <class InitF, class NextF>
struct generating_range;
template <class RangeT>
struct generating_cursor;
template <class RangeT>
struct generating_iterator;

} // namespace gs
