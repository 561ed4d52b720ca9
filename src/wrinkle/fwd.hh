#pragma once

#include <cstddef>
#include <cstdint>


namespace wr
{

//
// Primitives
//

// Explicitly-sized primitive types
// We use these wherever the range matters for correctness or memory layout.
// Plain "int" is fine for small loop counters and the like.

// signed integers
using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

// unsigned integers
using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

// signed size type
// All sizes, indices and offsets are signed:
// * index arithmetic in this library subtracts a lot (logical - backbone, offsets, residual walks)
//   and "size - 1" must not underflow on an empty list
// * wrinkle offsets are signed by nature, mixing them with unsigned indices invites conversion bugs
// * out-of-range requests such as get(-1) must be reportable as-is instead of wrapping to 2^64 - 1
using isize = i64;

//
// Node chain
//

// handle of a node inside a node_chain
// none is the explicit "no node" marker used for absent head/tail/neighbor links
enum class node_id : isize
{
    none = -1,
};

template <class T>
struct node_chain;

//
// Index translation
//

struct wrinkle;
struct wrinkle_chain;

//
// Sequences
//

template <class T>
struct wrinkle_list;
template <class T>
struct array_sequence;

//
// Errors
//

enum class error_kind;
struct sequence_error;

} // namespace wr
