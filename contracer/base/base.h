/* Copyright 2026 The contracer Authors, all rights reserved. */

#ifndef CONTRACER_BASE_BASE_H_
#define CONTRACER_BASE_BASE_H_

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>

# define CONTRACER_ASSERT(...) CONTRACER_ASSERT_(__VA_ARGS__)
# define CONTRACER_ASSERT_(...) \
  if (!(__VA_ARGS__)) \
    contracer_unreachable(#__VA_ARGS__, \
                          __FILE__ ":" CONTRACER_TO_STRING(__LINE__))

// Marks a path that is reachable but has no defined semantics. Reaching it
// terminates the process; it never produces a value.
#define CONTRACER_UNIMPLEMENTED(what) \
  contracer_unimplemented(what, __FILE__ ":" CONTRACER_TO_STRING(__LINE__))

// Static branch prediction hint.
#define CONTRACER_UNLIKELY(x) __builtin_expect((x),0)

// Convert a sequence of symbols into a string literal.
#define CONTRACER_TO_STRING__(x) #x
#define CONTRACER_TO_STRING_(x) CONTRACER_TO_STRING__(x)
#define CONTRACER_TO_STRING(x) CONTRACER_TO_STRING_(x)

// Disallow copying of a specific class.
#define CONTRACER_DISALLOW_COPY(cls) \
  cls(const cls &) = delete; \
  cls(const cls &&) = delete

// Disallow assigning of instances of a specific class.
#define CONTRACER_DISALLOW_ASSIGN(cls) \
  void operator=(const cls &) = delete; \
  void operator=(const cls &&) = delete

// Disallow copying and assigning of instances of a specific class.
#define CONTRACER_DISALLOW_COPY_AND_ASSIGN(cls) \
  CONTRACER_DISALLOW_COPY(cls); \
  CONTRACER_DISALLOW_ASSIGN(cls)

#if !defined(__x86_64__) && !defined(__x86_64)
# error "contracer must be compiled as a 64-bit program."
#endif

// Model tracing. Every speculative decision (checkpoint, rollback, skipped
// instruction, injected value) is logged to stderr when `--dbg_model` is set.
#define CONTRACER_MTRACE(...) \
  if (FLAGS_dbg_model) { __VA_ARGS__ }

namespace contracer {

typedef uint64_t Addr;

}  // namespace contracer

#include "contracer/base/breakpoint.h"

#endif  // CONTRACER_BASE_BASE_H_
