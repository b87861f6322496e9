/* Copyright 2026 The contracer Authors, all rights reserved. */

#ifndef CONTRACER_BASE_BREAKPOINT_H_
#define CONTRACER_BASE_BREAKPOINT_H_

extern "C" {

// Note: Not marked as no-return so that compile won't warn us when we actually
//       have some kind of "backup" case in the event of the assertion.
void contracer_unreachable(const char *cond, const char *loc);

// Like `contracer_unreachable`, but for code paths whose semantics are known
// to be missing rather than believed to be impossible.
[[noreturn]] void contracer_unimplemented(const char *what, const char *loc);

}  // extern C

#endif  // CONTRACER_BASE_BREAKPOINT_H_
