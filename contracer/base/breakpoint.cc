/* Copyright 2026 The contracer Authors, all rights reserved. */

#include "contracer/base/base.h"

#include <cstdio>
#include <cstdlib>

extern "C" {

#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wmissing-noreturn"
void contracer_unreachable(const char *error, const char *loc) {
  fprintf(stderr, "Assertion failed:\n");
  if (error) {
    fprintf(stderr, "%s\n", error);
  }
  if (loc) {
    fprintf(stderr, "%s\n", loc);
  }
  fflush(stderr);
  exit(EXIT_FAILURE);
}
#pragma clang diagnostic pop

void contracer_unimplemented(const char *what, const char *loc) {
  fprintf(stderr, "Unimplemented: %s\n", what ? what : "(unknown)");
  if (loc) {
    fprintf(stderr, "%s\n", loc);
  }
  fflush(stderr);
  exit(EXIT_FAILURE);
}

}  // extern C
