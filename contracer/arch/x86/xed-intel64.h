/* Copyright 2026 The contracer Authors, all rights reserved. */

#ifndef CONTRACER_ARCH_X86_XED_INTEL64_H_
#define CONTRACER_ARCH_X86_XED_INTEL64_H_

#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wsign-conversion"
#pragma clang diagnostic ignored "-Wconversion"
#pragma clang diagnostic ignored "-Wold-style-cast"
#pragma clang diagnostic ignored "-Wdocumentation"
#pragma clang diagnostic ignored "-Wswitch-enum"
extern "C" {
#include <xed/xed-interface.h>
}  // extern C
#pragma clang diagnostic pop

#endif  // CONTRACER_ARCH_X86_XED_INTEL64_H_
