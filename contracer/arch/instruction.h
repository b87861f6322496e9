/* Copyright 2026 The contracer Authors, all rights reserved. */

#ifndef CONTRACER_ARCH_INSTRUCTION_H_
#define CONTRACER_ARCH_INSTRUCTION_H_

#include "contracer/arch/x86/instruction.h"

#endif  // CONTRACER_ARCH_INSTRUCTION_H_
