/* Copyright 2026 The contracer Authors, all rights reserved. */

#include "contracer/arch/x86/taint.h"

namespace contracer {
namespace arch {

X86TaintTracker::X86TaintTracker(bool observe_pc, bool observe_addresses,
                                 Addr sandbox_base)
    : model::TaintTracker(observe_pc, observe_addresses, sandbox_base) {}

X86TaintTracker::~X86TaintTracker(void) {}

int X86TaintTracker::InputIndex(Reg reg) const {
  return InputRegisterIndex(reg);
}

}  // namespace arch
}  // namespace contracer
