/* Copyright 2026 The contracer Authors, all rights reserved. */

#ifndef CONTRACER_ARCH_X86_TAINT_H_
#define CONTRACER_ARCH_X86_TAINT_H_

#include "contracer/model/taint.h"

namespace contracer {
namespace arch {

// Taint tracker over the registers that inputs initialize: `RAX`, `RBX`,
// `RCX`, `RDX`, `RSI`, `RDI`, and the status flags.
class X86TaintTracker : public model::TaintTracker {
 public:
  X86TaintTracker(bool observe_pc, bool observe_addresses,
                  Addr sandbox_base);
  virtual ~X86TaintTracker(void);

 protected:
  int InputIndex(Reg reg) const override;
};

}  // namespace arch
}  // namespace contracer

#endif  // CONTRACER_ARCH_X86_TAINT_H_
