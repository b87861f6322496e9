/* Copyright 2026 The contracer Authors, all rights reserved. */

#ifndef CONTRACER_ARCH_X86_MODEL_H_
#define CONTRACER_ARCH_X86_MODEL_H_

#include "contracer/arch/x86/target.h"

#include "contracer/model/model.h"

namespace contracer {
namespace arch {

// x86-64 binding of the contract model: how an input initializes the
// machine, and how the machine state is printed.
class X86Model : public model::Model {
 public:
  X86Model(std::unique_ptr<model::Contract> contract,
           model::ObservationClause clause,
           Addr sandbox_base = model::kDefaultSandboxBase,
           Addr code_start = model::kDefaultCodeStart);

  virtual ~X86Model(void);

  void PrintState(std::ostream &os) const override;

 protected:
  void LoadInput(const input::Input &input) override;
  std::unique_ptr<model::TaintTracker> CreateTaintTracker(
      void) const override;
  int ProgramCounter(void) const override;

 private:
  // Formats `val` relative to the sandbox base if it points into the
  // sandbox.
  std::string Compressed(uint64_t val) const;
};

// Reads the value of any GPR alias, e.g. `AH` or `R8D`.
uint64_t ReadRegister(const model::Model *model, xed_reg_enum_t reg);

// Writes `val` into any GPR alias. Writes to 32-bit aliases zero the upper
// half of the register; narrower writes leave the other bits untouched.
void WriteRegister(model::Model *model, xed_reg_enum_t reg, uint64_t val);

}  // namespace arch
}  // namespace contracer

#endif  // CONTRACER_ARCH_X86_MODEL_H_
