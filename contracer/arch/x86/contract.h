/* Copyright 2026 The contracer Authors, all rights reserved. */

#ifndef CONTRACER_ARCH_X86_CONTRACT_H_
#define CONTRACER_ARCH_X86_CONTRACT_H_

#include "contracer/arch/x86/target.h"

#include "contracer/model/contract.h"

#include <initializer_list>
#include <set>
#include <string>
#include <vector>

namespace contracer {
namespace model {
class Model;
}  // namespace model
namespace arch {

enum class BranchKind {
  kNotABranch,
  kConditional,
  kLoop  // `LOOP`, `LOOPE` and `LOOPNE`; these decrement `RCX`.
};

// Outcome of a conditional branch, computed from its raw bytes.
struct BranchDecision {
  BranchKind kind;

  // Signed displacement from the end of the branch to its target.
  int64_t displacement;

  bool will_jump;
};

// Decodes a conditional branch and evaluates its condition against `flags`
// and `rcx`. Only the short (`0x70`-`0x7F`, `0xE0`-`0xE3`) and near
// (`0x0F 0x80`-`0x0F 0x8F`) forms are recognized; anything else, including
// prefixed branches, is `kNotABranch`.
BranchDecision DecodeConditionalBranch(const uint8_t *bytes, size_t size,
                                       uint64_t flags, uint64_t rcx);

// Branch misprediction. Every conditional branch forks a path that follows
// the wrong direction; the checkpoint resumes in the right direction.
class CondContract : public model::Contract {
 public:
  virtual ~CondContract(void);

  void SpeculateInstruction(model::Model *model, Addr pc,
                            size_t size) override;
};

// Branch misprediction and store bypass together.
class CondBypassContract : public model::Contract {
 public:
  virtual ~CondBypassContract(void);

  void SpeculateInstruction(model::Model *model, Addr pc,
                            size_t size) override;

 private:
  CondContract cond;
  model::BypassContract bypass;
};

// Base of the contracts that speculate on faults. Only a subset of the
// emulator's faults is speculated on; `--speculated_faults` replaces the
// default subset of every contract.
class FaultContract : public model::Contract {
 public:
  explicit FaultContract(std::initializer_list<int> default_faults);
  virtual ~FaultContract(void);

  bool IsRelevantFault(int fault) const;

  inline const std::set<int> &RelevantFaults(void) const {
    return relevant_faults;
  }

  bool ProtectsFaultyRegion(void) const override;

 protected:
  std::set<int> relevant_faults;
};

// Loads from the faulty region speculatively return zero. The checkpoint
// resumes at the faulting instruction, which then re-executes without
// faulting.
class NullInjectionContract : public FaultContract {
 public:
  NullInjectionContract(void);
  virtual ~NullInjectionContract(void);

  void SpeculateMemAccess(model::Model *model, uc_mem_type access,
                          Addr address, size_t size,
                          int64_t value) override;
  Addr SpeculateFault(model::Model *model, int fault) override;

 protected:
  virtual Addr ResumeAddress(model::Model *model) const;
};

// Like `NullInjectionContract`, but the fault ends the run once the
// speculative path is rolled back.
class NullFaultContract : public NullInjectionContract {
 public:
  virtual ~NullFaultContract(void);

 protected:
  Addr ResumeAddress(model::Model *model) const override;
};

// Out-of-order execution past a fault. The faulting instruction is skipped
// and the registers and flags it writes become dependencies; instructions
// that read a dependency are skipped too, and their outputs become
// dependencies in turn. Everything else executes.
//
// Dependencies are only tracked on speculative paths that have at least one
// dependency. If fault 21 is relevant, any access to the faulty region
// outside of speculation is aborted and turned into fault 21.
class OutOfOrderContract : public FaultContract {
 public:
  OutOfOrderContract(void);
  virtual ~OutOfOrderContract(void);

  void SpeculateInstruction(model::Model *model, Addr pc,
                            size_t size) override;
  bool InterceptMemAccess(model::Model *model, uc_mem_type access,
                          Addr address, size_t size) override;
  Addr SpeculateFault(model::Model *model, int fault) override;
  void OnCheckpoint(model::Model *model) override;
  void OnRollback(model::Model *model) override;

 protected:
  explicit OutOfOrderContract(std::initializer_list<int> default_faults);

  // Skips the current instruction if it depends on a faulting instruction.
  void TrackDependencies(model::Model *model, Addr pc, size_t size);

  // Decides whether a dependent instruction is skipped. `data_srcs` excludes
  // the registers that only compute memory addresses.
  virtual bool MustSkip(const RegSet &data_srcs,
                        const RegSet &dependencies) const;
};

// Loads from the faulty region speculatively return the value in memory.
// The faulty region stays accessible; the faulting load re-executes on a
// speculative path and nothing is skipped.
class MeltdownContract : public OutOfOrderContract {
 public:
  MeltdownContract(void);
  virtual ~MeltdownContract(void);

  void SpeculateInstruction(model::Model *model, Addr pc,
                            size_t size) override;
  Addr SpeculateFault(model::Model *model, int fault) override;
  bool ProtectsFaultyRegion(void) const override;
};

// Division overflow (`#DE` with a non-zero divisor). The divide
// speculatively produces its truncated quotient and remainder, and
// execution continues after it.
class DivOverflowContract : public OutOfOrderContract {
 public:
  DivOverflowContract(void);
  virtual ~DivOverflowContract(void);

  void SpeculateMemAccess(model::Model *model, uc_mem_type access,
                          Addr address, size_t size,
                          int64_t value) override;
  Addr SpeculateFault(model::Model *model, int fault) override;
};

// Non-canonical addresses (`#GP`). A memory operand whose base register
// holds a non-canonical address is corrected before it can fault, and the
// fault is delivered as fault 6. The access then executes speculatively with
// the corrected address.
class NonCanonicalContract : public OutOfOrderContract {
 public:
  NonCanonicalContract(void);
  virtual ~NonCanonicalContract(void);

  void SpeculateInstruction(model::Model *model, Addr pc,
                            size_t size) override;
  Addr SpeculateFault(model::Model *model, int fault) override;

 protected:
  bool MustSkip(const RegSet &data_srcs,
                const RegSet &dependencies) const override;
};

// Creates a contract by name (e.g. `cond`, `ooo`). Returns `nullptr` if
// the name is unknown.
std::unique_ptr<model::Contract> CreateContract(const std::string &name);

// Names accepted by `CreateContract`.
const std::vector<std::string> &ContractNames(void);

}  // namespace arch
}  // namespace contracer

#endif  // CONTRACER_ARCH_X86_CONTRACT_H_
