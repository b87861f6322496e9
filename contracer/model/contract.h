/* Copyright 2026 The contracer Authors, all rights reserved. */

#ifndef CONTRACER_MODEL_CONTRACT_H_
#define CONTRACER_MODEL_CONTRACT_H_

#include "contracer/base/base.h"

#include <unicorn/unicorn.h>

namespace contracer {
namespace model {

class Model;

// An execution clause. A contract decides where the model forks speculative
// paths. Contracts hold only configuration; everything that changes during a
// run lives in the model's `RunContext`.
//
// The base contract never speculates (sequential execution).
class Contract {
 public:
  Contract(void) = default;
  virtual ~Contract(void);

  // Called before the instruction at `pc` executes.
  virtual void SpeculateInstruction(Model *model, Addr pc, size_t size);

  // Called before every data memory access, ahead of any other hook. Returns
  // `true` if the access must not happen, in which case the contract has
  // also stopped emulation with a pending fault. An aborted access is not
  // observed, and an aborted store is undone.
  virtual bool InterceptMemAccess(Model *model, uc_mem_type access,
                                  Addr address, size_t size);

  // Called before every data memory access that isn't aborted. `value` is
  // only meaningful for writes.
  virtual void SpeculateMemAccess(Model *model, uc_mem_type access,
                                  Addr address, size_t size, int64_t value);

  // Called when emulation stops on a fault. `fault` is the emulator's
  // error number, or a fault raised by a contract through the run context.
  // Returns the address at which emulation should resume, or zero if the
  // fault isn't speculated on.
  virtual Addr SpeculateFault(Model *model, int fault);

  // Keep per-checkpoint contract state in lockstep with the model's
  // checkpoint stack.
  virtual void OnCheckpoint(Model *model);
  virtual void OnRollback(Model *model);

  // Whether accesses to the faulty region should fault at the start of a run.
  virtual bool ProtectsFaultyRegion(void) const;

 private:
  CONTRACER_DISALLOW_COPY_AND_ASSIGN(Contract);
};

// Store bypass. Every store forks a speculative path on which the store is
// skipped; the checkpoint resumes at the store itself, which then executes.
class BypassContract : public Contract {
 public:
  virtual ~BypassContract(void);

  void SpeculateInstruction(Model *model, Addr pc, size_t size) override;
};

}  // namespace model
}  // namespace contracer

#endif  // CONTRACER_MODEL_CONTRACT_H_
