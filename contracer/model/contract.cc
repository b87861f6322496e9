/* Copyright 2026 The contracer Authors, all rights reserved. */

#include "contracer/model/contract.h"
#include "contracer/model/model.h"

#include <gflags/gflags.h>

#include <iostream>

DECLARE_bool(dbg_model);

namespace contracer {
namespace model {

Contract::~Contract(void) {}

void Contract::SpeculateInstruction(Model *, Addr, size_t) {}

void Contract::SpeculateMemAccess(Model *, uc_mem_type, Addr, size_t,
                                  int64_t) {}

bool Contract::InterceptMemAccess(Model *, uc_mem_type, Addr, size_t) {
  return false;
}

Addr Contract::SpeculateFault(Model *, int) {
  return 0;
}

void Contract::OnCheckpoint(Model *) {}

void Contract::OnRollback(Model *) {}

bool Contract::ProtectsFaultyRegion(void) const {
  return false;
}

BypassContract::~BypassContract(void) {}

void BypassContract::SpeculateInstruction(Model *model, Addr pc,
                                          size_t size) {
  if (!model->CanSpeculate()) return;

  const auto &instr = model->CurrentInstruction();
  if (!instr.IsValid() || !instr.WritesMemory()) return;

  // We are re-executing this store after rolling back its own bypass.
  if (model->Context().rollback_target == pc) return;

  model->Checkpoint(pc);
  model->SetPC(pc + size);
  CONTRACER_MTRACE(
      std::cerr << "  bypass store at " << std::hex << pc << std::dec
                << std::endl; )
}

}  // namespace model
}  // namespace contracer
