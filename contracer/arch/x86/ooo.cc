/* Copyright 2026 The contracer Authors, all rights reserved. */

#include "contracer/arch/x86/contract.h"
#include "contracer/arch/x86/instruction.h"

#include "contracer/model/model.h"

#include <gflags/gflags.h>

#include <iostream>

DECLARE_bool(dbg_model);

namespace contracer {
namespace arch {

OutOfOrderContract::OutOfOrderContract(void)
    : FaultContract({UC_ERR_WRITE_PROT, UC_ERR_READ_PROT}) {}

OutOfOrderContract::OutOfOrderContract(
    std::initializer_list<int> default_faults)
    : FaultContract(default_faults) {}

OutOfOrderContract::~OutOfOrderContract(void) {}

void OutOfOrderContract::SpeculateInstruction(model::Model *model, Addr pc,
                                              size_t size) {
  model->Context().next_instr = pc + size;
  TrackDependencies(model, pc, size);
}

void OutOfOrderContract::TrackDependencies(model::Model *model, Addr pc,
                                           size_t size) {
  auto &ctx = model->Context();
  if (!model->InSpeculation() || ctx.dependencies.IsEmpty()) return;

  // The faulting instruction re-executes on the speculative path.
  if (ctx.last_faulty_instr == pc) return;

  const auto &instr = model->CurrentInstruction();
  if (!instr.IsValid()) return;

  RegSet data_srcs;
  RegSet addr_srcs;
  RegSet dests;
  for (const auto &op : instr.operands) {
    if (op.IsRegister()) {
      if (op.is_src) data_srcs.Add(op.reg);
      if (op.is_dest) dests.Add(op.reg);
    } else if (op.IsFlags()) {
      data_srcs |= op.flags_read;
      dests |= op.flags_written;
    } else if (op.IsMemory()) {
      addr_srcs |= op.AddressRegs();
    } else if (OperandKind::kAddressGen == op.kind) {
      data_srcs |= op.AddressRegs();
    }
  }

  auto srcs = data_srcs;
  srcs |= addr_srcs;
  auto is_dependent = srcs.Intersects(ctx.dependencies);

  // Overwritten values no longer depend on the fault.
  for (auto reg : dests.Members()) {
    if (!srcs.Contains(reg)) ctx.dependencies.Remove(reg);
  }

  if (!is_dependent || !MustSkip(data_srcs, ctx.dependencies)) return;

  ctx.dependencies |= dests;
  model->SetPC(pc + size);

  CONTRACER_MTRACE(
      std::cerr << "  skip dependent " << instr.Name() << " at " << std::hex
                << pc << std::dec << ", dependencies "
                << ctx.dependencies.ToString() << std::endl; )
}

bool OutOfOrderContract::MustSkip(const RegSet &, const RegSet &) const {
  return true;
}

// Outside of speculation, an access to the faulty region is aborted and
// becomes fault 21.
bool OutOfOrderContract::InterceptMemAccess(model::Model *model, uc_mem_type,
                                            Addr address, size_t) {
  if (model->InSpeculation()) return false;
  if (!IsRelevantFault(UC_ERR_EXCEPTION)) return false;
  if (!model->IsInFaultyRegion(address)) return false;

  auto &ctx = model->Context();
  ctx.pending_fault = UC_ERR_EXCEPTION;
  ctx.last_faulty_instr = ctx.curr_instr;
  model->StopEmulation();
  return true;
}

// Skips the faulting instruction. The fault ends the run once the
// speculative path is rolled back.
Addr OutOfOrderContract::SpeculateFault(model::Model *model, int fault) {
  if (!IsRelevantFault(fault)) return 0;
  if (!model->CanSpeculate()) return 0;

  auto &ctx = model->Context();
  model->Checkpoint(model->CodeEnd());
  ctx.last_faulty_instr = ctx.curr_instr;

  for (auto op : model->CurrentInstruction().DestOperands(true)) {
    if (op->IsRegister()) {
      ctx.dependencies.Add(op->reg);
    } else if (op->IsFlags()) {
      ctx.dependencies |= op->flags_written;
    }
  }

  CONTRACER_MTRACE(
      std::cerr << "  speculate past fault " << fault << ", dependencies "
                << ctx.dependencies.ToString() << std::endl; )

  if (ctx.next_instr >= model->CodeEnd()) return 0;
  return ctx.next_instr;
}

void OutOfOrderContract::OnCheckpoint(model::Model *model) {
  auto &ctx = model->Context();
  ctx.dependency_checkpoints.push_back(ctx.dependencies);
}

void OutOfOrderContract::OnRollback(model::Model *model) {
  auto &ctx = model->Context();
  CONTRACER_ASSERT(!ctx.dependency_checkpoints.empty());
  ctx.dependencies = ctx.dependency_checkpoints.back();
  ctx.dependency_checkpoints.pop_back();
}

MeltdownContract::MeltdownContract(void)
    : OutOfOrderContract({UC_ERR_WRITE_PROT, UC_ERR_READ_PROT,
                          UC_ERR_EXCEPTION}) {}

MeltdownContract::~MeltdownContract(void) {}

void MeltdownContract::SpeculateInstruction(model::Model *model, Addr pc,
                                            size_t size) {
  model->Context().next_instr = pc + size;
}

// Re-executes the faulting load on a speculative path, where it reads the
// value in memory.
Addr MeltdownContract::SpeculateFault(model::Model *model, int fault) {
  if (!IsRelevantFault(fault)) return 0;
  if (!model->CanSpeculate()) return 0;

  auto &ctx = model->Context();
  model->Checkpoint(model->CodeEnd());
  ctx.last_faulty_instr = ctx.curr_instr;
  return ctx.curr_instr;
}

bool MeltdownContract::ProtectsFaultyRegion(void) const {
  return false;
}

}  // namespace arch
}  // namespace contracer
