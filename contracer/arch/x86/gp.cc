/* Copyright 2026 The contracer Authors, all rights reserved. */

#include "contracer/arch/x86/contract.h"
#include "contracer/arch/x86/instruction.h"
#include "contracer/arch/x86/model.h"

#include "contracer/model/model.h"

#include <gflags/gflags.h>

#include <iostream>

DECLARE_bool(dbg_model);

namespace contracer {
namespace arch {
namespace {

// Addresses strictly between these two are non-canonical.
enum : uint64_t {
  kMaxLowerCanonicalAddr = 0x00007FFFFFFFFFFFULL,
  kMinUpperCanonicalAddr = 0xFFFF800000000000ULL,

  // Flipping this bit moves an address made non-canonical by setting it back
  // into the canonical range.
  kNonCanonicalBit = 1ULL << 48
};

static bool IsNonCanonical(uint64_t addr) {
  return kMaxLowerCanonicalAddr < addr && addr < kMinUpperCanonicalAddr;
}

}  // namespace

NonCanonicalContract::NonCanonicalContract(void)
    : OutOfOrderContract({UC_ERR_READ_UNMAPPED, UC_ERR_WRITE_PROT,
                          UC_ERR_READ_PROT}) {}

NonCanonicalContract::~NonCanonicalContract(void) {}

// The emulator doesn't fault on non-canonical addresses the way hardware
// does, so the fault is raised here, before the access, with the address
// already corrected.
void NonCanonicalContract::SpeculateInstruction(model::Model *model, Addr pc,
                                                size_t size) {
  auto &ctx = model->Context();
  ctx.next_instr = pc + size;

  for (auto op : model->CurrentInstruction().MemOperands()) {
    if (op->is_implicit || !op->IsSimpleBaseOnly()) continue;

    auto addr = ReadRegister(model, op->mem.base);
    if (!IsNonCanonical(addr)) continue;

    ctx.pending_fault = UC_ERR_READ_UNMAPPED;
    ctx.last_faulty_instr = pc;
    ctx.correction_pending = true;
    model->SaveContext(&(ctx.fault_context));

    WriteRegister(model, op->mem.base, addr ^ kNonCanonicalBit);
    model->SavePreviousContext();
    model->StopEmulation();

    CONTRACER_MTRACE(
        std::cerr << "  non-canonical address " << std::hex << addr
                  << " at " << pc << std::dec << std::endl; )
    return;
  }

  TrackDependencies(model, pc, size);
}

// Re-executes the faulting instruction with the corrected address on a
// speculative path.
Addr NonCanonicalContract::SpeculateFault(model::Model *model, int fault) {
  auto &ctx = model->Context();
  if (UC_ERR_READ_UNMAPPED != fault || !ctx.correction_pending) {
    return OutOfOrderContract::SpeculateFault(model, fault);
  }
  ctx.correction_pending = false;

  // Rolling back must bring back the non-canonical address.
  model->RestoreContext(ctx.fault_context);
  auto next_pc = OutOfOrderContract::SpeculateFault(model, fault);
  model->RestorePreviousContext();

  if (!next_pc) return 0;
  return ctx.curr_instr;
}

// Only data operands leak the value of a faulting load; computing an
// address from it does not.
bool NonCanonicalContract::MustSkip(const RegSet &data_srcs,
                                    const RegSet &dependencies) const {
  return data_srcs.Intersects(dependencies);
}

}  // namespace arch
}  // namespace contracer
