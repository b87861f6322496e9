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

typedef unsigned __int128 uint128_t;

static uint64_t WidthMask(unsigned width) {
  return 64 <= width ? ~0ULL : ((1ULL << width) - 1ULL);
}

// Returns the explicit operand of a divide, i.e. the divisor.
static const Operand *DivisorOperand(const Instruction &instr) {
  for (const auto &op : instr.operands) {
    if (!op.is_implicit && (op.IsRegister() || op.IsMemory())) return &op;
  }
  return nullptr;
}

// Writes the truncated quotient and the remainder of an unsigned divide into
// the registers that `DIV` would have written.
static void SynthesizeDiv(model::Model *model, unsigned width,
                          uint64_t divisor) {
  switch (width) {
    case 64: {
      auto dividend =
          (static_cast<uint128_t>(ReadRegister(model, XED_REG_RDX)) << 64) |
          ReadRegister(model, XED_REG_RAX);
      WriteRegister(model, XED_REG_RAX,
                    static_cast<uint64_t>(dividend / divisor));
      WriteRegister(model, XED_REG_RDX,
                    static_cast<uint64_t>(dividend % divisor));
      break;
    }
    case 32: {
      auto dividend = (ReadRegister(model, XED_REG_EDX) << 32) |
                      ReadRegister(model, XED_REG_EAX);
      WriteRegister(model, XED_REG_EAX, dividend / divisor);
      WriteRegister(model, XED_REG_EDX, dividend % divisor);
      break;
    }
    case 16: {
      auto dividend = (ReadRegister(model, XED_REG_DX) << 16) |
                      ReadRegister(model, XED_REG_AX);
      WriteRegister(model, XED_REG_AX, dividend / divisor);
      WriteRegister(model, XED_REG_DX, dividend % divisor);
      break;
    }
    case 8: {
      auto dividend = ReadRegister(model, XED_REG_AX);
      WriteRegister(model, XED_REG_AL, dividend / divisor);
      WriteRegister(model, XED_REG_AH, dividend % divisor);
      break;
    }
    default:
      CONTRACER_ASSERT(false);
      break;
  }
}

}  // namespace

DivOverflowContract::DivOverflowContract(void) {}

DivOverflowContract::~DivOverflowContract(void) {}

// Remembers the value of every read; a faulting `DIV` with a memory operand
// read its divisor last.
void DivOverflowContract::SpeculateMemAccess(model::Model *model,
                                             uc_mem_type access,
                                             Addr address, size_t size,
                                             int64_t) {
  if (UC_MEM_READ == access && sizeof(uint64_t) >= size &&
      model->IsMapped(address, size)) {
    model->Context().div_value = model->ReadMemWord(address, size);
  }
}

Addr DivOverflowContract::SpeculateFault(model::Model *model, int fault) {
  const auto &instr = model->CurrentInstruction();
  // Only `#DE` can be an overflow. Other faults of a divide, e.g. on its
  // memory operand, are ordinary faults.
  if (UC_ERR_EXCEPTION != fault || !instr.IsValid() || !instr.IsDivide()) {
    return OutOfOrderContract::SpeculateFault(model, fault);
  }
  if (!model->CanSpeculate()) return 0;

  auto &ctx = model->Context();
  auto divisor_op = DivisorOperand(instr);
  CONTRACER_ASSERT(nullptr != divisor_op);

  auto width = divisor_op->width;
  uint64_t divisor = 0;
  if (divisor_op->IsRegister()) {
    divisor = ReadRegister(model, divisor_op->xed_reg);
  } else {
    divisor = ctx.div_value & WidthMask(width);
  }

  // A real division by zero.
  if (!divisor) {
    return OutOfOrderContract::SpeculateFault(model, fault);
  }

  model->Checkpoint(model->CodeEnd());
  if (XED_ICLASS_IDIV == instr.iclass) {
    CONTRACER_UNIMPLEMENTED("overflow of signed division (IDIV)");
  }
  SynthesizeDiv(model, width, divisor);

  CONTRACER_MTRACE(
      std::cerr << "  divide overflow at " << std::hex << ctx.curr_instr
                << ", RAX " << ReadRegister(model, XED_REG_RAX) << " RDX "
                << ReadRegister(model, XED_REG_RDX) << std::dec
                << std::endl; )

  return ctx.next_instr;
}

}  // namespace arch
}  // namespace contracer
