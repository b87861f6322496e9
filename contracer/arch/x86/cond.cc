/* Copyright 2026 The contracer Authors, all rights reserved. */

#include "contracer/arch/x86/contract.h"
#include "contracer/arch/x86/instruction.h"

#include "contracer/model/model.h"

#include <gflags/gflags.h>

#include <iostream>

DECLARE_bool(dbg_model);

namespace contracer {
namespace arch {
namespace {

// Evaluates the condition encoded in the low nibble of a `Jcc` opcode.
static bool EvaluateCondition(unsigned cc, uint64_t flags) {
  auto cf = 0 != (flags & kFlagCF);
  auto pf = 0 != (flags & kFlagPF);
  auto zf = 0 != (flags & kFlagZF);
  auto sf = 0 != (flags & kFlagSF);
  auto of = 0 != (flags & kFlagOF);
  switch (cc & 0xFU) {
    case 0x0: return of;  // JO
    case 0x1: return !of;  // JNO
    case 0x2: return cf;  // JB
    case 0x3: return !cf;  // JNB
    case 0x4: return zf;  // JZ
    case 0x5: return !zf;  // JNZ
    case 0x6: return cf || zf;  // JBE
    case 0x7: return !cf && !zf;  // JNBE
    case 0x8: return sf;  // JS
    case 0x9: return !sf;  // JNS
    case 0xA: return pf;  // JP
    case 0xB: return !pf;  // JNP
    case 0xC: return sf != of;  // JL
    case 0xD: return sf == of;  // JNL
    case 0xE: return zf || sf != of;  // JLE
    default: return !zf && sf == of;  // JNLE
  }
}

// Reads a little-endian, sign-extended displacement of `width` bytes.
static int64_t ReadDisplacement(const uint8_t *bytes, size_t width) {
  uint64_t val = 0;
  for (auto i = width; i-- > 0; ) {
    val = (val << 8) | bytes[i];
  }
  auto shift = 64U - 8U * static_cast<unsigned>(width);
  return static_cast<int64_t>(val << shift) >> shift;
}

static BranchDecision NotABranch(void) {
  BranchDecision decision;
  decision.kind = BranchKind::kNotABranch;
  decision.displacement = 0;
  decision.will_jump = false;
  return decision;
}

static BranchDecision Branch(BranchKind kind, const uint8_t *disp_bytes,
                             size_t disp_width, bool will_jump) {
  BranchDecision decision;
  decision.kind = kind;
  decision.displacement = ReadDisplacement(disp_bytes, disp_width);
  decision.will_jump = will_jump;
  return decision;
}

// Second byte of `0x0F 0x80`-`0x0F 0x8F`, with a 32-bit displacement.
static BranchDecision DecodeNearBranch(const uint8_t *bytes, size_t size,
                                       uint64_t flags) {
  if (6 > size) return NotABranch();
  auto opcode = bytes[1];
  if (0x80 > opcode || 0x8F < opcode) return NotABranch();
  return Branch(BranchKind::kConditional, &(bytes[2]), 4,
                EvaluateCondition(opcode, flags));
}

}  // namespace

BranchDecision DecodeConditionalBranch(const uint8_t *bytes, size_t size,
                                       uint64_t flags, uint64_t rcx) {
  if (2 > size) return NotABranch();

  auto opcode = bytes[0];
  if (0x70 <= opcode && 0x7F >= opcode) {
    return Branch(BranchKind::kConditional, &(bytes[1]), 1,
                  EvaluateCondition(opcode, flags));
  }

  auto zf = 0 != (flags & kFlagZF);
  switch (opcode) {
    case 0x0F:
      return DecodeNearBranch(bytes, size, flags);
    case 0xE0:  // LOOPNE
      return Branch(BranchKind::kLoop, &(bytes[1]), 1, 1 != rcx && !zf);
    case 0xE1:  // LOOPE
      return Branch(BranchKind::kLoop, &(bytes[1]), 1, 1 != rcx && zf);
    case 0xE2:  // LOOP
      return Branch(BranchKind::kLoop, &(bytes[1]), 1, 1 != rcx);
    case 0xE3:  // JRCXZ
      return Branch(BranchKind::kConditional, &(bytes[1]), 1, !rcx);
    default:
      return NotABranch();
  }
}

CondContract::~CondContract(void) {}

void CondContract::SpeculateInstruction(model::Model *model, Addr pc,
                                        size_t size) {
  if (!model->CanSpeculate()) return;
  if (kMaxNumInstructionBytes < size) return;

  uint8_t bytes[kMaxNumInstructionBytes] = {0};
  auto code = model->ReadMem(pc, size);
  memcpy(bytes, code.data(), size);

  auto rcx = model->ReadReg(UC_X86_REG_RCX);
  auto decision = DecodeConditionalBranch(
      bytes, size, model->ReadReg(UC_X86_REG_EFLAGS), rcx);
  if (BranchKind::kNotABranch == decision.kind) return;

  // The mispredicted path skips the branch itself, so it has to perform the
  // branch's side effect.
  if (BranchKind::kLoop == decision.kind) {
    model->WriteReg(UC_X86_REG_RCX, rcx - 1);
  }

  auto fall_through = pc + size;
  auto target = fall_through + static_cast<uint64_t>(decision.displacement);
  if (decision.will_jump) {
    model->Checkpoint(target);
    model->SetPC(fall_through);
  } else {
    model->Checkpoint(fall_through);
    model->SetPC(target);
  }

  CONTRACER_MTRACE(
      std::cerr << "  mispredict branch at " << std::hex << pc << " to "
                << (decision.will_jump ? fall_through : target) << std::dec
                << std::endl; )
}

CondBypassContract::~CondBypassContract(void) {}

void CondBypassContract::SpeculateInstruction(model::Model *model, Addr pc,
                                              size_t size) {
  cond.SpeculateInstruction(model, pc, size);
  bypass.SpeculateInstruction(model, pc, size);
}

}  // namespace arch
}  // namespace contracer
