/* Copyright 2026 The contracer Authors, all rights reserved. */

#ifndef CONTRACER_ARCH_X86_INSTRUCTION_H_
#define CONTRACER_ARCH_X86_INSTRUCTION_H_

#include "contracer/arch/x86/target.h"
#include "contracer/arch/x86/xed-intel64.h"

#include "contracer/base/base.h"

#include <vector>

namespace contracer {
namespace arch {

enum {
  // Maximum number of bytes in an x86/x64 instruction.
  kMaxNumInstructionBytes = 15,

  kAddrWidthBytes_amd64 = 8,
  kAddrWidthBits_amd64 = 64
};

enum class OperandKind : uint8_t {
  kInvalid,
  kRegister,
  kMemory,
  kAddressGen,
  kFlags,
  kImmediate,
  kBranchDisp
};

struct Operand {
  Operand(void);

  inline bool IsRegister(void) const {
    return OperandKind::kRegister == kind;
  }

  // Address generation (`LEA`) looks like a memory operand but never
  // touches memory.
  inline bool IsMemory(void) const {
    return OperandKind::kMemory == kind;
  }

  inline bool IsFlags(void) const {
    return OperandKind::kFlags == kind;
  }

  // Registers used to compute the address of a memory or address generation
  // operand.
  RegSet AddressRegs(void) const;

  // Returns true if the address is computed from a single base register,
  // without an index, scale or displacement.
  bool IsSimpleBaseOnly(void) const;

  OperandKind kind;

  // Source and destination roles. We treat conditional writes as reads,
  // and writes that don't overwrite the full register state as reads too.
  bool is_src;
  bool is_dest;

  // Implicit or suppressed operands don't appear in the assembly syntax of
  // the instruction (e.g. `RDX:RAX` of `DIV`).
  bool is_implicit;

  // Width, in bits, of the register, memory access, or immediate.
  unsigned width;

  // `kRegister`.
  xed_reg_enum_t xed_reg;
  Reg reg;

  // `kMemory` and `kAddressGen`.
  struct {
    xed_reg_enum_t seg;
    xed_reg_enum_t base;
    xed_reg_enum_t index;
    int64_t disp;
    unsigned scale;
  } mem;

  // `kFlags`. Undefined flags count as written.
  RegSet flags_read;
  RegSet flags_written;

  // `kImmediate` and `kBranchDisp`.
  int64_t imm;
};

// Represents a decoded instruction.
class Instruction {
 public:
  Instruction(void);

  // Try to decode an instruction starting at `decode_bytes`.
  bool TryDecode(const uint8_t *decode_bytes, size_t max_num_bytes);

  // Name of the instruction's class, e.g. `DIV`, `JZ`, `MOV`.
  const char *Name(void) const;

  inline bool IsValid(void) const {
    return is_valid;
  }

  inline bool IsDivide(void) const {
    return XED_ICLASS_DIV == iclass || XED_ICLASS_IDIV == iclass;
  }

  // This includes `JRCXZ` and the `LOOP` family.
  inline bool IsBranch(void) const {
    return (XED_ICLASS_JB <= iclass && XED_ICLASS_JLE >= iclass) ||
           (XED_ICLASS_JNB <= iclass && XED_ICLASS_JZ >= iclass) ||
           (XED_ICLASS_LOOP <= iclass && XED_ICLASS_LOOPNE >= iclass) ||
           XED_ICLASS_JRCXZ == iclass || XED_ICLASS_JECXZ == iclass;
  }

  // Size of this instruction in bytes.
  inline size_t NumBytes(void) const {
    return decoded_length;
  }

  // Does this instruction read from or write to memory? Implicit accesses,
  // e.g. the stack slot of a `PUSH`, count too.
  bool ReadsMemory(void) const;
  bool WritesMemory(void) const;

  // Operand views.
  std::vector<const Operand *> SourceOperands(void) const;
  std::vector<const Operand *> DestOperands(bool include_implicit) const;
  std::vector<const Operand *> MemOperands(void) const;
  std::vector<const Operand *> ImplicitMemOperands(void) const;

  // Returns the flags operand, or `nullptr` if flags are neither read nor
  // written.
  const Operand *FlagsOperand(void) const;

  // In XED's operand order. The flags operand, if any, is last.
  std::vector<Operand> operands;

  xed_iclass_enum_t iclass;
  unsigned decoded_length;
  unsigned effective_operand_width;
  bool is_valid;

  // Decoded bytes.
  uint8_t bytes[kMaxNumInstructionBytes];
};

}  // namespace arch
}  // namespace contracer

#endif  // CONTRACER_ARCH_X86_INSTRUCTION_H_
