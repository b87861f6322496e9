/* Copyright 2026 The contracer Authors, all rights reserved. */

#include "contracer/arch/instruction.h"

namespace contracer {
namespace arch {

extern const xed_state_t kXEDState64 = {
    XED_MACHINE_MODE_LONG_64,
    XED_ADDRESS_WIDTH_64b};

namespace {

static void InitXED(void) {
  static bool is_initialized = false;
  if (!is_initialized) {
    xed_tables_init();
    is_initialized = true;
  }
}

static bool IsFlagsReg(xed_reg_enum_t reg) {
  return XED_REG_FLAGS == reg || XED_REG_EFLAGS == reg ||
         XED_REG_RFLAGS == reg;
}

// Updates the roles of an operand given how XED says it is accessed.
static void UpdateRoles(Operand *op, xed_operand_action_enum_t action) {
  switch (action) {
    case XED_OPERAND_ACTION_RW:
    case XED_OPERAND_ACTION_RCW:
    case XED_OPERAND_ACTION_CRW:
      op->is_src = true;
      op->is_dest = true;
      break;
    case XED_OPERAND_ACTION_R:
    case XED_OPERAND_ACTION_CR:
      op->is_src = true;
      break;

    // A conditional write might leave the old value in place, so the old
    // value flows into the result.
    case XED_OPERAND_ACTION_CW:
      op->is_src = true;
      op->is_dest = true;
      break;

    // Write-only operands are tricky because they might actually not write to
    // the full register, so we want to represent a partial write as a read
    // dependency.
    case XED_OPERAND_ACTION_W:
      op->is_dest = true;
      if (op->IsRegister() && 32 > xed_get_register_width_bits64(op->xed_reg)) {
        op->is_src = true;
      }
      break;

    default: break;
  }
}

// Decode a memory operand. XED numbers the memory operands of an instruction
// independently of its other operands.
static Operand DecodeMemory(const xed_decoded_inst_t *xedd,
                            xed_operand_enum_t op_name, unsigned mem_num) {
  Operand op;
  op.kind = XED_OPERAND_AGEN == op_name ? OperandKind::kAddressGen :
                                          OperandKind::kMemory;
  op.mem.seg = xed_decoded_inst_get_seg_reg(xedd, mem_num);
  op.mem.base = xed_decoded_inst_get_base_reg(xedd, mem_num);
  op.mem.index = xed_decoded_inst_get_index_reg(xedd, mem_num);
  op.mem.disp = xed_decoded_inst_get_memory_displacement(xedd, mem_num);
  op.mem.scale = xed_decoded_inst_get_scale(xedd, mem_num);
  op.width = 8U * xed_decoded_inst_get_memory_operand_length(xedd, mem_num);
  if (OperandKind::kMemory == op.kind) {
    op.is_src = xed_decoded_inst_mem_read(xedd, mem_num);
    op.is_dest = xed_decoded_inst_mem_written(xedd, mem_num);
  }
  return op;
}

// Decode `IMM0` operands.
static Operand DecodeImm0(const xed_decoded_inst_t *xedd,
                          xed_operand_enum_t op_name) {
  Operand op;
  op.kind = OperandKind::kImmediate;
  op.is_src = true;
  if (XED_OPERAND_IMM0SIGNED == op_name ||
      xed_operand_values_get_immediate_is_signed(xedd)) {
    op.imm = xed_decoded_inst_get_signed_immediate(xedd);
  } else {
    op.imm = static_cast<int64_t>(
        xed_decoded_inst_get_unsigned_immediate(xedd));
  }
  op.width = xed_decoded_inst_get_immediate_width_bits(xedd);
  return op;
}

// Decode `IMM1` operands.
static Operand DecodeImm1(const xed_decoded_inst_t *xedd) {
  Operand op;
  op.kind = OperandKind::kImmediate;
  op.is_src = true;
  op.imm = xed_decoded_inst_get_second_immediate(xedd);
  op.width = 8;
  return op;
}

// Pull out a register operand from the XED instruction.
static Operand DecodeReg(const xed_decoded_inst_t *xedd,
                         const xed_operand_t *xedo,
                         xed_operand_enum_t op_name) {
  Operand op;
  op.kind = OperandKind::kRegister;
  op.xed_reg = xed_decoded_inst_get_reg(xedd, op_name);

  // Pushes and pops name the stack pointer through pseudo registers.
  if (XED_REG_STACKPUSH == op.xed_reg || XED_REG_STACKPOP == op.xed_reg) {
    op.xed_reg = XED_REG_RSP;
    op.is_src = true;
    op.is_dest = true;
  } else {
    UpdateRoles(&op, xed_operand_rw(xedo));
  }
  op.reg = NormalizeRegister(op.xed_reg);
  op.width = xed_get_register_width_bits64(op.xed_reg);
  return op;
}

// Pull out a relative branch target.
static Operand DecodeRelbr(const xed_decoded_inst_t *xedd) {
  Operand op;
  op.kind = OperandKind::kBranchDisp;
  op.is_src = true;
  op.imm = xed_decoded_inst_get_branch_displacement(xedd);
  op.width = xed_decoded_inst_get_branch_displacement_width_bits(xedd);
  return op;
}

// Build the flags operand from XED's per-flag read/write information.
static Operand DecodeFlags(const xed_decoded_inst_t *xedd) {
  Operand op;
  op.kind = OperandKind::kFlags;
  op.is_implicit = true;

  auto rfi = xed_decoded_inst_get_rflags_info(xedd);
  auto read = xed_simple_flag_get_read_flag_set(rfi);
  auto written = xed_simple_flag_get_written_flag_set(rfi);
  auto undefined = xed_simple_flag_get_undefined_flag_set(rfi);

  op.flags_read = FlagsFromMask(read->flat);
  op.flags_written = FlagsFromMask(written->flat | undefined->flat);
  op.is_src = !op.flags_read.IsEmpty();
  op.is_dest = !op.flags_written.IsEmpty();
  return op;
}

// Converts a `xed_operand_t` into an operand in `instr`.
static void DecodeOperand(const xed_decoded_inst_t *xedd,
                          const xed_operand_t *xedo,
                          Instruction *instr) {
  Operand op;
  switch (auto op_name = xed_operand_name(xedo)) {
    case XED_OPERAND_AGEN:
    case XED_OPERAND_MEM0:
      op = DecodeMemory(xedd, op_name, 0);
      break;

    case XED_OPERAND_MEM1:
      op = DecodeMemory(xedd, op_name, 1);
      break;

    case XED_OPERAND_IMM0SIGNED:
    case XED_OPERAND_IMM0:
      op = DecodeImm0(xedd, op_name);
      break;

    case XED_OPERAND_IMM1_BYTES:
    case XED_OPERAND_IMM1:
      op = DecodeImm1(xedd);
      break;

    case XED_OPERAND_REG0:
    case XED_OPERAND_REG1:
    case XED_OPERAND_REG2:
    case XED_OPERAND_REG3:
    case XED_OPERAND_REG4:
    case XED_OPERAND_REG5:
    case XED_OPERAND_REG6:
    case XED_OPERAND_REG7:
    case XED_OPERAND_REG8:
    case XED_OPERAND_BASE0:
    case XED_OPERAND_BASE1: {
      // Flags are described per-flag by `DecodeFlags`.
      if (IsFlagsReg(xed_decoded_inst_get_reg(xedd, op_name))) return;
      op = DecodeReg(xedd, xedo, op_name);
      if (XED_REG_INVALID == op.xed_reg) return;
      break;
    }

    case XED_OPERAND_RELBR:
      op = DecodeRelbr(xedd);
      break;

    default:
      return;
  }
  op.is_implicit = XED_OPVIS_EXPLICIT != xed_operand_operand_visibility(xedo);
  instr->operands.push_back(op);
}

// Converts a `xed_decoded_inst_t` into an `Instruction`.
static void DecodeOperands(const xed_decoded_inst_t *xedd,
                           const xed_inst_t *xedi, Instruction *instr) {
  auto num_ops = xed_inst_noperands(xedi);
  for (auto i = 0U; i < num_ops; ++i) {
    DecodeOperand(xedd, xed_inst_operand(xedi, i), instr);
  }
  if (xed_decoded_inst_uses_rflags(xedd)) {
    instr->operands.push_back(DecodeFlags(xedd));
  }
}

}  // namespace

Operand::Operand(void)
    : kind(OperandKind::kInvalid),
      is_src(false),
      is_dest(false),
      is_implicit(false),
      width(0),
      xed_reg(XED_REG_INVALID),
      reg(Reg::kInvalid),
      imm(0) {
  mem.seg = XED_REG_INVALID;
  mem.base = XED_REG_INVALID;
  mem.index = XED_REG_INVALID;
  mem.disp = 0;
  mem.scale = 0;
}

RegSet Operand::AddressRegs(void) const {
  RegSet regs;
  if (OperandKind::kMemory == kind || OperandKind::kAddressGen == kind) {
    regs.Add(NormalizeRegister(mem.base));
    regs.Add(NormalizeRegister(mem.index));
  }
  return regs;
}

bool Operand::IsSimpleBaseOnly(void) const {
  return OperandKind::kMemory == kind &&
         Reg::kInvalid != NormalizeRegister(mem.base) &&
         Reg::kRIP != NormalizeRegister(mem.base) &&
         XED_REG_INVALID == mem.index &&
         !mem.disp;
}

Instruction::Instruction(void)
    : iclass(XED_ICLASS_INVALID),
      decoded_length(0),
      effective_operand_width(0),
      is_valid(false) {
  memset(bytes, 0, sizeof bytes);
}

// Decode an instruction.
bool Instruction::TryDecode(const uint8_t *decode_bytes,
                            size_t max_num_bytes) {
  InitXED();

  operands.clear();
  iclass = XED_ICLASS_INVALID;
  decoded_length = 0;
  effective_operand_width = 0;
  is_valid = false;

  max_num_bytes = std::min<size_t>(kMaxNumInstructionBytes, max_num_bytes);
  if (!max_num_bytes) {
    return false;
  }

  xed_decoded_inst_t xedd;
  xed_decoded_inst_zero_set_mode(&xedd, &kXEDState64);
  if (XED_ERROR_NONE != xed_decode(&xedd, decode_bytes,
                                   static_cast<unsigned>(max_num_bytes))) {
    return false;
  }

  decoded_length = xed_decoded_inst_get_length(&xedd);
  iclass = xed_decoded_inst_get_iclass(&xedd);
  effective_operand_width = xed_decoded_inst_get_operand_width(&xedd);
  memcpy(bytes, decode_bytes, decoded_length);

  DecodeOperands(&xedd, xed_decoded_inst_inst(&xedd), this);
  is_valid = true;
  return true;
}

const char *Instruction::Name(void) const {
  return xed_iclass_enum_t2str(iclass);
}

bool Instruction::ReadsMemory(void) const {
  for (const auto &op : operands) {
    if (op.IsMemory() && op.is_src) return true;
  }
  return false;
}

bool Instruction::WritesMemory(void) const {
  for (const auto &op : operands) {
    if (op.IsMemory() && op.is_dest) return true;
  }
  return false;
}

std::vector<const Operand *> Instruction::SourceOperands(void) const {
  std::vector<const Operand *> ops;
  for (const auto &op : operands) {
    if (op.is_src) ops.push_back(&op);
  }
  return ops;
}

std::vector<const Operand *> Instruction::DestOperands(
    bool include_implicit) const {
  std::vector<const Operand *> ops;
  for (const auto &op : operands) {
    if (op.is_dest && (include_implicit || !op.is_implicit)) {
      ops.push_back(&op);
    }
  }
  return ops;
}

std::vector<const Operand *> Instruction::MemOperands(void) const {
  std::vector<const Operand *> ops;
  for (const auto &op : operands) {
    if (op.IsMemory()) ops.push_back(&op);
  }
  return ops;
}

std::vector<const Operand *> Instruction::ImplicitMemOperands(void) const {
  std::vector<const Operand *> ops;
  for (const auto &op : operands) {
    if (op.IsMemory() && op.is_implicit) ops.push_back(&op);
  }
  return ops;
}

const Operand *Instruction::FlagsOperand(void) const {
  for (const auto &op : operands) {
    if (op.IsFlags()) return &op;
  }
  return nullptr;
}

}  // namespace arch
}  // namespace contracer
