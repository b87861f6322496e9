/* Copyright 2026 The contracer Authors, all rights reserved. */

#include "contracer/arch/x86/model.h"
#include "contracer/arch/x86/taint.h"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace contracer {
namespace arch {
namespace {

static bool IsHighByteReg(xed_reg_enum_t reg) {
  return XED_REG_AH == reg || XED_REG_BH == reg || XED_REG_CH == reg ||
         XED_REG_DH == reg;
}

static uint64_t WidthMask(unsigned width) {
  return 64 <= width ? ~0ULL : ((1ULL << width) - 1ULL);
}

static int UnicornRegisterOf(xed_reg_enum_t reg) {
  auto canonical = NormalizeRegister(reg);
  CONTRACER_ASSERT(Reg::kInvalid != canonical);
  return UnicornRegister(canonical);
}

}  // namespace

X86Model::X86Model(std::unique_ptr<model::Contract> contract,
                   model::ObservationClause clause, Addr sandbox_base,
                   Addr code_start)
    : model::Model(std::move(contract), clause, sandbox_base, code_start) {}

X86Model::~X86Model(void) {}

int X86Model::ProgramCounter(void) const {
  return UC_X86_REG_RIP;
}

// Zeroes the overflow regions, copies the memory image into the main and
// faulty regions, and initializes the registers. Every register value is
// also stored at the start of the upper overflow region, followed by the
// initial stack pointer.
void X86Model::LoadInput(const input::Input &input) {
  std::string zeros(model::kOverflowRegionSize, '\0');
  WriteMem(LowerOverflowRegion(), zeros);
  WriteMem(UpperOverflowRegion(), zeros);
  WriteMem(SandboxBase(), input.Memory());

  auto reg_init_addr = UpperOverflowRegion();
  const auto &regs = input.Registers();
  for (auto i = 0U; i < kNumInputRegisters; ++i) {
    auto val = regs[i];
    if (kInputFlagsIndex == i) {
      val = (val & kInputFlagsMask) | kReservedFlagsSet;
    }
    WriteReg(kInputUnicornRegisters[i], val);
    WriteMem(reg_init_addr, &val, sizeof val);
    reg_init_addr += sizeof val;
  }

  auto stack_base = StackBase();
  WriteMem(reg_init_addr, &stack_base, sizeof stack_base);

  WriteReg(UC_X86_REG_RSP, stack_base);
  WriteReg(UC_X86_REG_RBP, stack_base);
  WriteReg(UC_X86_REG_R14, SandboxBase());
}

std::unique_ptr<model::TaintTracker> X86Model::CreateTaintTracker(
    void) const {
  return std::unique_ptr<model::TaintTracker>(new X86TaintTracker(
      GetTracer().ObservesPC(), GetTracer().ObservesAddresses(),
      SandboxBase()));
}

std::string X86Model::Compressed(uint64_t val) const {
  std::stringstream ss;
  auto base = SandboxBase();
  if (LowerOverflowRegion() <= val &&
      val < LowerOverflowRegion() + model::kSandboxSize) {
    if (val >= base) {
      ss << "@+0x" << std::hex << (val - base);
    } else {
      ss << "@-0x" << std::hex << (base - val);
    }
  } else {
    ss << "0x" << std::hex << val;
  }
  return ss.str();
}

void X86Model::PrintState(std::ostream &os) const {
  static const struct {
    const char *name;
    int reg;
  } kPrintedRegs[] = {
    {"RAX", UC_X86_REG_RAX},
    {"RBX", UC_X86_REG_RBX},
    {"RCX", UC_X86_REG_RCX},
    {"RDX", UC_X86_REG_RDX},
    {"RSI", UC_X86_REG_RSI},
    {"RDI", UC_X86_REG_RDI}
  };
  for (const auto &entry : kPrintedRegs) {
    os << entry.name << ": " << Compressed(ReadReg(entry.reg)) << std::endl;
  }
  os << "FLAGS: 0x" << std::hex << ReadReg(UC_X86_REG_EFLAGS) << std::dec
     << std::endl;
}

uint64_t ReadRegister(const model::Model *model, xed_reg_enum_t reg) {
  auto val = model->ReadReg(UnicornRegisterOf(reg));
  if (IsHighByteReg(reg)) {
    return (val >> 8) & 0xFFULL;
  }
  return val & WidthMask(xed_get_register_width_bits64(reg));
}

void WriteRegister(model::Model *model, xed_reg_enum_t reg, uint64_t val) {
  auto uc_reg = UnicornRegisterOf(reg);
  auto old_val = model->ReadReg(uc_reg);
  auto width = xed_get_register_width_bits64(reg);
  uint64_t new_val = 0;
  if (IsHighByteReg(reg)) {
    new_val = (old_val & ~0xFF00ULL) | ((val & 0xFFULL) << 8);
  } else if (32 <= width) {
    new_val = val & WidthMask(width);
  } else {
    auto mask = WidthMask(width);
    new_val = (old_val & ~mask) | (val & mask);
  }
  model->WriteReg(uc_reg, new_val);
}

}  // namespace arch
}  // namespace contracer
