/* Copyright 2026 The contracer Authors, all rights reserved. */

#include "contracer/arch/x86/target.h"

#include <unicorn/unicorn.h>

#include <cctype>
#include <sstream>

namespace contracer {
namespace arch {
namespace {

static const char * const kRegNames[kNumRegs] = {
  "RAX", "RBX", "RCX", "RDX", "RSI", "RDI", "RSP", "RBP",
  "R8", "R9", "R10", "R11", "R12", "R13", "R14", "R15",
  "RIP",
  "CF", "PF", "AF", "ZF", "SF", "OF", "DF"
};

static const int kUnicornRegs[] = {
  UC_X86_REG_RAX, UC_X86_REG_RBX, UC_X86_REG_RCX, UC_X86_REG_RDX,
  UC_X86_REG_RSI, UC_X86_REG_RDI, UC_X86_REG_RSP, UC_X86_REG_RBP,
  UC_X86_REG_R8, UC_X86_REG_R9, UC_X86_REG_R10, UC_X86_REG_R11,
  UC_X86_REG_R12, UC_X86_REG_R13, UC_X86_REG_R14, UC_X86_REG_R15,
  UC_X86_REG_RIP
};

}  // namespace

const int kInputUnicornRegisters[kNumInputRegisters] = {
  UC_X86_REG_RAX,
  UC_X86_REG_RBX,
  UC_X86_REG_RCX,
  UC_X86_REG_RDX,
  UC_X86_REG_RSI,
  UC_X86_REG_RDI,
  UC_X86_REG_EFLAGS
};

std::vector<Reg> RegSet::Members(void) const {
  std::vector<Reg> regs;
  for (auto i = 0U; i < kNumRegs; ++i) {
    if (bits & (1U << i)) {
      regs.push_back(static_cast<Reg>(i));
    }
  }
  return regs;
}

std::string RegSet::ToString(void) const {
  std::stringstream ss;
  auto sep = "";
  ss << "{";
  for (auto reg : Members()) {
    ss << sep << RegName(reg);
    sep = ", ";
  }
  ss << "}";
  return ss.str();
}

Reg NormalizeRegister(xed_reg_enum_t reg) {
  switch (xed_get_largest_enclosing_register(reg)) {
    case XED_REG_RAX: return Reg::kRAX;
    case XED_REG_RBX: return Reg::kRBX;
    case XED_REG_RCX: return Reg::kRCX;
    case XED_REG_RDX: return Reg::kRDX;
    case XED_REG_RSI: return Reg::kRSI;
    case XED_REG_RDI: return Reg::kRDI;
    case XED_REG_RSP: return Reg::kRSP;
    case XED_REG_RBP: return Reg::kRBP;
    case XED_REG_R8: return Reg::kR8;
    case XED_REG_R9: return Reg::kR9;
    case XED_REG_R10: return Reg::kR10;
    case XED_REG_R11: return Reg::kR11;
    case XED_REG_R12: return Reg::kR12;
    case XED_REG_R13: return Reg::kR13;
    case XED_REG_R14: return Reg::kR14;
    case XED_REG_R15: return Reg::kR15;
    case XED_REG_RIP: return Reg::kRIP;
    default: return Reg::kInvalid;
  }
}

const char *RegName(Reg reg) {
  if (Reg::kInvalid == reg) return "INVALID";
  return kRegNames[static_cast<unsigned>(reg)];
}

Reg RegFromName(const std::string &name) {
  std::string upper(name);
  for (auto &ch : upper) {
    ch = static_cast<char>(toupper(static_cast<unsigned char>(ch)));
  }
  for (auto i = static_cast<unsigned>(Reg::kCF); i < kNumRegs; ++i) {
    if (upper == kRegNames[i]) return static_cast<Reg>(i);
  }
  return NormalizeRegister(str2xed_reg_enum_t(upper.c_str()));
}

uint64_t FlagMask(Reg reg) {
  switch (reg) {
    case Reg::kCF: return kFlagCF;
    case Reg::kPF: return kFlagPF;
    case Reg::kAF: return kFlagAF;
    case Reg::kZF: return kFlagZF;
    case Reg::kSF: return kFlagSF;
    case Reg::kOF: return kFlagOF;
    case Reg::kDF: return kFlagDF;
    default: return 0;
  }
}

RegSet FlagsFromMask(uint64_t mask) {
  RegSet flags;
  for (auto i = static_cast<unsigned>(Reg::kCF); i < kNumRegs; ++i) {
    auto flag = static_cast<Reg>(i);
    if (mask & FlagMask(flag)) flags.Add(flag);
  }
  return flags;
}

int UnicornRegister(Reg reg) {
  CONTRACER_ASSERT(static_cast<unsigned>(reg) <=
                   static_cast<unsigned>(Reg::kRIP));
  return kUnicornRegs[static_cast<unsigned>(reg)];
}

int InputRegisterIndex(Reg reg) {
  switch (reg) {
    case Reg::kRAX: return 0;
    case Reg::kRBX: return 1;
    case Reg::kRCX: return 2;
    case Reg::kRDX: return 3;
    case Reg::kRSI: return 4;
    case Reg::kRDI: return 5;
    default:
      if (FlagMask(reg)) return static_cast<int>(kInputFlagsIndex);
      return -1;
  }
}

}  // namespace arch
}  // namespace contracer
