/* Copyright 2026 The contracer Authors, all rights reserved. */

#ifndef CONTRACER_ARCH_X86_TARGET_H_
#define CONTRACER_ARCH_X86_TARGET_H_

#include "contracer/arch/x86/xed-intel64.h"

#include "contracer/base/base.h"

#include <string>
#include <vector>

namespace contracer {
namespace arch {

// Canonical registers. Every alias of a general purpose register (e.g.
// `AL`, `AH`, `AX`, `EAX`) normalizes to its 64-bit form, and the status
// flags are tracked individually.
enum class Reg : uint8_t {
  kRAX,
  kRBX,
  kRCX,
  kRDX,
  kRSI,
  kRDI,
  kRSP,
  kRBP,
  kR8,
  kR9,
  kR10,
  kR11,
  kR12,
  kR13,
  kR14,
  kR15,
  kRIP,
  kCF,
  kPF,
  kAF,
  kZF,
  kSF,
  kOF,
  kDF,
  kInvalid
};

enum : unsigned {
  kNumRegs = static_cast<unsigned>(Reg::kInvalid)
};

enum : uint64_t {
  kFlagCF = 1ULL << 0,
  kFlagPF = 1ULL << 2,
  kFlagAF = 1ULL << 4,
  kFlagZF = 1ULL << 6,
  kFlagSF = 1ULL << 7,
  kFlagDF = 1ULL << 10,
  kFlagOF = 1ULL << 11,

  // Bits of RFLAGS that an input may set. Everything else is reserved and
  // is forced to the value the hardware would hold.
  kInputFlagsMask = 0x8D7ULL,
  kReservedFlagsSet = 0x2ULL
};

// Set of canonical registers and flags.
class RegSet {
 public:
  inline RegSet(void)
      : bits(0) {}

  inline void Add(Reg reg) {
    if (Reg::kInvalid != reg) bits |= Bit(reg);
  }

  inline void Remove(Reg reg) {
    if (Reg::kInvalid != reg) bits &= ~Bit(reg);
  }

  inline bool Contains(Reg reg) const {
    return Reg::kInvalid != reg && 0 != (bits & Bit(reg));
  }

  inline bool Intersects(const RegSet &that) const {
    return 0 != (bits & that.bits);
  }

  inline bool IsEmpty(void) const {
    return !bits;
  }

  inline void Clear(void) {
    bits = 0;
  }

  inline RegSet &operator|=(const RegSet &that) {
    bits |= that.bits;
    return *this;
  }

  inline bool operator==(const RegSet &that) const {
    return bits == that.bits;
  }

  inline bool operator!=(const RegSet &that) const {
    return bits != that.bits;
  }

  // Returns the members of this set, in enumeration order.
  std::vector<Reg> Members(void) const;

  // Returns a printable form of this set, e.g. `{RAX, ZF}`.
  std::string ToString(void) const;

 private:
  static inline uint32_t Bit(Reg reg) {
    return 1U << static_cast<unsigned>(reg);
  }

  uint32_t bits;
};

// Normalizes a XED register to its canonical register. Returns
// `Reg::kInvalid` for registers that we don't track (segment, vector,
// flags registers).
Reg NormalizeRegister(xed_reg_enum_t reg);

// Returns the canonical name of a register, e.g. `RAX` or `ZF`.
const char *RegName(Reg reg);

// Parses any register alias (e.g. `eax`, `AH`, `r8d`) or flag name (e.g.
// `zf`) into its canonical register.
Reg RegFromName(const std::string &name);

// Returns the flag bit of RFLAGS corresponding to a flag register, or zero.
uint64_t FlagMask(Reg reg);

// Converts a set of RFLAGS bits into a set of flag registers.
RegSet FlagsFromMask(uint64_t mask);

// Returns the Unicorn register ID for a canonical GPR.
int UnicornRegister(Reg reg);

// Registers, in order, whose initial values are supplied by an `Input`.
enum : size_t {
  kNumInputRegisters = 7,
  kInputFlagsIndex = 6
};

extern const int kInputUnicornRegisters[kNumInputRegisters];

// Returns the index of `reg` within an input's register values, or `-1` if
// the input doesn't initialize it. All flags map to the RFLAGS slot.
int InputRegisterIndex(Reg reg);

}  // namespace arch
}  // namespace contracer

#endif  // CONTRACER_ARCH_X86_TARGET_H_
