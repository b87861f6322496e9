/* Copyright 2026 The contracer Authors, all rights reserved. */

#include <gtest/gtest.h>

#include "contracer/arch/x86/target.h"

#include <unicorn/unicorn.h>

using namespace contracer::arch;

TEST(TargetTest, AliasesNormalizeToTheFullRegister) {
  EXPECT_EQ(Reg::kRAX, NormalizeRegister(XED_REG_AL));
  EXPECT_EQ(Reg::kRAX, NormalizeRegister(XED_REG_AH));
  EXPECT_EQ(Reg::kRAX, NormalizeRegister(XED_REG_AX));
  EXPECT_EQ(Reg::kRAX, NormalizeRegister(XED_REG_EAX));
  EXPECT_EQ(Reg::kR8, NormalizeRegister(XED_REG_R8D));
  EXPECT_EQ(Reg::kRSP, NormalizeRegister(XED_REG_SPL));
  EXPECT_EQ(Reg::kInvalid, NormalizeRegister(XED_REG_XMM0));
  EXPECT_EQ(Reg::kInvalid, NormalizeRegister(XED_REG_INVALID));
}

TEST(TargetTest, NamesRoundTrip) {
  EXPECT_EQ(Reg::kRAX, RegFromName("eax"));
  EXPECT_EQ(Reg::kRDX, RegFromName("DL"));
  EXPECT_EQ(Reg::kR15, RegFromName("r15w"));
  EXPECT_EQ(Reg::kZF, RegFromName("zf"));
  EXPECT_STREQ("RCX", RegName(Reg::kRCX));
  EXPECT_STREQ("OF", RegName(Reg::kOF));
}

TEST(TargetTest, UnknownNames) {
  EXPECT_EQ(Reg::kInvalid, RegFromName("xyz"));
  EXPECT_EQ(Reg::kInvalid, RegFromName("r\xE9x"));
  EXPECT_EQ(Reg::kInvalid, RegFromName(""));
}

TEST(TargetTest, FlagMasks) {
  auto flags = FlagsFromMask(kFlagZF | kFlagCF);
  EXPECT_TRUE(flags.Contains(Reg::kZF));
  EXPECT_TRUE(flags.Contains(Reg::kCF));
  EXPECT_FALSE(flags.Contains(Reg::kSF));
  EXPECT_EQ(kFlagOF, FlagMask(Reg::kOF));
  EXPECT_EQ(0ULL, FlagMask(Reg::kRAX));
}

TEST(TargetTest, RegSet) {
  RegSet regs;
  EXPECT_TRUE(regs.IsEmpty());
  regs.Add(Reg::kZF);
  regs.Add(Reg::kRAX);
  regs.Add(Reg::kInvalid);
  EXPECT_EQ("{RAX, ZF}", regs.ToString());

  RegSet other;
  other.Add(Reg::kRBX);
  EXPECT_FALSE(regs.Intersects(other));
  other.Add(Reg::kZF);
  EXPECT_TRUE(regs.Intersects(other));

  regs.Remove(Reg::kRAX);
  EXPECT_EQ(1U, regs.Members().size());
}

TEST(TargetTest, InputRegisters) {
  EXPECT_EQ(0, InputRegisterIndex(Reg::kRAX));
  EXPECT_EQ(3, InputRegisterIndex(Reg::kRDX));
  EXPECT_EQ(5, InputRegisterIndex(Reg::kRDI));
  EXPECT_EQ(6, InputRegisterIndex(Reg::kZF));
  EXPECT_EQ(-1, InputRegisterIndex(Reg::kRSP));
  EXPECT_EQ(-1, InputRegisterIndex(Reg::kR14));
  EXPECT_EQ(UC_X86_REG_EFLAGS, kInputUnicornRegisters[kInputFlagsIndex]);
  EXPECT_EQ(UC_X86_REG_R14, UnicornRegister(Reg::kR14));
}
