/* Copyright 2026 The contracer Authors, all rights reserved. */

#include <gtest/gtest.h>

#include <cstdlib>

#include "tests/test_util.h"

using namespace contracer;
using namespace contracer::test;

namespace {

// mov rcx, [r14+0x200]
static const std::initializer_list<uint8_t> kLoad = {
  0x49, 0x8B, 0x8E, 0x00, 0x02, 0x00, 0x00
};

static std::string DivThenLoad(std::initializer_list<uint8_t> div) {
  std::string code = Code(div);
  code += Code(kLoad);
  return code;
}

// Registers in input order: RAX, RBX, RCX, RDX, RSI, RDI, FLAGS.
static input::Input DivInput(uint64_t rax, uint64_t rbx, uint64_t rdx) {
  return MakeInput({{rax, rbx, 0, rdx, 0, 0, 0}}, {{0, 2}});
}

}  // namespace

TEST(DivOverflowTest, Divide64) {
  Harness<arch::DivOverflowContract> h;
  auto result = h.Run(DivThenLoad({0x48, 0xF7, 0xF3}),  // div rbx
                      DivInput(5, 2, 3));

  EXPECT_EQ(UC_ERR_EXCEPTION, result.fault);
  EXPECT_EQ(1U, h.contract->max_depth);
  EXPECT_TRUE(Observed(result, kSandboxBase + 0x200));

  ASSERT_EQ(1U, h.contract->paths.size());
  EXPECT_EQ(0x8000000000000002ULL, h.contract->paths[0].rax);
  EXPECT_EQ(1ULL, h.contract->paths[0].rdx);

  // The architectural path never completes the divide.
  EXPECT_EQ(5ULL, h.model.ReadReg(UC_X86_REG_RAX));
  EXPECT_EQ(3ULL, h.model.ReadReg(UC_X86_REG_RDX));
}

TEST(DivOverflowTest, Divide32ZeroExtends) {
  Harness<arch::DivOverflowContract> h;
  h.Run(DivThenLoad({0xF7, 0xF3}),  // div ebx
        DivInput(0xFFFFFFFF00000005ULL, 2, 3));

  ASSERT_EQ(1U, h.contract->paths.size());
  EXPECT_EQ(0x80000002ULL, h.contract->paths[0].rax);
  EXPECT_EQ(1ULL, h.contract->paths[0].rdx);
}

TEST(DivOverflowTest, Divide16KeepsUpperBits) {
  Harness<arch::DivOverflowContract> h;
  h.Run(DivThenLoad({0x66, 0xF7, 0xF3}),  // div bx
        DivInput(0x1234000000000005ULL, 2, 3));

  ASSERT_EQ(1U, h.contract->paths.size());
  EXPECT_EQ(0x1234000000008002ULL, h.contract->paths[0].rax);
  EXPECT_EQ(1ULL, h.contract->paths[0].rdx);
}

TEST(DivOverflowTest, Divide8WritesAlAndAh) {
  Harness<arch::DivOverflowContract> h;
  h.Run(DivThenLoad({0xF6, 0xF3}),  // div bl
        DivInput(0x1111000000000305ULL, 2, 0));

  // 0x305 / 2 is 0x182, remainder 1.
  ASSERT_EQ(1U, h.contract->paths.size());
  EXPECT_EQ(0x1111000000000182ULL, h.contract->paths[0].rax);
}

TEST(DivOverflowTest, MemoryDivisor) {
  Harness<arch::DivOverflowContract> h;
  auto result = h.Run(DivThenLoad({0x49, 0xF7, 0x36}),  // div qword [r14]
                      DivInput(5, 0, 3));

  EXPECT_EQ(UC_ERR_EXCEPTION, result.fault);
  ASSERT_EQ(1U, h.contract->paths.size());
  EXPECT_EQ(0x8000000000000002ULL, h.contract->paths[0].rax);
  EXPECT_EQ(1ULL, h.contract->paths[0].rdx);
}

TEST(DivOverflowTest, DivideByZeroIsNotSpeculated) {
  Harness<arch::DivOverflowContract> h;
  auto result = h.Run(DivThenLoad({0x48, 0xF7, 0xF3}), DivInput(5, 0, 0));

  EXPECT_EQ(UC_ERR_EXCEPTION, result.fault);
  EXPECT_EQ(0U, h.contract->max_depth);
  EXPECT_FALSE(Observed(result, kSandboxBase + 0x200));
}

TEST(DivOverflowTest, NoOverflowNoSpeculation) {
  Harness<arch::DivOverflowContract> h;
  auto result = h.Run(DivThenLoad({0x48, 0xF7, 0xF3}), DivInput(5, 2, 0));

  EXPECT_EQ(0, result.fault);
  EXPECT_EQ(0U, h.contract->max_depth);
  EXPECT_EQ(2ULL, h.model.ReadReg(UC_X86_REG_RAX));
  EXPECT_EQ(1ULL, h.model.ReadReg(UC_X86_REG_RDX));
}

TEST(DivOverflowDeathTest, SignedDivideIsUnimplemented) {
  EXPECT_EXIT({
    Harness<arch::DivOverflowContract> h;
    h.Run(DivThenLoad({0x48, 0xF7, 0xFB}),  // idiv rbx
          DivInput(0, 1, 0x4000000000000000ULL));
  }, ::testing::ExitedWithCode(EXIT_FAILURE), "Unimplemented");
}

TEST(DivOverflowTest, FaultingDivisorLoadIsNotAnOverflow) {
  Harness<arch::DivOverflowContract> h;

  // div qword [r14+0x1000]   ; Faulty region.
  // mov rbx, [r14+rax]
  auto code = Code({
    0x49, 0xF7, 0xB6, 0x00, 0x10, 0x00, 0x00,
    0x49, 0x8B, 0x1C, 0x06
  });
  auto result = h.Run(code, MakeInput({{5, 0, 0, 3, 0, 0, 0}},
                                      {{kFaultyOffset, 2}}));

  EXPECT_EQ(UC_ERR_READ_PROT, result.fault);
  ASSERT_EQ(1U, h.contract->paths.size());
  const auto &path = h.contract->paths[0];
  EXPECT_EQ(5ULL, path.rax);
  EXPECT_EQ(3ULL, path.rdx);
  EXPECT_TRUE(path.dependencies.Contains(arch::Reg::kRAX));
  EXPECT_TRUE(path.dependencies.Contains(arch::Reg::kRDX));
  EXPECT_TRUE(path.dependencies.Contains(arch::Reg::kRBX));
  EXPECT_FALSE(Observed(result, kSandboxBase + 5));
}

TEST(DivOverflowTest, FaultingSignedDivisorLoadIsNotAnOverflow) {
  Harness<arch::DivOverflowContract> h;

  // idiv qword [r14+0x1000]
  auto code = Code({0x49, 0xF7, 0xBE, 0x00, 0x10, 0x00, 0x00});
  auto result = h.Run(code, MakeInput({{5, 0, 0, 0x4000000000000000ULL,
                                        0, 0, 0}},
                                      {{kFaultyOffset, 1}}));

  EXPECT_EQ(UC_ERR_READ_PROT, result.fault);
  ASSERT_EQ(1U, h.contract->paths.size());
  EXPECT_EQ(5ULL, h.contract->paths[0].rax);
  EXPECT_EQ(0x4000000000000000ULL, h.contract->paths[0].rdx);
}
