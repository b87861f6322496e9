/* Copyright 2026 The contracer Authors, all rights reserved. */

#include <gtest/gtest.h>

#include "tests/test_util.h"

using namespace contracer;
using namespace contracer::test;

namespace {

enum : uint64_t {
  kNonCanonicalSandbox = kSandboxBase | (1ULL << 48)
};

// mov rax, [rbx]          ; Non-canonical base.
// mov rcx, [r14+rax]      ; Only the address depends on the fault.
// mov rdx, rax            ; The data depends on the fault.
static const std::string kNonCanonicalLoad = Code({
  0x48, 0x8B, 0x03,
  0x49, 0x8B, 0x0C, 0x06,
  0x48, 0x89, 0xC2
});

}  // namespace

TEST(NonCanonicalTest, CorrectedLoadExecutesSpeculatively) {
  Harness<arch::NonCanonicalContract> h;
  auto result = h.Run(kNonCanonicalLoad,
                      MakeInput({{0, kNonCanonicalSandbox, 0, 0x33, 0, 0, 0}},
                                {{0, 0x40}}));

  EXPECT_EQ(UC_ERR_READ_UNMAPPED, result.fault);
  EXPECT_EQ(1U, h.contract->max_depth);
  EXPECT_TRUE(Observed(result, kSandboxBase + 0x40));

  ASSERT_EQ(1U, h.contract->paths.size());
  const auto &path = h.contract->paths[0];
  EXPECT_EQ(kSandboxBase, path.rbx);
  EXPECT_EQ(0x40ULL, path.rax);
  EXPECT_EQ(0x33ULL, path.rdx);
  EXPECT_TRUE(path.dependencies.Contains(arch::Reg::kRDX));
  EXPECT_FALSE(path.dependencies.Contains(arch::Reg::kRCX));

  // Rolling back brings back the non-canonical address.
  EXPECT_EQ(static_cast<uint64_t>(kNonCanonicalSandbox),
            h.model.ReadReg(UC_X86_REG_RBX));
}

TEST(NonCanonicalTest, CanonicalAddressesDontFault) {
  Harness<arch::NonCanonicalContract> h;
  auto result = h.Run(kNonCanonicalLoad,
                      MakeInput({{0, kSandboxBase, 0, 0x33, 0, 0, 0}},
                                {{0, 0x40}}));

  EXPECT_EQ(0, result.fault);
  EXPECT_EQ(0U, h.contract->max_depth);
  EXPECT_EQ(0x40ULL, h.model.ReadReg(UC_X86_REG_RDX));
}
