/* Copyright 2026 The contracer Authors, all rights reserved. */

#include <gtest/gtest.h>

#include "tests/test_util.h"

using namespace contracer;
using namespace contracer::test;

namespace {

static arch::BranchDecision DecodeBranch(std::vector<uint8_t> bytes,
                                         uint64_t flags, uint64_t rcx = 0) {
  return arch::DecodeConditionalBranch(bytes.data(), bytes.size(), flags,
                                       rcx);
}

// jz +7
// mov rax, [r14+0x200]
// mov rcx, [r14+0x300]
static const std::string kJumpOverLoad = Code({
  0x74, 0x07,
  0x49, 0x8B, 0x86, 0x00, 0x02, 0x00, 0x00,
  0x49, 0x8B, 0x8E, 0x00, 0x03, 0x00, 0x00
});

}  // namespace

TEST(CondTest, ShortBranches) {
  auto jz = DecodeBranch({0x74, 0x05}, arch::kFlagZF);
  EXPECT_EQ(arch::BranchKind::kConditional, jz.kind);
  EXPECT_EQ(5, jz.displacement);
  EXPECT_TRUE(jz.will_jump);

  EXPECT_FALSE(DecodeBranch({0x74, 0x05}, 0).will_jump);

  auto backward = DecodeBranch({0x75, 0xFE}, 0);
  EXPECT_EQ(-2, backward.displacement);
  EXPECT_TRUE(backward.will_jump);

  EXPECT_TRUE(DecodeBranch({0x7C, 0x00}, arch::kFlagSF).will_jump);  // jl
  EXPECT_FALSE(DecodeBranch({0x7C, 0x00},
                            arch::kFlagSF | arch::kFlagOF).will_jump);
  EXPECT_TRUE(DecodeBranch({0x76, 0x00}, arch::kFlagCF).will_jump);  // jbe
  EXPECT_FALSE(DecodeBranch({0x77, 0x00}, arch::kFlagZF).will_jump);  // jnbe
}

TEST(CondTest, NearBranches) {
  auto jz = DecodeBranch({0x0F, 0x84, 0x10, 0x00, 0x00, 0x00}, 0);
  EXPECT_EQ(arch::BranchKind::kConditional, jz.kind);
  EXPECT_EQ(16, jz.displacement);
  EXPECT_FALSE(jz.will_jump);

  auto jno = DecodeBranch({0x0F, 0x81, 0xF0, 0xFF, 0xFF, 0xFF}, 0);
  EXPECT_EQ(-16, jno.displacement);
  EXPECT_TRUE(jno.will_jump);
}

TEST(CondTest, LoopsAndRcx) {
  auto loop = DecodeBranch({0xE2, 0x02}, arch::kFlagZF, 1);
  EXPECT_EQ(arch::BranchKind::kLoop, loop.kind);
  EXPECT_FALSE(loop.will_jump);
  EXPECT_TRUE(DecodeBranch({0xE2, 0x02}, 0, 5).will_jump);

  EXPECT_TRUE(DecodeBranch({0xE1, 0x02}, arch::kFlagZF, 5).will_jump);
  EXPECT_FALSE(DecodeBranch({0xE1, 0x02}, 0, 5).will_jump);
  EXPECT_TRUE(DecodeBranch({0xE0, 0x02}, 0, 5).will_jump);

  auto jrcxz = DecodeBranch({0xE3, 0x02}, 0, 0);
  EXPECT_EQ(arch::BranchKind::kConditional, jrcxz.kind);
  EXPECT_TRUE(jrcxz.will_jump);
  EXPECT_FALSE(DecodeBranch({0xE3, 0x02}, 0, 1).will_jump);
}

TEST(CondTest, NotABranch) {
  EXPECT_EQ(arch::BranchKind::kNotABranch,
            DecodeBranch({0x90, 0x90}, 0).kind);
  EXPECT_EQ(arch::BranchKind::kNotABranch,
            DecodeBranch({0x0F, 0x05, 0, 0, 0, 0}, 0).kind);
  EXPECT_EQ(arch::BranchKind::kNotABranch, DecodeBranch({0x74}, 0).kind);
  EXPECT_EQ(arch::BranchKind::kNotABranch,
            DecodeBranch({0x0F, 0x84, 0x10}, 0).kind);
  EXPECT_EQ(arch::BranchKind::kNotABranch,
            DecodeBranch({0x2E, 0x74, 0x02}, arch::kFlagZF).kind);
}

TEST(CondTest, TakenBranchSpeculatesFallThrough) {
  Harness<arch::CondContract> h;
  auto result = h.Run(kJumpOverLoad,
                      MakeInput({{0, 0, 0, 0, 0, 0, arch::kFlagZF}}));
  std::vector<uint64_t> expected = {
    kSandboxBase + 0x200, kSandboxBase + 0x300,  // Mispredicted.
    kSandboxBase + 0x300
  };
  EXPECT_EQ(expected, result.observations);
  EXPECT_EQ(1U, h.contract->max_depth);
  EXPECT_EQ(0, result.fault);
}

TEST(CondTest, NotTakenBranchSpeculatesTarget) {
  Harness<arch::CondContract> h;
  auto result = h.Run(kJumpOverLoad, MakeInput({{0, 0, 0, 0, 0, 0, 0}}));
  std::vector<uint64_t> expected = {
    kSandboxBase + 0x300,  // Mispredicted.
    kSandboxBase + 0x200, kSandboxBase + 0x300
  };
  EXPECT_EQ(expected, result.observations);
}

TEST(CondTest, NoSpeculationWithoutNesting) {
  Harness<arch::CondContract> cond;
  Harness<model::Contract> seq;
  auto input = MakeInput({{0, 0, 0, 0, 0, 0, arch::kFlagZF}});
  auto cond_result = cond.Run(kJumpOverLoad, input, 0);
  auto seq_result = seq.Run(kJumpOverLoad, input);
  EXPECT_EQ(seq_result.observations, cond_result.observations);
  EXPECT_EQ(seq_result.ctrace, cond_result.ctrace);
  EXPECT_EQ(0U, cond.contract->max_depth);
}

// loop +7
// mov rax, [r14+0x200]
// mov rdx, [r14+0x300]
TEST(CondTest, LoopDecrementsRcxOnBothPaths) {
  Harness<arch::CondContract> h;
  auto code = Code({
    0xE2, 0x07,
    0x49, 0x8B, 0x86, 0x00, 0x02, 0x00, 0x00,
    0x49, 0x8B, 0x96, 0x00, 0x03, 0x00, 0x00
  });
  auto result = h.Run(code, MakeInput({{0, 0, 1, 0, 0, 0, arch::kFlagZF}}));

  ASSERT_EQ(1U, h.contract->paths.size());
  EXPECT_EQ(0ULL, h.contract->paths[0].rcx);
  EXPECT_EQ(0ULL, h.model.ReadReg(UC_X86_REG_RCX));

  std::vector<uint64_t> expected = {
    kSandboxBase + 0x300,  // Mispredicted.
    kSandboxBase + 0x200, kSandboxBase + 0x300
  };
  EXPECT_EQ(expected, result.observations);
}

TEST(CondTest, DepthIsBounded) {
  auto code = Code({0x74, 0x00, 0x74, 0x00, 0x74, 0x00, 0x74, 0x00, 0x90});
  for (auto nesting = 1; nesting <= 3; ++nesting) {
    Harness<arch::CondContract> h;
    h.Run(code, MakeInput({{0, 0, 0, 0, 0, 0, 0}}), nesting);
    EXPECT_EQ(static_cast<size_t>(nesting), h.contract->max_depth);
    EXPECT_FALSE(h.model.InSpeculation());
  }
}

// jz +3
// mov [r14], rbx
// nop
TEST(CondTest, SpeculativeStoreIsUndone) {
  Harness<arch::CondContract> h;
  auto code = Code({0x74, 0x03, 0x49, 0x89, 0x1E, 0x90});
  auto result = h.Run(code, MakeInput({{0, 0x1234, 0, 0, 0, 0, arch::kFlagZF}},
                                      {{0, 0x5678}}));
  EXPECT_TRUE(Observed(result, kSandboxBase));
  EXPECT_EQ(0x5678ULL, h.model.ReadMemWord(kSandboxBase, 8));
}
