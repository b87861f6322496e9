/* Copyright 2026 The contracer Authors, all rights reserved. */

#include <gtest/gtest.h>

#include "tests/test_util.h"

using namespace contracer;
using namespace contracer::test;

namespace {

// mov [r14], rbx
// mov rcx, [r14]
static const std::string kStoreThenLoad = Code({
  0x49, 0x89, 0x1E,
  0x49, 0x8B, 0x0E
});

}  // namespace

TEST(BypassTest, LoadSeesTheOldValueSpeculatively) {
  Harness<model::BypassContract> h;
  auto result = h.Run(kStoreThenLoad,
                      MakeInput({{0, 0x80, 0, 0, 0, 0, 0}}, {{0, 0x40}}));

  ASSERT_EQ(1U, h.contract->paths.size());
  EXPECT_EQ(0x40ULL, h.contract->paths[0].rcx);

  // The store executes once the bypass is rolled back, and isn't bypassed a
  // second time.
  EXPECT_EQ(1U, h.contract->max_depth);
  EXPECT_EQ(0x80ULL, h.model.ReadReg(UC_X86_REG_RCX));
  EXPECT_EQ(0x80ULL, h.model.ReadMemWord(kSandboxBase, 8));

  std::vector<uint64_t> expected = {kSandboxBase, kSandboxBase, kSandboxBase};
  EXPECT_EQ(expected, result.observations);
}

TEST(BypassTest, NestedStores) {
  Harness<model::BypassContract> h;

  // mov [r14], rbx
  // mov [r14+8], rbx
  // mov rcx, [r14]
  auto code = Code({
    0x49, 0x89, 0x1E,
    0x49, 0x89, 0x5E, 0x08,
    0x49, 0x8B, 0x0E
  });
  h.Run(code, MakeInput({{0, 0x80, 0, 0, 0, 0, 0}}, {{0, 0x40}, {8, 0x41}}));

  EXPECT_EQ(2U, h.contract->max_depth);
  EXPECT_FALSE(h.model.InSpeculation());
  EXPECT_EQ(0x80ULL, h.model.ReadMemWord(kSandboxBase, 8));
  EXPECT_EQ(0x80ULL, h.model.ReadMemWord(kSandboxBase + 8, 8));
}

TEST(BypassTest, CondBypassForksOnBoth) {
  Harness<arch::CondBypassContract> h;

  // jz +3
  // mov [r14], rbx
  // mov rcx, [r14]
  auto code = Code({
    0x74, 0x03,
    0x49, 0x89, 0x1E,
    0x49, 0x8B, 0x0E
  });
  h.Run(code, MakeInput({{0, 0x80, 0, 0, 0, 0, arch::kFlagZF}}, {{0, 0x40}}));

  EXPECT_EQ(2U, h.contract->max_depth);
  EXPECT_EQ(0x40ULL, h.model.ReadReg(UC_X86_REG_RCX));
  EXPECT_EQ(0x40ULL, h.model.ReadMemWord(kSandboxBase, 8));
}
