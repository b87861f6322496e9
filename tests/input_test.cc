/* Copyright 2026 The contracer Authors, all rights reserved. */

#include <gtest/gtest.h>

#include "contracer/input/input.h"

using namespace contracer;

namespace {

static void PutWord(std::string *data, size_t offset, uint64_t val) {
  for (auto i = 0U; i < 8; ++i) {
    (*data)[offset + i] = static_cast<char>(val >> (8 * i));
  }
}

}  // namespace

TEST(InputTest, ParsesMemoryThenRegisters) {
  std::string data(input::kInputFileSize, '\0');
  PutWord(&data, 0x10, 0x1122334455667788ULL);
  PutWord(&data, input::kInputMemorySize, 0xAAULL);  // RAX
  PutWord(&data, input::kInputMemorySize + 6 * 8, 0x8D7ULL);  // FLAGS

  input::Input in;
  ASSERT_TRUE(input::Input::TryParse(data, &in));
  EXPECT_EQ(0xAAULL, in.Registers()[0]);
  EXPECT_EQ(0ULL, in.Registers()[1]);
  EXPECT_EQ(0x8D7ULL, in.Registers()[arch::kInputFlagsIndex]);
  EXPECT_EQ(input::kInputMemorySize, in.Memory().size());
  EXPECT_EQ(0x1122334455667788ULL, in.MemoryWord(0x10));
}

TEST(InputTest, RejectsWrongSize) {
  input::Input in;
  EXPECT_FALSE(input::Input::TryParse(std::string(10, '\0'), &in));
  EXPECT_FALSE(input::Input::TryParse(
      std::string(input::kInputFileSize + 1, '\0'), &in));
  EXPECT_FALSE(input::Input::TryLoad("/nonexistent/contracer/input", &in));
}

TEST(InputTest, ShortMemoryIsZeroExtended) {
  input::Input::RegisterValues regs;
  regs.fill(1);
  input::Input in(regs, "ab");
  EXPECT_EQ(input::kInputMemorySize, in.Memory().size());
  EXPECT_EQ(0x6261ULL, in.MemoryWord(0));
  EXPECT_EQ(0ULL, in.MemoryWord(0x100));
}

TEST(InputTest, TaintCoversEveryWord) {
  input::InputTaint taint;
  EXPECT_EQ(input::kInputMemorySize / 8, taint.memory.size());
  for (auto reg : taint.registers) {
    EXPECT_FALSE(reg);
  }
}
