/* Copyright 2026 The contracer Authors, all rights reserved. */

#include "contracer/input/input.h"

#include <fstream>
#include <sstream>

namespace contracer {
namespace input {
namespace {

static uint64_t ReadLittleEndian(const std::string &data, size_t offset) {
  uint64_t val = 0;
  for (auto i = 0U; i < 8; ++i) {
    val |= static_cast<uint64_t>(static_cast<uint8_t>(data[offset + i]))
           << (8 * i);
  }
  return val;
}

}  // namespace

Input::Input(void)
    : memory(kInputMemorySize, '\0') {
  registers.fill(0);
}

Input::Input(const RegisterValues &registers_, std::string memory_)
    : registers(registers_),
      memory(std::move(memory_)) {
  memory.resize(kInputMemorySize, '\0');
}

bool Input::TryParse(const std::string &data, Input *input) {
  if (kInputFileSize != data.size()) {
    return false;
  }
  RegisterValues regs;
  for (auto i = 0U; i < arch::kNumInputRegisters; ++i) {
    regs[i] = ReadLittleEndian(data, kInputMemorySize + i * 8);
  }
  *input = Input(regs, data.substr(0, kInputMemorySize));
  return true;
}

bool Input::TryLoad(const std::string &path, Input *input) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return TryParse(buffer.str(), input);
}

uint64_t Input::MemoryWord(size_t offset) const {
  CONTRACER_ASSERT(offset + 8 <= memory.size());
  return ReadLittleEndian(memory, offset);
}

InputTaint::InputTaint(void)
    : memory(kInputMemorySize / 8, false) {
  registers.fill(false);
}

}  // namespace input
}  // namespace contracer
