/* Copyright 2026 The contracer Authors, all rights reserved. */

#ifndef CONTRACER_INPUT_INPUT_H_
#define CONTRACER_INPUT_INPUT_H_

#include "contracer/arch/x86/target.h"

#include <array>
#include <string>
#include <vector>

namespace contracer {
namespace input {

enum : size_t {
  // Memory of the main and faulty sandbox regions.
  kInputMemorySize = 8192,

  // On-disk size of an input: memory image followed by the register values.
  kInputFileSize = kInputMemorySize + arch::kNumInputRegisters * 8
};

// Initial architectural state of one run of a test case: register values
// and a flat image of the sandbox memory.
class Input {
 public:
  Input(void);

  typedef std::array<uint64_t, arch::kNumInputRegisters> RegisterValues;

  Input(const RegisterValues &registers_, std::string memory_);

  // Parses the on-disk form of an input. Returns `false` if `data` has the
  // wrong size.
  static bool TryParse(const std::string &data, Input *input);

  // Reads an input from a file. Returns `false` if the file can't be read
  // or doesn't hold exactly one input.
  static bool TryLoad(const std::string &path, Input *input);

  inline const RegisterValues &Registers(void) const {
    return registers;
  }

  inline const std::string &Memory(void) const {
    return memory;
  }

  // Reads the little-endian 64-bit word at `offset` of the memory image.
  uint64_t MemoryWord(size_t offset) const;

 private:
  RegisterValues registers;
  std::string memory;
};

typedef std::vector<Input> InputList;

// Marks which parts of an input influence the observations of a run.
struct InputTaint {
  InputTaint(void);

  std::array<bool, arch::kNumInputRegisters> registers;

  // One entry per 8-byte word of the memory image.
  std::vector<bool> memory;
};

}  // namespace input
}  // namespace contracer

#endif  // CONTRACER_INPUT_INPUT_H_
