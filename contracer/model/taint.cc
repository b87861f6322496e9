/* Copyright 2026 The contracer Authors, all rights reserved. */

#include "contracer/model/taint.h"

namespace contracer {
namespace model {
namespace {

enum : uint32_t {
  // Memory labels follow the register labels.
  kMemLabelBase = 0x100,
  kWordSize = 8
};

}  // namespace

TaintTracker::TaintTracker(bool observe_pc_, bool observe_addresses_,
                           Addr sandbox_base_)
    : observe_pc(observe_pc_),
      observe_addresses(observe_addresses_),
      sandbox_base(sandbox_base_),
      has_pending(false) {}

TaintTracker::~TaintTracker(void) {}

TaintTracker::Label TaintTracker::RegLabel(arch::Reg reg) const {
  return static_cast<Label>(reg);
}

// Adds the labels of the words of the input's memory image covered by
// `[address, address + size)`. Accesses outside of the image have no label.
void TaintTracker::AddMemLabels(Addr address, size_t size,
                                LabelSet *labels) const {
  auto end = address + size;
  for (auto word = address & ~(Addr(kWordSize) - 1); word < end;
       word += kWordSize) {
    if (word < sandbox_base) continue;
    auto offset = word - sandbox_base;
    if (offset >= input::kInputMemorySize) break;
    labels->insert(kMemLabelBase + static_cast<Label>(offset / kWordSize));
  }
}

// Returns the input labels that the location `label` depends on. Until
// something overwrites it, an input location depends on itself.
TaintTracker::LabelSet TaintTracker::DepsOf(Label label) const {
  auto it = deps.find(label);
  if (it != deps.end()) return it->second;

  LabelSet self;
  if (label >= kMemLabelBase ||
      0 <= InputIndex(static_cast<arch::Reg>(label))) {
    self.insert(label);
  }
  return self;
}

void TaintTracker::Observe(const LabelSet &labels) {
  for (auto label : labels) {
    auto label_deps = DepsOf(label);
    tainted.insert(label_deps.begin(), label_deps.end());
  }
}

void TaintTracker::StartInstruction(const arch::Instruction &instr) {
  FinalizeInstruction();
  if (!instr.IsValid()) return;

  has_pending = true;
  for (const auto &op : instr.operands) {
    if (op.IsRegister()) {
      if (arch::Reg::kInvalid == op.reg) continue;
      if (op.is_src) srcs.insert(RegLabel(op.reg));
      if (op.is_dest) dests.insert(RegLabel(op.reg));

    } else if (op.IsFlags()) {
      for (auto flag : op.flags_read.Members()) srcs.insert(RegLabel(flag));
      for (auto flag : op.flags_written.Members()) {
        dests.insert(RegLabel(flag));
      }

    // Memory labels are added by `TrackMemAccess`, once the effective
    // address is known.
    } else if (op.IsMemory() || arch::OperandKind::kAddressGen == op.kind) {
      auto addr_regs = op.AddressRegs();
      for (auto reg : addr_regs.Members()) {
        if (op.IsMemory()) {
          if (observe_addresses) observed.insert(RegLabel(reg));
        } else {
          srcs.insert(RegLabel(reg));  // `LEA` computes data.
        }
      }
    }
  }

  // The direction of a branch is observable through the program counter.
  if (observe_pc && instr.IsBranch()) {
    observed.insert(srcs.begin(), srcs.end());
  }
}

void TaintTracker::TrackMemAccess(Addr address, size_t size, bool is_write) {
  if (!has_pending) return;
  if (is_write) {
    AddMemLabels(address, size, &dests);
  } else {
    AddMemLabels(address, size, &srcs);
  }
}

void TaintTracker::FinalizeInstruction(void) {
  if (!has_pending) return;

  Observe(observed);

  LabelSet flow;
  for (auto src : srcs) {
    auto src_deps = DepsOf(src);
    flow.insert(src_deps.begin(), src_deps.end());
  }
  for (auto dest : dests) {
    deps[dest] = flow;
  }
  DiscardInstruction();
}

void TaintTracker::DiscardInstruction(void) {
  has_pending = false;
  srcs.clear();
  dests.clear();
  observed.clear();
}

// The pending instruction belongs to the new speculative path. Observations
// made on a speculative path stay tainted after the rollback.
void TaintTracker::Checkpoint(void) {
  checkpoints.push_back(deps);
}

void TaintTracker::Rollback(void) {
  CONTRACER_ASSERT(!checkpoints.empty());
  DiscardInstruction();
  deps.swap(checkpoints.back());
  checkpoints.pop_back();
}

input::InputTaint TaintTracker::Taint(void) const {
  input::InputTaint taint;
  for (auto label : tainted) {
    if (label >= kMemLabelBase) {
      auto word = label - kMemLabelBase;
      if (word < taint.memory.size()) taint.memory[word] = true;
    } else {
      auto index = InputIndex(static_cast<arch::Reg>(label));
      if (0 <= index) taint.registers[static_cast<size_t>(index)] = true;
    }
  }
  return taint;
}

}  // namespace model
}  // namespace contracer
