/* Copyright 2026 The contracer Authors, all rights reserved. */

#ifndef CONTRACER_MODEL_TAINT_H_
#define CONTRACER_MODEL_TAINT_H_

#include "contracer/arch/instruction.h"
#include "contracer/input/input.h"

#include <map>
#include <set>
#include <vector>

namespace contracer {
namespace model {

// Tracks which parts of an input flow into the observations of a run.
//
// Every register and every 8-byte word of the input's memory image is a
// label. Each location in the machine state carries the set of input labels
// its current value depends on; an observation taints the labels of the
// locations that produced it.
class TaintTracker {
 public:
  TaintTracker(bool observe_pc_, bool observe_addresses_,
               Addr sandbox_base_);
  virtual ~TaintTracker(void);

  // Starts tracking `instr`, finishing the previous instruction first.
  void StartInstruction(const arch::Instruction &instr);

  void TrackMemAccess(Addr address, size_t size, bool is_write);

  // Applies the data flow of the pending instruction.
  void FinalizeInstruction(void);

  // Forgets the pending instruction, e.g. because it faulted.
  void DiscardInstruction(void);

  void Checkpoint(void);
  void Rollback(void);

  input::InputTaint Taint(void) const;

 protected:
  // Index of `reg` within an input's register values, or `-1` if inputs
  // don't initialize it.
  virtual int InputIndex(arch::Reg reg) const = 0;

 private:
  typedef uint32_t Label;
  typedef std::set<Label> LabelSet;

  Label RegLabel(arch::Reg reg) const;
  void AddMemLabels(Addr address, size_t size, LabelSet *labels) const;
  LabelSet DepsOf(Label label) const;
  void Observe(const LabelSet &labels);

  const bool observe_pc;
  const bool observe_addresses;
  const Addr sandbox_base;

  bool has_pending;
  LabelSet srcs;
  LabelSet dests;
  LabelSet observed;

  std::map<Label, LabelSet> deps;
  std::vector<std::map<Label, LabelSet>> checkpoints;

  LabelSet tainted;

  CONTRACER_DISALLOW_COPY_AND_ASSIGN(TaintTracker);
};

}  // namespace model
}  // namespace contracer

#endif  // CONTRACER_MODEL_TAINT_H_
