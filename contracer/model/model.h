/* Copyright 2026 The contracer Authors, all rights reserved. */

#ifndef CONTRACER_MODEL_MODEL_H_
#define CONTRACER_MODEL_MODEL_H_

#include "contracer/arch/instruction.h"
#include "contracer/input/input.h"
#include "contracer/model/contract.h"
#include "contracer/model/emulator.h"
#include "contracer/model/taint.h"
#include "contracer/model/tracer.h"

#include <iosfwd>
#include <string>
#include <vector>

namespace contracer {
namespace model {

// Sandbox layout. The sandbox is surrounded by overflow regions so that small
// out-of-bounds accesses still hit mapped memory:
//
//    lower overflow | main region | faulty region | upper overflow
//                   ^ sandbox base
//
// The main and faulty regions hold an input's memory image. The upper
// overflow also holds a copy of the input's register values, followed by
// the initial stack pointer.
enum : uint64_t {
  kCodeSize = 0x1000,
  kMainRegionSize = 0x1000,
  kFaultyRegionSize = 0x1000,
  kOverflowRegionSize = 0x1000,
  kSandboxSize = 2 * kOverflowRegionSize + kMainRegionSize +
                 kFaultyRegionSize,

  kDefaultSandboxBase = 0x1000000,
  kDefaultCodeStart = 0x8000
};

static_assert(input::kInputMemorySize == kMainRegionSize + kFaultyRegionSize,
              "Input memory must cover the main and faulty regions.");

// Original bytes of one store executed during speculation.
struct StoreLogEntry {
  Addr address;
  std::string bytes;
};

typedef std::vector<StoreLogEntry> StoreLog;

// State of the speculative contracts that changes while tracing one input.
// It is reset whenever an input is loaded.
struct RunContext {
  RunContext(void);

  // Fault raised by a contract from within a hook; it is handled as if the
  // emulator had raised it. Zero if none.
  int pending_fault;

  // Address of the instruction being executed, and of the one after it.
  Addr curr_instr;
  Addr next_instr;

  // Last instruction at which a fault was speculated on.
  Addr last_faulty_instr;

  // Address at which emulation resumed after the last rollback. Cleared once
  // the instruction there is reached.
  Addr rollback_target;

  // A fault on the faulty region was turned into a speculative zero load
  // that hasn't executed yet.
  bool injection_pending;

  // Value of the last memory read, i.e. the divisor of a faulting `DIV`
  // with a memory operand.
  uint64_t div_value;

  // Registers and flags whose values depend on a speculated fault, with one
  // saved copy per checkpoint.
  arch::RegSet dependencies;
  std::vector<arch::RegSet> dependency_checkpoints;

  // A non-canonical address was corrected; `fault_context` holds the state
  // before the correction.
  bool correction_pending;
  emulator::Context fault_context;
};

// Result of tracing one input.
struct TraceResult {
  TraceResult(void);

  uint64_t ctrace;
  std::vector<uint64_t> observations;

  // First fault raised outside of speculation, or zero.
  int fault;

  // Only filled in when taint tracking is enabled.
  input::InputTaint taint;
};

// Contract model. Emulates a test case on an input, forking and rolling back
// speculative paths as directed by a contract, and records the observations
// of every path.
class Model {
 public:
  Model(std::unique_ptr<Contract> contract_, ObservationClause clause,
        Addr sandbox_base_, Addr code_start_);
  virtual ~Model(void);

  // Loads the machine code of a test case. The code can be at most
  // `kCodeSize` bytes long.
  void LoadTestCase(const std::string &code);

  // Traces every input, in order, with at most `nesting` nested speculative
  // paths.
  std::vector<TraceResult> TraceTestCase(const input::InputList &inputs,
                                         int nesting, bool enable_taint);

  TraceResult TraceInput(const input::Input &input, int nesting,
                         bool enable_taint);

  // Prints the main registers of the current CPU state.
  virtual void PrintState(std::ostream &os) const = 0;

  // Checkpoint stack.
  void Checkpoint(Addr next_pc);
  Addr Rollback(void);

  inline size_t NumCheckpoints(void) const {
    return checkpoints.size();
  }

  inline bool InSpeculation(void) const {
    return !checkpoints.empty();
  }

  inline bool CanSpeculate(void) const {
    return checkpoints.size() < static_cast<size_t>(nesting);
  }

  inline int Nesting(void) const {
    return nesting;
  }

  // Log the original bytes of `[address, address + size)` into the store log
  // of the newest checkpoint.
  void LogStore(Addr address, size_t size);

  // CPU and memory state.
  uint64_t ReadReg(int reg) const;
  void WriteReg(int reg, uint64_t val);
  uint64_t ReadMemWord(Addr address, size_t size) const;
  std::string ReadMem(Addr address, size_t size) const;
  void WriteMem(Addr address, const std::string &data);
  void WriteMem(Addr address, const void *data, size_t size);
  void SetPC(Addr pc);
  void StopEmulation(void);

  // Snapshot of the CPU state before the current instruction. Faults resume
  // from it.
  void SavePreviousContext(void);
  void SaveContext(emulator::Context *context) const;
  void RestoreContext(const emulator::Context &context);
  void RestorePreviousContext(void);

  // Is all of `[address, address + size)` mapped?
  bool IsMapped(Addr address, size_t size) const;

  void ProtectFaultyRegion(void);
  void UnprotectFaultyRegion(void);
  bool IsInFaultyRegion(Addr address) const;

  inline RunContext &Context(void) {
    return ctx;
  }

  inline const arch::Instruction &CurrentInstruction(void) const {
    return current_instruction;
  }

  inline Contract *GetContract(void) const {
    return contract.get();
  }

  inline const Tracer &GetTracer(void) const {
    return tracer;
  }

  inline Addr SandboxBase(void) const {
    return sandbox_base;
  }

  inline Addr CodeStart(void) const {
    return code_start;
  }

  inline Addr CodeEnd(void) const {
    return code_end;
  }

  inline Addr StackBase(void) const {
    return sandbox_base + kMainRegionSize - 8;
  }

  inline Addr FaultyRegion(void) const {
    return sandbox_base + kMainRegionSize;
  }

  inline Addr LowerOverflowRegion(void) const {
    return sandbox_base - kOverflowRegionSize;
  }

  inline Addr UpperOverflowRegion(void) const {
    return sandbox_base + kMainRegionSize + kFaultyRegionSize;
  }

 protected:
  // Initializes the registers and memory from an input.
  virtual void LoadInput(const input::Input &input) = 0;

  virtual std::unique_ptr<TaintTracker> CreateTaintTracker(void) const = 0;

  // Emulator ID of the program counter.
  virtual int ProgramCounter(void) const = 0;

 private:
  struct CheckpointEntry {
    emulator::Context context;
    Addr next_pc;
    unsigned speculation_window;
  };

  static void TraceInstruction(uc_engine *, uint64_t address, uint32_t size,
                               void *data);
  static void TraceMemAccess(uc_engine *, uc_mem_type type, uint64_t address,
                             int size, int64_t value, void *data);

  void OnInstruction(Addr pc, size_t size);
  void OnMemAccess(uc_mem_type type, Addr address, size_t size,
                   int64_t value);

  void Reset(void);
  int Emulate(void);

  // Declared first: saved contexts must be freed before the engine closes.
  emulator::Engine engine;

  const std::unique_ptr<Contract> contract;
  Tracer tracer;
  std::unique_ptr<TaintTracker> taint;

  const Addr sandbox_base;
  const Addr code_start;
  Addr code_end;

  int nesting;
  unsigned speculation_window;

  std::vector<CheckpointEntry> checkpoints;
  std::vector<StoreLog> store_logs;

  // Original bytes of stores aborted by the contract. Restored when the
  // pending fault is handled.
  StoreLog aborted_stores;

  RunContext ctx;
  emulator::Context previous_context;
  arch::Instruction current_instruction;

  CONTRACER_DISALLOW_COPY_AND_ASSIGN(Model);
};

}  // namespace model
}  // namespace contracer

#endif  // CONTRACER_MODEL_MODEL_H_
