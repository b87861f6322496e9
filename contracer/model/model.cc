/* Copyright 2026 The contracer Authors, all rights reserved. */

#include "contracer/model/model.h"

#include <gflags/gflags.h>

#include <iostream>

DEFINE_bool(dbg_model, false, "Log every checkpoint, rollback, and "
                              "speculated fault of the model to stderr.");

DEFINE_uint64(max_spec_window, 250, "Maximum number of instructions "
                                    "executed on a speculative path before "
                                    "it is rolled back.");

DEFINE_bool(enable_faulty_page, true, "Should accesses to the faulty region "
                                      "fault for contracts that speculate on "
                                      "faults?");

DEFINE_uint64(emulation_timeout_us, 10000000, "Timeout, in microseconds, of "
                                              "each call into the emulator.");

namespace contracer {
namespace model {

RunContext::RunContext(void)
    : pending_fault(0),
      curr_instr(0),
      next_instr(0),
      last_faulty_instr(0),
      rollback_target(0),
      injection_pending(false),
      div_value(0),
      correction_pending(false) {}

TraceResult::TraceResult(void)
    : ctrace(0),
      fault(0) {}

Model::Model(std::unique_ptr<Contract> contract_, ObservationClause clause,
             Addr sandbox_base_, Addr code_start_)
    : engine(),
      contract(std::move(contract_)),
      tracer(clause),
      sandbox_base(sandbox_base_),
      code_start(code_start_),
      code_end(code_start_),
      nesting(0),
      speculation_window(0) {
  CONTRACER_ASSERT(nullptr != contract);
  CONTRACER_ASSERT(sandbox_base >= kOverflowRegionSize);
  CONTRACER_ASSERT(code_start + kCodeSize <= LowerOverflowRegion() ||
                   code_start >= LowerOverflowRegion() + kSandboxSize);

  engine.MapMem(code_start, kCodeSize, UC_PROT_ALL);
  engine.MapMem(LowerOverflowRegion(), kSandboxSize,
                  UC_PROT_READ | UC_PROT_WRITE);

  engine.AddCodeHook(&Model::TraceInstruction, this);
  engine.AddMemHook(UC_HOOK_MEM_READ | UC_HOOK_MEM_WRITE,
                      &Model::TraceMemAccess, this);
}

Model::~Model(void) {}

void Model::LoadTestCase(const std::string &code) {
  CONTRACER_ASSERT(code.size() <= kCodeSize);
  engine.WriteMem(code_start, std::string(kCodeSize, '\0'));
  engine.WriteMem(code_start, code);
  code_end = code_start + code.size();
}

std::vector<TraceResult> Model::TraceTestCase(const input::InputList &inputs,
                                              int nesting_,
                                              bool enable_taint) {
  std::vector<TraceResult> results;
  results.reserve(inputs.size());
  for (const auto &input : inputs) {
    results.push_back(TraceInput(input, nesting_, enable_taint));
  }
  return results;
}

TraceResult Model::TraceInput(const input::Input &input, int nesting_,
                              bool enable_taint) {
  CONTRACER_ASSERT(0 <= nesting_);
  nesting = nesting_;

  Reset();
  LoadInput(input);
  if (enable_taint) {
    taint = CreateTaintTracker();
  }

  TraceResult result;
  result.fault = Emulate();
  result.ctrace = tracer.ContractTrace();
  result.observations = tracer.Observations();
  if (taint) {
    result.taint = taint->Taint();
    taint.reset();
  }

  CONTRACER_MTRACE(
      std::cerr << "ctrace " << std::hex << result.ctrace << std::dec
                << " fault " << result.fault << std::endl;
      PrintState(std::cerr); )

  return result;
}

void Model::Reset(void) {
  checkpoints.clear();
  store_logs.clear();
  aborted_stores.clear();
  speculation_window = 0;
  ctx = RunContext();
  current_instruction = arch::Instruction();
  tracer.Reset();
  taint.reset();

  if (FLAGS_enable_faulty_page && contract->ProtectsFaultyRegion()) {
    ProtectFaultyRegion();
  } else {
    UnprotectFaultyRegion();
  }
}

// Runs the loaded test case until the architectural path ends, handling
// faults and rolling back every speculative path along the way. Returns the
// first fault raised outside of speculation.
int Model::Emulate(void) {
  auto arch_fault = 0;
  auto pc = code_start;
  while (true) {
    auto err = UC_ERR_OK;
    if (pc < code_end) {
      err = engine.Start(pc, code_end, FLAGS_emulation_timeout_us);
    }

    auto fault = UC_ERR_OK != err ? static_cast<int>(err) : ctx.pending_fault;
    ctx.pending_fault = 0;

    if (fault) {
      // Go back to just before the faulting instruction.
      RestorePreviousContext();
      for (auto it = aborted_stores.rbegin(); it != aborted_stores.rend();
           ++it) {
        engine.WriteMem(it->address, it->bytes);
      }
      aborted_stores.clear();
      if (taint) taint->DiscardInstruction();

      CONTRACER_MTRACE(
          std::cerr << "  fault " << fault << " at " << std::hex
                    << ctx.curr_instr << std::dec << std::endl; )

      if (!InSpeculation() && !arch_fault) {
        arch_fault = fault;
      }
      pc = contract->SpeculateFault(this, fault);
      if (pc) continue;
      if (!InSpeculation()) break;

    } else if (!InSpeculation()) {
      if (taint) taint->FinalizeInstruction();
      break;
    }

    pc = Rollback();
  }
  return arch_fault;
}

void Model::Checkpoint(Addr next_pc) {
  CheckpointEntry entry;
  engine.SaveContext(&(entry.context));
  entry.next_pc = next_pc;
  entry.speculation_window = speculation_window;
  checkpoints.push_back(std::move(entry));
  store_logs.push_back(StoreLog());

  if (taint) taint->Checkpoint();
  contract->OnCheckpoint(this);

  CONTRACER_MTRACE(
      std::cerr << "  checkpoint " << checkpoints.size() << " at "
                << std::hex << ctx.curr_instr << " next " << next_pc
                << std::dec << std::endl; )
}

// Undoes the newest speculative path. Returns the address at which emulation
// resumes.
Addr Model::Rollback(void) {
  CONTRACER_ASSERT(!checkpoints.empty());
  contract->OnRollback(this);

  // Undo the stores of this path, newest first.
  const auto &log = store_logs.back();
  for (auto it = log.rbegin(); it != log.rend(); ++it) {
    engine.WriteMem(it->address, it->bytes);
  }
  store_logs.pop_back();

  auto &entry = checkpoints.back();
  engine.RestoreContext(entry.context);
  speculation_window = entry.speculation_window;
  auto next_pc = entry.next_pc;
  checkpoints.pop_back();

  if (taint) taint->Rollback();
  ctx.rollback_target = next_pc;

  CONTRACER_MTRACE(
      std::cerr << "  rollback to " << std::hex << next_pc << std::dec
                << std::endl; )

  return next_pc;
}

void Model::LogStore(Addr address, size_t size) {
  CONTRACER_ASSERT(!store_logs.empty());
  if (!IsMapped(address, size)) return;
  StoreLogEntry entry;
  entry.address = address;
  entry.bytes = engine.ReadMem(address, size);
  store_logs.back().push_back(std::move(entry));
}

bool Model::IsMapped(Addr address, size_t size) const {
  auto end = address + size;
  if (end < address) return false;
  return (address >= code_start && end <= code_start + kCodeSize) ||
         (address >= LowerOverflowRegion() &&
          end <= LowerOverflowRegion() + kSandboxSize);
}

void Model::TraceInstruction(uc_engine *, uint64_t address, uint32_t size,
                             void *data) {
  reinterpret_cast<Model *>(data)->OnInstruction(address, size);
}

void Model::TraceMemAccess(uc_engine *, uc_mem_type type, uint64_t address,
                           int size, int64_t value, void *data) {
  reinterpret_cast<Model *>(data)->OnMemAccess(
      type, address, static_cast<size_t>(size), value);
}

void Model::OnInstruction(Addr pc, size_t size) {
  // A speculative path left the test case.
  if (pc < code_start || pc >= code_end) {
    StopEmulation();
    return;
  }

  ctx.curr_instr = pc;
  uint8_t bytes[arch::kMaxNumInstructionBytes] = {0};
  auto num_bytes = std::min<size_t>(
      std::min<size_t>(size, arch::kMaxNumInstructionBytes), code_end - pc);
  engine.ReadMem(pc, bytes, num_bytes);
  current_instruction.TryDecode(bytes, num_bytes);

  SavePreviousContext();
  if (taint) taint->StartInstruction(current_instruction);
  tracer.ObserveInstruction(pc);

  if (InSpeculation() && ++speculation_window > FLAGS_max_spec_window) {
    CONTRACER_MTRACE(
        std::cerr << "  speculation window exceeded at " << std::hex << pc
                  << std::dec << std::endl; )
    StopEmulation();
    return;
  }

  contract->SpeculateInstruction(this, pc, size);
  if (ctx.rollback_target == pc) {
    ctx.rollback_target = 0;
  }
}

void Model::OnMemAccess(uc_mem_type type, Addr address, size_t size,
                        int64_t value) {
  auto is_write = UC_MEM_WRITE == type;
  if (contract->InterceptMemAccess(this, type, address, size)) {
    if (is_write && IsMapped(address, size)) {
      StoreLogEntry entry;
      entry.address = address;
      entry.bytes = engine.ReadMem(address, size);
      aborted_stores.push_back(std::move(entry));
    }
    return;
  }
  if (is_write && InSpeculation()) {
    LogStore(address, size);
  }
  tracer.ObserveMemAccess(is_write, address, InSpeculation());
  if (taint) taint->TrackMemAccess(address, size, is_write);
  contract->SpeculateMemAccess(this, type, address, size, value);
}

uint64_t Model::ReadReg(int reg) const {
  return engine.ReadReg(reg);
}

void Model::WriteReg(int reg, uint64_t val) {
  engine.WriteReg(reg, val);
}

// Reads a little-endian value of `size` bytes.
uint64_t Model::ReadMemWord(Addr address, size_t size) const {
  CONTRACER_ASSERT(size <= sizeof(uint64_t));
  uint8_t bytes[sizeof(uint64_t)] = {0};
  engine.ReadMem(address, bytes, size);
  uint64_t val = 0;
  for (auto i = size; i-- > 0; ) {
    val = (val << 8) | bytes[i];
  }
  return val;
}

std::string Model::ReadMem(Addr address, size_t size) const {
  return engine.ReadMem(address, size);
}

void Model::WriteMem(Addr address, const std::string &data) {
  engine.WriteMem(address, data);
}

void Model::WriteMem(Addr address, const void *data, size_t size) {
  engine.WriteMem(address, data, size);
}

void Model::SetPC(Addr pc) {
  engine.WriteReg(ProgramCounter(), pc);
}

void Model::StopEmulation(void) {
  engine.Stop();
}

void Model::SavePreviousContext(void) {
  engine.SaveContext(&previous_context);
}

void Model::SaveContext(emulator::Context *context) const {
  engine.SaveContext(context);
}

void Model::RestoreContext(const emulator::Context &context) {
  engine.RestoreContext(context);
}

void Model::RestorePreviousContext(void) {
  engine.RestoreContext(previous_context);
}

void Model::ProtectFaultyRegion(void) {
  engine.ProtectMem(FaultyRegion(), kFaultyRegionSize, UC_PROT_NONE);
}

void Model::UnprotectFaultyRegion(void) {
  engine.ProtectMem(FaultyRegion(), kFaultyRegionSize, UC_PROT_ALL);
}

bool Model::IsInFaultyRegion(Addr address) const {
  return address >= FaultyRegion() &&
         address < FaultyRegion() + kFaultyRegionSize;
}

}  // namespace model
}  // namespace contracer
