/* Copyright 2026 The contracer Authors, all rights reserved. */

#include "contracer/arch/x86/contract.h"

#include "contracer/model/model.h"

#include <gflags/gflags.h>

#include <cstdlib>
#include <iostream>
#include <sstream>

DECLARE_bool(dbg_model);
DECLARE_string(speculated_faults);

namespace contracer {
namespace arch {
namespace {

// Parses a comma-separated list of fault numbers.
static std::set<int> ParseFaults(const std::string &list) {
  std::set<int> faults;
  std::stringstream ss(list);
  std::string item;
  while (std::getline(ss, item, ',')) {
    if (item.empty()) continue;
    char *end = nullptr;
    auto fault = strtol(item.c_str(), &end, 10);
    if (!end || *end || 0 >= fault) {
      std::cerr << "Invalid fault number '" << item
                << "' in --speculated_faults." << std::endl;
      CONTRACER_ASSERT(false);
    }
    faults.insert(static_cast<int>(fault));
  }
  return faults;
}

}  // namespace

FaultContract::FaultContract(std::initializer_list<int> default_faults)
    : relevant_faults(default_faults) {
  if (!FLAGS_speculated_faults.empty()) {
    relevant_faults = ParseFaults(FLAGS_speculated_faults);
  }
}

FaultContract::~FaultContract(void) {}

bool FaultContract::IsRelevantFault(int fault) const {
  return relevant_faults.count(fault) != 0;
}

bool FaultContract::ProtectsFaultyRegion(void) const {
  return true;
}

NullInjectionContract::NullInjectionContract(void)
    : FaultContract({UC_ERR_WRITE_PROT, UC_ERR_READ_PROT}) {}

NullInjectionContract::~NullInjectionContract(void) {}

Addr NullInjectionContract::ResumeAddress(model::Model *model) const {
  return model->Context().curr_instr;
}

// Lifts the protection of the faulty region, and re-executes the faulting
// instruction. Its load is then replaced by zero.
Addr NullInjectionContract::SpeculateFault(model::Model *model, int fault) {
  if (!IsRelevantFault(fault)) return 0;
  if (!model->CanSpeculate()) return 0;

  auto &ctx = model->Context();
  ctx.injection_pending = true;
  model->UnprotectFaultyRegion();
  return ctx.curr_instr;
}

void NullInjectionContract::SpeculateMemAccess(model::Model *model,
                                               uc_mem_type access,
                                               Addr address, size_t size,
                                               int64_t) {
  auto &ctx = model->Context();
  if (!ctx.injection_pending) return;
  ctx.injection_pending = false;

  if (UC_MEM_WRITE == access) return;

  model->Checkpoint(ResumeAddress(model));
  model->LogStore(address, size);
  model->WriteMem(address, std::string(size, '\0'));

  CONTRACER_MTRACE(
      std::cerr << "  inject zero at " << std::hex << address << std::dec
                << std::endl; )
}

NullFaultContract::~NullFaultContract(void) {}

Addr NullFaultContract::ResumeAddress(model::Model *model) const {
  return model->CodeEnd();
}

}  // namespace arch
}  // namespace contracer
