/* Copyright 2026 The contracer Authors, all rights reserved. */

#include "contracer/arch/x86/contract.h"

#include <gflags/gflags.h>

DEFINE_string(speculated_faults, "", "Comma-separated list of emulator "
                                     "fault numbers to speculate on, e.g. "
                                     "`12,13`. Replaces the default faults "
                                     "of the fault contracts.");

namespace contracer {
namespace arch {

std::unique_ptr<model::Contract> CreateContract(const std::string &name) {
  model::Contract *contract = nullptr;
  if (name == "seq") {
    contract = new model::Contract;

  } else if (name == "cond") {
    contract = new CondContract;
  } else if (name == "bpas") {
    contract = new model::BypassContract;
  } else if (name == "cond-bpas") {
    contract = new CondBypassContract;

  } else if (name == "null-inj") {
    contract = new NullInjectionContract;
  } else if (name == "null-fault") {
    contract = new NullFaultContract;

  } else if (name == "ooo") {
    contract = new OutOfOrderContract;
  } else if (name == "div-overflow") {
    contract = new DivOverflowContract;
  } else if (name == "meltdown") {
    contract = new MeltdownContract;
  } else if (name == "gp") {
    contract = new NonCanonicalContract;
  }
  return std::unique_ptr<model::Contract>(contract);
}

const std::vector<std::string> &ContractNames(void) {
  static const std::vector<std::string> kNames = {
    "seq", "cond", "bpas", "cond-bpas", "null-inj", "null-fault", "ooo",
    "div-overflow", "meltdown", "gp"
  };
  return kNames;
}

}  // namespace arch
}  // namespace contracer
