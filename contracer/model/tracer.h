/* Copyright 2026 The contracer Authors, all rights reserved. */

#ifndef CONTRACER_MODEL_TRACER_H_
#define CONTRACER_MODEL_TRACER_H_

#include "contracer/base/base.h"

#include <string>
#include <vector>

namespace contracer {
namespace model {

// Observation clauses: what an attacker is assumed to see of a run.
enum class ObservationClause {
  kL1D,  // Cache set of every data access.
  kPC,  // Address of every executed instruction.
  kMemory,  // Address of every data access.
  kCT,  // `kPC` and `kMemory`.
  kCTNonSpecStore  // `kCT`, minus stores executed during speculation.
};

bool ParseObservationClause(const std::string &name,
                            ObservationClause *clause);

const char *ObservationClauseName(ObservationClause clause);

// Collects the observations of one run and condenses them into a contract
// trace.
class Tracer {
 public:
  explicit Tracer(ObservationClause clause_);

  void Reset(void);

  void ObserveInstruction(Addr pc);
  void ObserveMemAccess(bool is_write, Addr address, bool in_speculation);

  // Hash of the observations made since the last reset.
  uint64_t ContractTrace(void) const;

  inline const std::vector<uint64_t> &Observations(void) const {
    return observations;
  }

  bool ObservesPC(void) const;
  bool ObservesAddresses(void) const;

  inline ObservationClause Clause(void) const {
    return clause;
  }

 private:
  const ObservationClause clause;
  std::vector<uint64_t> observations;

  CONTRACER_DISALLOW_COPY_AND_ASSIGN(Tracer);
};

}  // namespace model
}  // namespace contracer

#endif  // CONTRACER_MODEL_TRACER_H_
