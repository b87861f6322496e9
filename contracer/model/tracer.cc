/* Copyright 2026 The contracer Authors, all rights reserved. */

#include "contracer/model/tracer.h"

#include <xxhash.h>

namespace contracer {
namespace model {
namespace {

enum : uint64_t {
  kCacheLineShift = 6,
  kNumCacheSets = 64,
  kTraceSeed = 0
};

struct ClauseName {
  const char *name;
  ObservationClause clause;
};

static const ClauseName kClauseNames[] = {
  {"l1d", ObservationClause::kL1D},
  {"pc", ObservationClause::kPC},
  {"mem", ObservationClause::kMemory},
  {"ct", ObservationClause::kCT},
  {"ct-nonspecstore", ObservationClause::kCTNonSpecStore}
};

}  // namespace

bool ParseObservationClause(const std::string &name,
                            ObservationClause *clause) {
  for (const auto &entry : kClauseNames) {
    if (name == entry.name) {
      *clause = entry.clause;
      return true;
    }
  }
  return false;
}

const char *ObservationClauseName(ObservationClause clause) {
  for (const auto &entry : kClauseNames) {
    if (clause == entry.clause) return entry.name;
  }
  return "";
}

Tracer::Tracer(ObservationClause clause_)
    : clause(clause_) {}

void Tracer::Reset(void) {
  observations.clear();
}

bool Tracer::ObservesPC(void) const {
  return ObservationClause::kPC == clause ||
         ObservationClause::kCT == clause ||
         ObservationClause::kCTNonSpecStore == clause;
}

bool Tracer::ObservesAddresses(void) const {
  return ObservationClause::kPC != clause;
}

void Tracer::ObserveInstruction(Addr pc) {
  if (ObservesPC()) {
    observations.push_back(pc);
  }
}

void Tracer::ObserveMemAccess(bool is_write, Addr address,
                              bool in_speculation) {
  switch (clause) {
    case ObservationClause::kL1D:
      observations.push_back((address >> kCacheLineShift) % kNumCacheSets);
      break;
    case ObservationClause::kMemory:
    case ObservationClause::kCT:
      observations.push_back(address);
      break;
    case ObservationClause::kCTNonSpecStore:
      if (!is_write || !in_speculation) {
        observations.push_back(address);
      }
      break;
    case ObservationClause::kPC:
      break;
  }
}

uint64_t Tracer::ContractTrace(void) const {
  return XXH64(observations.data(), observations.size() * sizeof(uint64_t),
               kTraceSeed);
}

}  // namespace model
}  // namespace contracer
