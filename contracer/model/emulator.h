/* Copyright 2026 The contracer Authors, all rights reserved. */

#ifndef CONTRACER_MODEL_EMULATOR_H_
#define CONTRACER_MODEL_EMULATOR_H_

#include "contracer/base/base.h"

#include <string>

#include <unicorn/unicorn.h>

namespace contracer {
namespace emulator {

// A saved CPU context. Memory is not part of a context.
class Context {
 public:
  Context(void);
  ~Context(void);

  Context(Context &&that);
  Context &operator=(Context &&that);

  inline bool IsValid(void) const {
    return nullptr != context;
  }

 private:
  friend class Engine;

  uc_context *context;

  CONTRACER_DISALLOW_COPY(Context);
  void operator=(const Context &) = delete;
};

typedef void (CodeHook)(uc_engine *, uint64_t, uint32_t, void *);
typedef void (MemHook)(uc_engine *, uc_mem_type, uint64_t, int, int64_t,
                       void *);

// Owns one x86-64 Unicorn engine.
class Engine {
 public:
  Engine(void);
  ~Engine(void);

  uint64_t ReadReg(int reg) const;
  void WriteReg(int reg, uint64_t val);

  void ReadMem(Addr addr, void *data, size_t size) const;
  std::string ReadMem(Addr addr, size_t size) const;
  void WriteMem(Addr addr, const void *data, size_t size);
  void WriteMem(Addr addr, const std::string &data);

  void MapMem(Addr addr, size_t size, uint32_t perms);
  void ProtectMem(Addr addr, size_t size, uint32_t perms);

  // Saves the CPU context into `context`, allocating it if needed.
  void SaveContext(Context *context) const;
  void RestoreContext(const Context &context);

  void AddCodeHook(CodeHook *hook, void *data);
  void AddMemHook(int type, MemHook *hook, void *data);

  // Emulates from `begin` until `until` is reached, a fault is raised, or
  // `Stop` is called from a hook. Faults are returned, never asserted on.
  uc_err Start(Addr begin, Addr until, uint64_t timeout_us);
  void Stop(void);

 private:
  uc_engine *uc;

  CONTRACER_DISALLOW_COPY_AND_ASSIGN(Engine);
};

}  // namespace emulator
}  // namespace contracer

#endif  // CONTRACER_MODEL_EMULATOR_H_
