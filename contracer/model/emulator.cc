/* Copyright 2026 The contracer Authors, all rights reserved. */

#include "contracer/model/emulator.h"

#include <iostream>

namespace contracer {
namespace emulator {
namespace {

static void CheckError(uc_err err, const char *what) {
  if (CONTRACER_UNLIKELY(UC_ERR_OK != err)) {
    std::cerr << what << ": " << uc_strerror(err) << std::endl;
    CONTRACER_ASSERT(UC_ERR_OK == err);
  }
}

}  // namespace

Context::Context(void)
    : context(nullptr) {}

Context::~Context(void) {
  if (context) {
    uc_context_free(context);
    context = nullptr;
  }
}

Context::Context(Context &&that)
    : context(that.context) {
  that.context = nullptr;
}

Context &Context::operator=(Context &&that) {
  if (this != &that) {
    if (context) uc_context_free(context);
    context = that.context;
    that.context = nullptr;
  }
  return *this;
}

Engine::Engine(void)
    : uc(nullptr) {
  CheckError(uc_open(UC_ARCH_X86, UC_MODE_64, &uc), "uc_open");
}

Engine::~Engine(void) {
  if (uc) {
    uc_close(uc);
    uc = nullptr;
  }
}

uint64_t Engine::ReadReg(int reg) const {
  uint64_t val = 0;
  CheckError(uc_reg_read(uc, reg, &val), "uc_reg_read");
  return val;
}

void Engine::WriteReg(int reg, uint64_t val) {
  CheckError(uc_reg_write(uc, reg, &val), "uc_reg_write");
}

void Engine::ReadMem(Addr addr, void *data, size_t size) const {
  CheckError(uc_mem_read(uc, addr, data, size), "uc_mem_read");
}

std::string Engine::ReadMem(Addr addr, size_t size) const {
  std::string data(size, '\0');
  ReadMem(addr, &(data[0]), size);
  return data;
}

void Engine::WriteMem(Addr addr, const void *data, size_t size) {
  CheckError(uc_mem_write(uc, addr, data, size), "uc_mem_write");
}

void Engine::WriteMem(Addr addr, const std::string &data) {
  if (!data.empty()) {
    WriteMem(addr, data.data(), data.size());
  }
}

void Engine::MapMem(Addr addr, size_t size, uint32_t perms) {
  CheckError(uc_mem_map(uc, addr, size, perms), "uc_mem_map");
}

void Engine::ProtectMem(Addr addr, size_t size, uint32_t perms) {
  CheckError(uc_mem_protect(uc, addr, size, perms), "uc_mem_protect");
}

void Engine::SaveContext(Context *context) const {
  if (!context->context) {
    CheckError(uc_context_alloc(uc, &(context->context)), "uc_context_alloc");
  }
  CheckError(uc_context_save(uc, context->context), "uc_context_save");
}

void Engine::RestoreContext(const Context &context) {
  CONTRACER_ASSERT(context.IsValid());
  CheckError(uc_context_restore(uc, context.context), "uc_context_restore");
}

void Engine::AddCodeHook(CodeHook *hook, void *data) {
  uc_hook handle;
  CheckError(uc_hook_add(uc, &handle, UC_HOOK_CODE,
                         reinterpret_cast<void *>(hook), data, 1, 0),
             "uc_hook_add");
}

void Engine::AddMemHook(int type, MemHook *hook, void *data) {
  uc_hook handle;
  CheckError(uc_hook_add(uc, &handle, type,
                         reinterpret_cast<void *>(hook), data, 1, 0),
             "uc_hook_add");
}

uc_err Engine::Start(Addr begin, Addr until, uint64_t timeout_us) {
  return uc_emu_start(uc, begin, until, timeout_us, 0);
}

void Engine::Stop(void) {
  CheckError(uc_emu_stop(uc), "uc_emu_stop");
}

}  // namespace emulator
}  // namespace contracer
