/* Copyright 2026 The contracer Authors, all rights reserved. */

#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>

#include <gflags/gflags.h>

#include "contracer/arch/x86/contract.h"
#include "contracer/arch/x86/model.h"

#include "contracer/input/input.h"

DEFINE_bool(about, false, "Show the compile date of contracer.");

DEFINE_string(contract, "cond", "Execution clause. One of: seq, cond, bpas, "
                                "cond-bpas, null-inj, null-fault, ooo, "
                                "div-overflow, meltdown, gp.");

DEFINE_string(observation, "ct", "Observation clause. One of: l1d, pc, mem, "
                                 "ct, ct-nonspecstore.");

DEFINE_int32(nesting, 5, "Maximum number of nested speculative paths.");

DEFINE_string(test_case, "", "Path to the flat binary of the test case.");

DEFINE_string(inputs, "", "Comma-separated list of paths to input files. "
                          "Each input is the memory image of the sandbox "
                          "followed by the register values.");

DEFINE_bool(taint, false, "Print which parts of each input influence its "
                          "contract trace.");

DEFINE_bool(print_traces, false, "Print the raw observations of each "
                                 "input.");

DEFINE_uint64(sandbox_base, contracer::model::kDefaultSandboxBase,
              "Address of the main sandbox region.");

DEFINE_uint64(code_start, contracer::model::kDefaultCodeStart,
              "Address at which the test case is loaded.");

namespace contracer {
namespace {

static bool ReadFile(const std::string &path, std::string *data) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  *data = buffer.str();
  return true;
}

static bool LoadInputs(const std::string &paths, input::InputList *inputs) {
  std::stringstream ss(paths);
  std::string path;
  while (std::getline(ss, path, ',')) {
    if (path.empty()) continue;
    input::Input input;
    if (!input::Input::TryLoad(path, &input)) {
      std::cerr << "Cannot open or parse input: " << path << std::endl;
      return false;
    }
    inputs->push_back(std::move(input));
  }
  return true;
}

static void PrintTaint(const input::InputTaint &taint) {
  static const char * const kInputRegNames[] = {
    "RAX", "RBX", "RCX", "RDX", "RSI", "RDI", "FLAGS"
  };
  std::cout << "  taint: regs";
  for (auto i = 0U; i < arch::kNumInputRegisters; ++i) {
    if (taint.registers[i]) std::cout << " " << kInputRegNames[i];
  }
  std::cout << " mem";
  for (auto i = 0U; i < taint.memory.size(); ++i) {
    if (taint.memory[i]) std::cout << " 0x" << std::hex << (i * 8) << std::dec;
  }
  std::cout << std::endl;
}

static void PrintResult(size_t index, const model::TraceResult &result) {
  std::cout << "input " << index << ": ctrace 0x" << std::hex << result.ctrace
            << std::dec << " fault " << result.fault << std::endl;
  if (FLAGS_print_traces) {
    std::cout << "  trace:";
    for (auto obs : result.observations) {
      std::cout << " 0x" << std::hex << obs << std::dec;
    }
    std::cout << std::endl;
  }
  if (FLAGS_taint) {
    PrintTaint(result.taint);
  }
}

}  // namespace
}  // namespace contracer

extern "C" int main(int argc, char **argv, char **) {
  using namespace contracer;
  GFLAGS_NAMESPACE::SetUsageMessage(std::string(argv[0]) + " [options]");
  GFLAGS_NAMESPACE::ParseCommandLineFlags(&argc, &argv, false);

  if (FLAGS_about) {
    std::cerr << __DATE__ ", " __TIME__ << std::endl;
    return EXIT_SUCCESS;
  }

  auto contract = arch::CreateContract(FLAGS_contract);
  if (!contract) {
    std::cerr << "Unknown contract: " << FLAGS_contract << std::endl;
    return EXIT_FAILURE;
  }

  model::ObservationClause clause;
  if (!model::ParseObservationClause(FLAGS_observation, &clause)) {
    std::cerr << "Unknown observation clause: " << FLAGS_observation
              << std::endl;
    return EXIT_FAILURE;
  }

  if (0 > FLAGS_nesting) {
    std::cerr << "The nesting must not be negative." << std::endl;
    return EXIT_FAILURE;
  }

  if ((FLAGS_sandbox_base % model::kMainRegionSize) ||
      (FLAGS_code_start % model::kCodeSize) ||
      FLAGS_sandbox_base < model::kOverflowRegionSize) {
    std::cerr << "The sandbox base and code start must be page-aligned, and "
              << "the sandbox must have room for its lower overflow region."
              << std::endl;
    return EXIT_FAILURE;
  }

  std::string code;
  if (FLAGS_test_case.empty() || !ReadFile(FLAGS_test_case, &code)) {
    std::cerr << "Cannot open test case: " << FLAGS_test_case << std::endl;
    return EXIT_FAILURE;
  }
  if (code.size() > model::kCodeSize) {
    std::cerr << "Test case is larger than " << model::kCodeSize
              << " bytes." << std::endl;
    return EXIT_FAILURE;
  }

  input::InputList inputs;
  if (!LoadInputs(FLAGS_inputs, &inputs)) {
    return EXIT_FAILURE;
  }
  if (inputs.empty()) {
    std::cerr << "Must provide one or more --inputs." << std::endl;
    return EXIT_FAILURE;
  }

  arch::X86Model model(std::move(contract), clause, FLAGS_sandbox_base,
                       FLAGS_code_start);
  model.LoadTestCase(code);

  auto results = model.TraceTestCase(inputs, FLAGS_nesting, FLAGS_taint);
  for (auto i = 0UL; i < results.size(); ++i) {
    PrintResult(i, results[i]);
  }

  GFLAGS_NAMESPACE::ShutDownCommandLineFlags();
  return EXIT_SUCCESS;
}
