#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "image.h"
#include "opcode.h"
#include "tape.h"
#include "test_utils.h"
#include "vm.h"

namespace Tally::VM::Tests {

using Tally::Byte::Image;

namespace {

const Image kQuine = {109, 1, 204, -1, 1001, 100, 1, 100, 1008, 100, 16, 101, 1006, 101, 0, 99};

const Image kCompareEight = {3,  21, 1008, 21, 8,  20, 1005, 20,  22,  107,  8,    21, 20,
                             1006, 20, 31,  1106, 0, 36, 98,  0,    0,   1002, 21,  125, 20,
                             4,  20, 1105, 1,  46, 104, 999, 1105, 1,   46,   1101, 1000, 1,
                             20, 4,  20,  1105, 1,  46, 98,  99};

} // namespace

bool RunVmAddMulHaltTest() {
  Machine machine(Image{1, 9, 10, 3, 2, 3, 11, 0, 99, 30, 40, 50});
  ExecResult result = machine.Run(nullptr);
  if (!ExpectStatus(result, ExecStatus::Halted, "vm_add_mul_halt")) return false;
  if (result.value != 3500) {
    std::cerr << "expected halt value 3500, got " << result.value << "\n";
    return false;
  }
  int64_t word = 0;
  if (!machine.Peek(3, &word) || word != 70) {
    std::cerr << "expected tape[3] == 70, got " << word << "\n";
    return false;
  }
  return machine.position() == 8;
}

bool RunVmHaltRepeatsTest() {
  Machine machine(Image{99});
  ExecResult first = machine.Tick();
  ExecResult second = machine.Tick();
  if (!ExpectStatus(first, ExecStatus::Halted, "vm_halt_first")) return false;
  if (!ExpectStatus(second, ExecStatus::Halted, "vm_halt_second")) return false;
  return machine.position() == 0 && first.value == 99;
}

bool RunVmImmediateModeTest() {
  Machine machine(Image{1002, 4, 3, 4, 33});
  ExecResult result = machine.Tick();
  if (!ExpectStatus(result, ExecStatus::Ok, "vm_immediate_mode")) return false;
  int64_t word = 0;
  if (!machine.Peek(4, &word) || word != 99) {
    std::cerr << "expected tape[4] == 99, got " << word << "\n";
    return false;
  }
  return ExpectStatus(machine.Tick(), ExecStatus::Halted, "vm_immediate_mode_halt");
}

bool RunVmEqualsLessTest() {
  const Image eq_pos = {3, 9, 8, 9, 10, 9, 4, 9, 99, -1, 8};
  const Image lt_pos = {3, 9, 7, 9, 10, 9, 4, 9, 99, -1, 8};
  const Image eq_imm = {3, 3, 1108, -1, 8, 3, 4, 3, 99};
  const Image lt_imm = {3, 3, 1107, -1, 8, 3, 4, 3, 99};
  if (!RunExpectOutputs(eq_pos, {8}, {1}, "vm_eq_pos_true")) return false;
  if (!RunExpectOutputs(eq_pos, {7}, {0}, "vm_eq_pos_false")) return false;
  if (!RunExpectOutputs(lt_pos, {3}, {1}, "vm_lt_pos_true")) return false;
  if (!RunExpectOutputs(lt_pos, {8}, {0}, "vm_lt_pos_false")) return false;
  if (!RunExpectOutputs(eq_imm, {8}, {1}, "vm_eq_imm_true")) return false;
  if (!RunExpectOutputs(eq_imm, {-8}, {0}, "vm_eq_imm_false")) return false;
  if (!RunExpectOutputs(lt_imm, {-100}, {1}, "vm_lt_imm_true")) return false;
  return RunExpectOutputs(lt_imm, {9}, {0}, "vm_lt_imm_false");
}

bool RunVmJumpTest() {
  const Image jump_pos = {3, 12, 6, 12, 15, 1, 13, 14, 13, 4, 13, 99, -1, 0, 1, 9};
  const Image jump_imm = {3, 3, 1105, -1, 9, 1101, 0, 0, 12, 4, 12, 99, 1};
  if (!RunExpectOutputs(jump_pos, {0}, {0}, "vm_jump_pos_zero")) return false;
  if (!RunExpectOutputs(jump_pos, {5}, {1}, "vm_jump_pos_nonzero")) return false;
  if (!RunExpectOutputs(jump_imm, {0}, {0}, "vm_jump_imm_zero")) return false;
  return RunExpectOutputs(jump_imm, {-3}, {1}, "vm_jump_imm_nonzero");
}

bool RunVmCompareProgramTest() {
  if (!RunExpectOutputs(kCompareEight, {7}, {999}, "vm_compare_below")) return false;
  if (!RunExpectOutputs(kCompareEight, {8}, {1000}, "vm_compare_equal")) return false;
  return RunExpectOutputs(kCompareEight, {9}, {1001}, "vm_compare_above");
}

bool RunVmRelativeQuineTest() {
  return RunExpectOutputs(kQuine, {}, kQuine, "vm_relative_quine");
}

bool RunVmLargeWordsTest() {
  if (!RunExpectOutputs({104, 1125899906842624, 99}, {}, {1125899906842624}, "vm_large_literal")) {
    return false;
  }
  return RunExpectOutputs({1102, 34915192, 34915192, 7, 4, 7, 99, 0}, {}, {1219070632396864},
                          "vm_large_product");
}

bool RunVmInputRequiredTest() {
  Machine machine(Image{3, 0, 4, 0, 99});
  ExecResult result = machine.Tick();
  if (!ExpectStatus(result, ExecStatus::InputRequired, "vm_input_required")) return false;
  if (machine.position() != 0) {
    std::cerr << "input required must not advance, position " << machine.position() << "\n";
    return false;
  }
  machine.PushInput(42);
  if (!ExpectStatus(machine.Tick(), ExecStatus::Ok, "vm_input_consumed")) return false;
  if (machine.position() != 2 || machine.pending_input() != 0) return false;
  result = machine.Tick();
  if (!ExpectStatus(result, ExecStatus::Output, "vm_input_echo")) return false;
  if (result.value != 42) return false;
  result = machine.Tick();
  if (!ExpectStatus(result, ExecStatus::Halted, "vm_input_halt")) return false;
  return result.value == 42;
}

bool RunVmRunResumesAfterInputTest() {
  Machine machine(Image{3, 11, 3, 12, 1, 11, 12, 13, 4, 13, 99});
  machine.PushInput(2);
  std::vector<int64_t> outputs;
  ExecResult result = machine.Run(&outputs);
  if (!ExpectStatus(result, ExecStatus::InputRequired, "vm_run_suspends")) return false;
  if (machine.position() != 2 || !outputs.empty()) return false;
  machine.PushInput(40);
  result = machine.Run(&outputs);
  if (!ExpectStatus(result, ExecStatus::Halted, "vm_run_resumes")) return false;
  return ExpectOutputs(outputs, {42}, "vm_run_resumes");
}

bool RunVmImmediateStoreTest() {
  const Image images[] = {
    {11101, 1, 1, 5, 99},
    {11102, 2, 2, 5, 99},
    {11107, 1, 2, 5, 99},
    {11108, 2, 2, 5, 99},
    {10001, 5, 6, 7, 99},
    {103, 0, 99},
  };
  for (const auto& image : images) {
    Machine machine(image);
    machine.PushInput(1);
    ExecResult result = machine.Tick();
    if (!ExpectStatus(result, ExecStatus::InvalidAddressingMode, "vm_immediate_store")) return false;
    if (machine.position() != 0) return false;
  }
  // An input op faults on its destination mode even with an empty queue.
  return RunExpectFault({103, 0, 99}, ExecStatus::InvalidAddressingMode, "vm_immediate_store_in");
}

bool RunVmInvalidOpcodeTest() {
  ExecResult result = ExecuteImage({98});
  if (!ExpectStatus(result, ExecStatus::InvalidOpcode, "vm_invalid_opcode")) return false;
  if (result.value != 98) return false;
  result = ExecuteImage({-7, 99});
  if (!ExpectStatus(result, ExecStatus::InvalidOpcode, "vm_invalid_opcode_negative")) return false;
  if (result.value != -7) return false;
  result = ExecuteImage({});
  if (!ExpectStatus(result, ExecStatus::InvalidOpcode, "vm_invalid_opcode_empty")) return false;
  return result.value == 0;
}

bool RunVmInvalidModeDigitTest() {
  return RunExpectFault({301, 0, 0, 0, 99}, ExecStatus::InvalidAddressingMode, "vm_mode_digit");
}

bool RunVmMemoryFaultTest() {
  if (!RunExpectFault({4, -1, 99}, ExecStatus::MemoryFault, "vm_negative_position")) return false;
  if (!RunExpectFault({204, -5, 99}, ExecStatus::MemoryFault, "vm_negative_relative")) return false;
  if (!RunExpectFault({1105, 1, -5}, ExecStatus::MemoryFault, "vm_negative_jump")) return false;

  Machine fixed({1101, 1, 1, 10, 99}, std::make_unique<FixedTape>(8));
  ExecResult result = fixed.Run(nullptr);
  if (!ExpectStatus(result, ExecStatus::MemoryFault, "vm_fixed_store")) return false;
  if (result.value != 10) return false;

  Machine truncated({1101}, std::make_unique<FixedTape>(1));
  return ExpectStatus(truncated.Tick(), ExecStatus::MemoryFault, "vm_fixed_operand_read");
}

bool RunVmImageTooLargeTest() {
  Machine machine({1, 2, 3}, std::make_unique<FixedTape>(2));
  std::string error;
  if (machine.Reset(&error)) {
    std::cerr << "expected reset to fail for oversized image\n";
    return false;
  }
  if (error.empty()) return false;
  if (!ExpectStatus(machine.Tick(), ExecStatus::MemoryFault, "vm_image_too_large")) return false;

  ExecOptions options;
  options.tape_kind = TapeKind::Fixed;
  options.tape_capacity = 2;
  return ExpectStatus(ExecuteImage({1, 2, 3}, options), ExecStatus::MemoryFault,
                      "vm_image_too_large_execute");
}

bool RunVmResetTest() {
  Machine machine(Image{3, 0, 4, 0, 99});
  machine.PushInput(5);
  machine.PushInput(9);
  std::vector<int64_t> outputs;
  ExecResult result = machine.Run(&outputs);
  if (!ExpectStatus(result, ExecStatus::Halted, "vm_reset_run")) return false;
  if (!ExpectOutputs(outputs, {5}, "vm_reset_run")) return false;
  if (machine.pending_input() != 1) return false;

  std::string error;
  if (!machine.Reset(&error)) {
    std::cerr << "reset failed: " << error << "\n";
    return false;
  }
  int64_t word = 0;
  if (!machine.Peek(0, &word) || word != 3) return false;
  if (machine.position() != 0 || machine.pending_input() != 0) return false;

  Machine based(Image{109, 7, 99});
  if (!ExpectStatus(based.Run(nullptr), ExecStatus::Halted, "vm_reset_base")) return false;
  if (based.relative_base() != 7) return false;
  if (!based.Reset(nullptr)) return false;
  return based.relative_base() == 0;
}

bool RunVmTapeBackendsTest() {
  ExecOptions sparse;
  sparse.tape_kind = TapeKind::Sparse;
  ExecResult result = ExecuteImage(kQuine, sparse);
  if (!ExpectStatus(result, ExecStatus::Halted, "vm_sparse_quine")) return false;
  if (!ExpectOutputs(result.outputs, kQuine, "vm_sparse_quine")) return false;

  ExecOptions fixed;
  fixed.tape_kind = TapeKind::Fixed;
  fixed.tape_capacity = 128;
  result = ExecuteImage(kQuine, fixed);
  if (!ExpectStatus(result, ExecStatus::Halted, "vm_fixed_quine")) return false;
  if (!ExpectOutputs(result.outputs, kQuine, "vm_fixed_quine")) return false;

  fixed.tape_capacity = 64;
  result = ExecuteImage(kQuine, fixed);
  return ExpectStatus(result, ExecStatus::MemoryFault, "vm_fixed_quine_small");
}

bool RunTapeFixedTest() {
  FixedTape tape(4);
  int64_t value = -1;
  if (!tape.Read(2, &value) || value != 0) return false;
  if (!tape.Write(3, 9)) return false;
  if (!tape.Read(3, &value) || value != 9) return false;
  if (tape.Write(4, 1) || tape.Read(4, &value)) return false;
  tape.Clear();
  return tape.Read(3, &value) && value == 0 && tape.Capacity() == 4;
}

bool RunTapeGrowableTest() {
  GrowableTape tape(100);
  int64_t value = -1;
  if (!tape.Read(50, &value) || value != 0) return false;
  if (tape.Used() != 0) return false;
  if (!tape.Write(50, 3) || tape.Used() != 51) return false;
  if (!tape.Read(50, &value) || value != 3) return false;
  if (tape.Write(100, 1) || tape.Read(100, &value)) return false;
  tape.Clear();
  return tape.Used() == 0;
}

bool RunTapeSparseTest() {
  SparseTape tape(1u << 20);
  int64_t value = -1;
  if (!tape.Write(1000, 5)) return false;
  if (!tape.Read(1000, &value) || value != 5) return false;
  if (!tape.Read(999, &value) || value != 0) return false;
  if (!tape.Write(1000, 0) || tape.Used() != 0) return false;
  return !tape.Write(1u << 20, 1);
}

bool RunExecuteOptionsTest() {
  ExecOptions options;
  options.inputs = {4, 5};
  int64_t sum = 0;
  options.on_output = [&sum](int64_t value) { sum += value; };
  ExecResult result = ExecuteImage({3, 0, 4, 0, 3, 0, 4, 0, 99}, options);
  if (!ExpectStatus(result, ExecStatus::Halted, "vm_execute_options")) return false;
  if (!ExpectOutputs(result.outputs, {4, 5}, "vm_execute_options")) return false;
  return sum == 9;
}

bool RunImageLoadTest() {
  Tally::Byte::LoadResult load = Tally::Byte::LoadImageFromText("1,9,10,3,2,3,11,0,99,30,40,50\n");
  if (!load.ok) {
    std::cerr << "image load failed: " << load.error << "\n";
    return false;
  }
  if (!ExpectImageEqual(load.image, {1, 9, 10, 3, 2, 3, 11, 0, 99, 30, 40, 50}, "image_load")) {
    return false;
  }
  load = Tally::Byte::LoadImageFromText(" [3, -1 ,4] ");
  if (!load.ok || !ExpectImageEqual(load.image, {3, -1, 4}, "image_load_array")) return false;
  load = Tally::Byte::LoadImageFromText("");
  if (!load.ok || !load.image.empty()) return false;
  const char* bad[] = {"1,,2", "1,2,", ",1", "1,abc", "99999999999999999999", "[1,2", "1-2"};
  for (const char* text : bad) {
    load = Tally::Byte::LoadImageFromText(text);
    if (load.ok) {
      std::cerr << "expected image load failure for '" << text << "'\n";
      return false;
    }
  }
  return Tally::Byte::FormatImage({104, -3, 99}) == "104,-3,99";
}

bool RunDisassembleTest() {
  std::string text = Tally::Byte::DisassembleImage({1002, 4, 3, 4, 33});
  if (text != "0: MUL [4], 3, [4]\n4: .word 33\n") {
    std::cerr << "unexpected disassembly:\n" << text;
    return false;
  }
  text = Tally::Byte::DisassembleImage({109, 19, 204, -34, 99});
  if (text != "0: ARB 19\n2: OUT rb[-34]\n4: HALT\n") {
    std::cerr << "unexpected disassembly:\n" << text;
    return false;
  }
  return true;
}

bool RunOpWordCodecTest() {
  using Tally::Byte::AddrMode;
  AddrMode modes[3] = {AddrMode::Relative, AddrMode::Immediate, AddrMode::Position};
  int64_t word = Tally::Byte::EncodeOpWord(Tally::Byte::OpCode::Less, modes, 3);
  if (word != 1207) return false;
  Tally::Byte::DecodedOp decoded;
  if (!Tally::Byte::DecodeOpWord(21105, &decoded)) return false;
  if (decoded.opcode != 5 || decoded.modes[0] != 1 || decoded.modes[1] != 1 ||
      decoded.modes[2] != 2) {
    return false;
  }
  return !Tally::Byte::DecodeOpWord(-1, &decoded);
}

static const TestCase kCoreTests[] = {
  {"vm_add_mul_halt", RunVmAddMulHaltTest},
  {"vm_halt_repeats", RunVmHaltRepeatsTest},
  {"vm_immediate_mode", RunVmImmediateModeTest},
  {"vm_equals_less", RunVmEqualsLessTest},
  {"vm_jump", RunVmJumpTest},
  {"vm_compare_program", RunVmCompareProgramTest},
  {"vm_relative_quine", RunVmRelativeQuineTest},
  {"vm_large_words", RunVmLargeWordsTest},
  {"vm_input_required", RunVmInputRequiredTest},
  {"vm_run_resumes_after_input", RunVmRunResumesAfterInputTest},
  {"vm_immediate_store", RunVmImmediateStoreTest},
  {"vm_invalid_opcode", RunVmInvalidOpcodeTest},
  {"vm_invalid_mode_digit", RunVmInvalidModeDigitTest},
  {"vm_memory_fault", RunVmMemoryFaultTest},
  {"vm_image_too_large", RunVmImageTooLargeTest},
  {"vm_reset", RunVmResetTest},
  {"vm_tape_backends", RunVmTapeBackendsTest},
  {"tape_fixed", RunTapeFixedTest},
  {"tape_growable", RunTapeGrowableTest},
  {"tape_sparse", RunTapeSparseTest},
  {"vm_execute_options", RunExecuteOptionsTest},
  {"image_load", RunImageLoadTest},
  {"image_disassemble", RunDisassembleTest},
  {"op_word_codec", RunOpWordCodecTest},
};

static const TestSection kCoreSections[] = {
  {"core", kCoreTests, sizeof(kCoreTests) / sizeof(kCoreTests[0])},
};

const TestSection* GetCoreSections(size_t* count) {
  if (count) {
    *count = sizeof(kCoreSections) / sizeof(kCoreSections[0]);
  }
  return kCoreSections;
}

} // namespace Tally::VM::Tests
