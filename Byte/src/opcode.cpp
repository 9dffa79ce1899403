#include "opcode.h"

namespace Tally::Byte {

bool GetOpInfo(uint8_t opcode, OpInfo* info) {
  switch (static_cast<OpCode>(opcode)) {
    case OpCode::Add:
    case OpCode::Mul:
    case OpCode::Less:
    case OpCode::Equals:
      *info = {3, 2, false};
      return true;
    case OpCode::In:
      *info = {1, 0, false};
      return true;
    case OpCode::Out:
    case OpCode::AdjustBase:
      *info = {1, -1, false};
      return true;
    case OpCode::JumpIfTrue:
    case OpCode::JumpIfFalse:
      *info = {2, -1, true};
      return true;
    case OpCode::Halt:
      *info = {0, -1, false};
      return true;
  }
  return false;
}

const char* OpCodeName(uint8_t opcode) {
  switch (static_cast<OpCode>(opcode)) {
    case OpCode::Add: return "ADD";
    case OpCode::Mul: return "MUL";
    case OpCode::In: return "IN";
    case OpCode::Out: return "OUT";
    case OpCode::JumpIfTrue: return "JIT";
    case OpCode::JumpIfFalse: return "JIF";
    case OpCode::Less: return "LESS";
    case OpCode::Equals: return "EQ";
    case OpCode::AdjustBase: return "ARB";
    case OpCode::Halt: return "HALT";
  }
  return "Unknown";
}

const char* AddrModeName(AddrMode mode) {
  switch (mode) {
    case AddrMode::Position: return "position";
    case AddrMode::Immediate: return "immediate";
    case AddrMode::Relative: return "relative";
  }
  return "unknown";
}

bool IsValidAddrMode(uint8_t mode) {
  return mode <= static_cast<uint8_t>(AddrMode::Relative);
}

int64_t EncodeOpWord(OpCode op, const AddrMode* modes, int mode_count) {
  int64_t word = static_cast<int64_t>(op);
  int64_t scale = kOpcodeRadix;
  for (int i = 0; i < mode_count && i < kMaxOperands; ++i) {
    word += scale * static_cast<int64_t>(modes[i]);
    scale *= 10;
  }
  return word;
}

bool DecodeOpWord(int64_t word, DecodedOp* out) {
  if (!out) return false;
  if (word < 0) return false;
  out->word = word;
  out->opcode = static_cast<uint8_t>(word % kOpcodeRadix);
  int64_t rest = word / kOpcodeRadix;
  for (int i = 0; i < kMaxOperands; ++i) {
    out->modes[i] = static_cast<uint8_t>(rest % 10);
    rest /= 10;
  }
  return true;
}

} // namespace Tally::Byte
