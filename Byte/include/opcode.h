#ifndef TALLY_BYTE_OPCODE_H
#define TALLY_BYTE_OPCODE_H

#include <cstdint>

namespace Tally::Byte {

enum class OpCode : uint8_t {
  Add = 1,
  Mul = 2,
  In = 3,
  Out = 4,
  JumpIfTrue = 5,
  JumpIfFalse = 6,
  Less = 7,
  Equals = 8,
  AdjustBase = 9,
  Halt = 99,
};

enum class AddrMode : uint8_t {
  Position = 0,
  Immediate = 1,
  Relative = 2,
};

constexpr int kMaxOperands = 3;
constexpr int64_t kOpcodeRadix = 100;

// write_slot is the operand index the op stores into, or -1.
struct OpInfo {
  int operand_count;
  int write_slot;
  bool is_jump;
};

struct DecodedOp {
  int64_t word = 0;
  uint8_t opcode = 0;
  uint8_t modes[kMaxOperands] = {0, 0, 0};
};

bool GetOpInfo(uint8_t opcode, OpInfo* info);
const char* OpCodeName(uint8_t opcode);
const char* AddrModeName(AddrMode mode);
bool IsValidAddrMode(uint8_t mode);

int64_t EncodeOpWord(OpCode op, const AddrMode* modes, int mode_count);
// Splits an instruction word into opcode and mode digits without validating them.
bool DecodeOpWord(int64_t word, DecodedOp* out);

} // namespace Tally::Byte

#endif // TALLY_BYTE_OPCODE_H
