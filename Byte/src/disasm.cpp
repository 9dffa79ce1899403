#include <sstream>

#include "image.h"
#include "opcode.h"

namespace Tally::Byte {
namespace {

void AppendOperand(std::ostringstream& out, uint8_t mode, int64_t word) {
  switch (static_cast<AddrMode>(mode)) {
    case AddrMode::Position:
      out << "[" << word << "]";
      break;
    case AddrMode::Immediate:
      out << word;
      break;
    case AddrMode::Relative:
      out << "rb[" << word << "]";
      break;
  }
}

} // namespace

std::string DisassembleImage(const Image& image) {
  std::ostringstream out;
  size_t pc = 0;
  while (pc < image.size()) {
    int64_t word = image[pc];
    DecodedOp decoded;
    OpInfo info{};
    bool ok = DecodeOpWord(word, &decoded) && GetOpInfo(decoded.opcode, &info) &&
              pc + 1 + static_cast<size_t>(info.operand_count) <= image.size();
    for (int i = 0; ok && i < info.operand_count; ++i) {
      if (!IsValidAddrMode(decoded.modes[i])) ok = false;
    }
    if (!ok) {
      out << pc << ": .word " << word << "\n";
      pc++;
      continue;
    }
    out << pc << ": " << OpCodeName(decoded.opcode);
    for (int i = 0; i < info.operand_count; ++i) {
      out << (i == 0 ? " " : ", ");
      AppendOperand(out, decoded.modes[i], image[pc + 1 + static_cast<size_t>(i)]);
    }
    out << "\n";
    pc += 1 + static_cast<size_t>(info.operand_count);
  }
  return out.str();
}

} // namespace Tally::Byte
