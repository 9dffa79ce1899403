#ifndef TALLY_IR_LAYOUT_H
#define TALLY_IR_LAYOUT_H

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "ir_program.h"

namespace Tally::IR {

// size:    words the instruction occupies once lowered to primitives.
// anchors: identifier declared by operand slot i, if any.
// adjust:  added to every anchor address; -1 for instructions with no opcode word.
struct IrLayout {
  uint32_t size = 0;
  std::array<std::optional<std::string>, Tally::Byte::kMaxOperands> anchors;
  int32_t adjust = 0;
};

TALLYVM_API IrLayout LayoutInstruction(const IrInst& inst);
TALLYVM_API std::vector<IrLayout> AnalyzeLayout(const IrProgram& program);
TALLYVM_API uint64_t TotalSize(const std::vector<IrLayout>& layouts);

} // namespace Tally::IR

#endif // TALLY_IR_LAYOUT_H
