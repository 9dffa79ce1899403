#ifndef TALLY_IR_LOWER_H
#define TALLY_IR_LOWER_H

#include "ir_program.h"

namespace Tally::IR {

// Rewrites derived instructions into primitives; primitives and pseudo
// instructions pass through unchanged.
//   COPY dst src  -> ADD src 0 dst
//   JUMP target   -> JIT 1 target
//   IADD dst v    -> ADD dst v dst'
//   IMUL dst v    -> MUL dst v dst'
// dst' is the write form of dst: an immediate anchor becomes a position
// reference to the word it declares.
TALLYVM_API bool LowerInstruction(const IrInst& inst, IrInst* out, IrError* error);
TALLYVM_API bool LowerProgram(const IrProgram& program, IrProgram* out, IrError* error);

} // namespace Tally::IR

#endif // TALLY_IR_LOWER_H
