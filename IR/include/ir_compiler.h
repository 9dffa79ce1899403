#ifndef TALLY_IR_COMPILER_H
#define TALLY_IR_COMPILER_H

#include <string>
#include <vector>

#include "image.h"
#include "ir_layout.h"
#include "ir_program.h"
#include "ir_resolver.h"

namespace Tally::IR {

using Tally::Byte::Image;

struct CompileOutput {
  Image image;
  IrProgram lowered;
  std::vector<IrLayout> layouts;
  SymbolTable symbols;
};

TALLYVM_API bool EmitImage(const std::vector<ResolvedInst>& insts, Image* out, IrError* error);

// Lower, lay out, resolve and emit.
TALLYVM_API bool CompileToImage(const IrProgram& program, Image* out, IrError* error);
TALLYVM_API bool CompileToImage(const IrProgram& program, CompileOutput* out, IrError* error);

} // namespace Tally::IR

#endif // TALLY_IR_COMPILER_H
