#ifndef TALLY_IR_LANG_H
#define TALLY_IR_LANG_H

#include <string>

#include "image.h"
#include "ir_program.h"

namespace Tally::IR::Text {

// One instruction per line, ';' comments. Operands:
//   42 / -7       immediate
//   &name         position reference
//   @name         relative reference
//   $name         label reference (address as an immediate)
//   [5]#name      immediate anchor (initial value optional)
//   [5]&#name     position anchor (initial value optional)
// Pseudo instructions: LBL name, VAR name [initial].
TALLYVM_API bool ParseLlirText(const std::string& text, IrProgram* out, IrError* error);
TALLYVM_API bool ParseOperand(const std::string& token, IrOperand* out, std::string* error);
TALLYVM_API bool LookupMnemonic(const std::string& mnemonic, InstKind* out);

// ParseLlirText followed by CompileToImage.
TALLYVM_API bool CompileLlirText(const std::string& text, Tally::Byte::Image* out, IrError* error);

} // namespace Tally::IR::Text

#endif // TALLY_IR_LANG_H
