#ifndef TALLY_IR_PROGRAM_H
#define TALLY_IR_PROGRAM_H

#include <cstdint>
#include <string>
#include <vector>

#include "opcode.h"
#include "tally_api.h"

namespace Tally::IR {

enum class OperandKind : uint8_t {
  Immediate,
  Position,
  Relative,
  LabelRef,
  ImmediateAnchor,
  PositionAnchor,
};

// Anchor kinds declare `name` at this operand's word and store `value` there.
// Position/Relative/LabelRef refer to `name`; Immediate uses only `value`.
struct IrOperand {
  OperandKind kind = OperandKind::Immediate;
  int64_t value = 0;
  std::string name;
};

enum class InstKind : uint8_t {
  Add,
  Mul,
  In,
  Out,
  JumpIfTrue,
  JumpIfFalse,
  Less,
  Equals,
  AdjustBase,
  Halt,

  Copy,
  Jump,
  AddInPlace,
  MulInPlace,

  Label,
  Var,
};

struct IrInst {
  InstKind kind = InstKind::Halt;
  std::vector<IrOperand> operands;
  std::string label;
  uint32_t line_no = 0;
};

struct IrProgram {
  std::vector<IrInst> insts;
};

enum class IrErrorKind : uint8_t {
  None,
  Parse,
  DuplicateAnchor,
  UndefinedSymbol,
  MalformedOperand,
};

struct IrError {
  IrErrorKind kind = IrErrorKind::None;
  std::string message;
  uint32_t line = 0;
};

TALLYVM_API const char* IrErrorKindName(IrErrorKind kind);
TALLYVM_API std::string FormatIrError(const IrError& error);
bool SetIrError(IrError* error, IrErrorKind kind, const std::string& message, uint32_t line = 0);

TALLYVM_API const char* InstKindName(InstKind kind);
TALLYVM_API int InstArity(InstKind kind);
TALLYVM_API bool IsPrimitive(InstKind kind);
TALLYVM_API bool IsDerived(InstKind kind);
TALLYVM_API bool IsPseudo(InstKind kind);
// Maps a primitive kind to its machine opcode; false for derived and pseudo kinds.
TALLYVM_API bool PrimitiveOpCode(InstKind kind, Tally::Byte::OpCode* out);

TALLYVM_API bool IsAnchor(const IrOperand& operand);
TALLYVM_API bool IsReference(const IrOperand& operand);
TALLYVM_API bool IsWritable(const IrOperand& operand);
TALLYVM_API bool IsValidIdentifier(const std::string& name);

// Index of the operand a kind writes to, or -1. For derived in-place kinds this
// is the destination operand in surface order.
TALLYVM_API int WriteOperandIndex(InstKind kind);

TALLYVM_API bool ValidateInst(const IrInst& inst, IrError* error);
TALLYVM_API bool ValidateProgram(const IrProgram& program, IrError* error);

TALLYVM_API std::string FormatOperand(const IrOperand& operand);
TALLYVM_API std::string FormatInst(const IrInst& inst);

} // namespace Tally::IR

#endif // TALLY_IR_PROGRAM_H
