#include "ir_program.h"

#include <cctype>
#include <sstream>

namespace Tally::IR {

const char* IrErrorKindName(IrErrorKind kind) {
  switch (kind) {
    case IrErrorKind::None: return "None";
    case IrErrorKind::Parse: return "ParseError";
    case IrErrorKind::DuplicateAnchor: return "DuplicateAnchor";
    case IrErrorKind::UndefinedSymbol: return "UndefinedSymbol";
    case IrErrorKind::MalformedOperand: return "MalformedOperand";
  }
  return "Unknown";
}

std::string FormatIrError(const IrError& error) {
  std::ostringstream out;
  out << IrErrorKindName(error.kind);
  if (error.line != 0) out << " line " << error.line;
  out << ": " << error.message;
  return out.str();
}

bool SetIrError(IrError* error, IrErrorKind kind, const std::string& message, uint32_t line) {
  if (error) {
    error->kind = kind;
    error->message = message;
    error->line = line;
  }
  return false;
}

const char* InstKindName(InstKind kind) {
  switch (kind) {
    case InstKind::Add: return "ADD";
    case InstKind::Mul: return "MUL";
    case InstKind::In: return "IN";
    case InstKind::Out: return "OUT";
    case InstKind::JumpIfTrue: return "JIT";
    case InstKind::JumpIfFalse: return "JIF";
    case InstKind::Less: return "LESS";
    case InstKind::Equals: return "EQ";
    case InstKind::AdjustBase: return "ARB";
    case InstKind::Halt: return "HALT";
    case InstKind::Copy: return "COPY";
    case InstKind::Jump: return "JUMP";
    case InstKind::AddInPlace: return "IADD";
    case InstKind::MulInPlace: return "IMUL";
    case InstKind::Label: return "LBL";
    case InstKind::Var: return "VAR";
  }
  return "UNKNOWN";
}

int InstArity(InstKind kind) {
  switch (kind) {
    case InstKind::Add:
    case InstKind::Mul:
    case InstKind::Less:
    case InstKind::Equals:
      return 3;
    case InstKind::JumpIfTrue:
    case InstKind::JumpIfFalse:
    case InstKind::Copy:
    case InstKind::AddInPlace:
    case InstKind::MulInPlace:
      return 2;
    case InstKind::In:
    case InstKind::Out:
    case InstKind::AdjustBase:
    case InstKind::Jump:
    case InstKind::Var:
      return 1;
    case InstKind::Halt:
    case InstKind::Label:
      return 0;
  }
  return 0;
}

bool IsPrimitive(InstKind kind) {
  Tally::Byte::OpCode op;
  return PrimitiveOpCode(kind, &op);
}

bool IsDerived(InstKind kind) {
  return kind == InstKind::Copy || kind == InstKind::Jump || kind == InstKind::AddInPlace ||
         kind == InstKind::MulInPlace;
}

bool IsPseudo(InstKind kind) {
  return kind == InstKind::Label || kind == InstKind::Var;
}

bool PrimitiveOpCode(InstKind kind, Tally::Byte::OpCode* out) {
  using Tally::Byte::OpCode;
  switch (kind) {
    case InstKind::Add: *out = OpCode::Add; return true;
    case InstKind::Mul: *out = OpCode::Mul; return true;
    case InstKind::In: *out = OpCode::In; return true;
    case InstKind::Out: *out = OpCode::Out; return true;
    case InstKind::JumpIfTrue: *out = OpCode::JumpIfTrue; return true;
    case InstKind::JumpIfFalse: *out = OpCode::JumpIfFalse; return true;
    case InstKind::Less: *out = OpCode::Less; return true;
    case InstKind::Equals: *out = OpCode::Equals; return true;
    case InstKind::AdjustBase: *out = OpCode::AdjustBase; return true;
    case InstKind::Halt: *out = OpCode::Halt; return true;
    default:
      return false;
  }
}

bool IsAnchor(const IrOperand& operand) {
  return operand.kind == OperandKind::ImmediateAnchor || operand.kind == OperandKind::PositionAnchor;
}

bool IsReference(const IrOperand& operand) {
  return operand.kind == OperandKind::Position || operand.kind == OperandKind::Relative ||
         operand.kind == OperandKind::LabelRef;
}

bool IsWritable(const IrOperand& operand) {
  return operand.kind == OperandKind::Position || operand.kind == OperandKind::Relative ||
         operand.kind == OperandKind::PositionAnchor;
}

bool IsValidIdentifier(const std::string& name) {
  if (name.empty()) return false;
  unsigned char first = static_cast<unsigned char>(name[0]);
  if (!(std::isalpha(first) || first == '_')) return false;
  for (size_t i = 1; i < name.size(); ++i) {
    unsigned char ch = static_cast<unsigned char>(name[i]);
    if (!(std::isalnum(ch) || ch == '_')) return false;
  }
  return true;
}

int WriteOperandIndex(InstKind kind) {
  switch (kind) {
    case InstKind::Add:
    case InstKind::Mul:
    case InstKind::Less:
    case InstKind::Equals:
      return 2;
    case InstKind::In:
    case InstKind::Copy:
    case InstKind::AddInPlace:
    case InstKind::MulInPlace:
      return 0;
    default:
      return -1;
  }
}

bool ValidateInst(const IrInst& inst, IrError* error) {
  const char* name = InstKindName(inst.kind);
  int arity = InstArity(inst.kind);
  if (static_cast<int>(inst.operands.size()) != arity) {
    std::ostringstream out;
    out << name << " expects " << arity << " operand" << (arity == 1 ? "" : "s") << ", got "
        << inst.operands.size();
    return SetIrError(error, IrErrorKind::MalformedOperand, out.str(), inst.line_no);
  }
  if (inst.kind == InstKind::Label) {
    if (!IsValidIdentifier(inst.label)) {
      return SetIrError(error, IrErrorKind::MalformedOperand, "LBL has invalid name '" + inst.label + "'",
                        inst.line_no);
    }
    return true;
  }
  if (inst.kind == InstKind::Var && inst.operands[0].kind != OperandKind::ImmediateAnchor) {
    return SetIrError(error, IrErrorKind::MalformedOperand, "VAR operand must declare its own anchor",
                      inst.line_no);
  }
  for (size_t i = 0; i < inst.operands.size(); ++i) {
    const IrOperand& operand = inst.operands[i];
    if (operand.kind != OperandKind::Immediate && !IsValidIdentifier(operand.name)) {
      std::ostringstream out;
      out << name << " operand " << (i + 1) << " has invalid name '" << operand.name << "'";
      return SetIrError(error, IrErrorKind::MalformedOperand, out.str(), inst.line_no);
    }
  }

  int write_index = WriteOperandIndex(inst.kind);
  if (write_index < 0) return true;
  const IrOperand& dest = inst.operands[static_cast<size_t>(write_index)];
  bool ok = IsWritable(dest);
  if (inst.kind == InstKind::AddInPlace || inst.kind == InstKind::MulInPlace) {
    // The destination is read and written; an immediate anchor is written back through its name.
    ok = dest.kind == OperandKind::Position || dest.kind == OperandKind::Relative ||
         dest.kind == OperandKind::ImmediateAnchor;
  }
  if (!ok) {
    std::ostringstream out;
    out << name << " cannot write to " << FormatOperand(dest);
    return SetIrError(error, IrErrorKind::MalformedOperand, out.str(), inst.line_no);
  }
  return true;
}

bool ValidateProgram(const IrProgram& program, IrError* error) {
  for (const auto& inst : program.insts) {
    if (!ValidateInst(inst, error)) return false;
  }
  return true;
}

std::string FormatOperand(const IrOperand& operand) {
  std::ostringstream out;
  switch (operand.kind) {
    case OperandKind::Immediate:
      out << operand.value;
      break;
    case OperandKind::Position:
      out << "&" << operand.name;
      break;
    case OperandKind::Relative:
      out << "@" << operand.name;
      break;
    case OperandKind::LabelRef:
      out << "$" << operand.name;
      break;
    case OperandKind::ImmediateAnchor:
      if (operand.value != 0) out << "[" << operand.value << "]";
      out << "#" << operand.name;
      break;
    case OperandKind::PositionAnchor:
      if (operand.value != 0) out << "[" << operand.value << "]";
      out << "&#" << operand.name;
      break;
  }
  return out.str();
}

std::string FormatInst(const IrInst& inst) {
  std::ostringstream out;
  out << InstKindName(inst.kind);
  if (inst.kind == InstKind::Label) {
    out << " " << inst.label;
    return out.str();
  }
  if (inst.kind == InstKind::Var && inst.operands.size() == 1) {
    out << " " << inst.operands[0].name;
    if (inst.operands[0].value != 0) out << " " << inst.operands[0].value;
    return out.str();
  }
  for (const auto& operand : inst.operands) {
    out << " " << FormatOperand(operand);
  }
  return out.str();
}

} // namespace Tally::IR
