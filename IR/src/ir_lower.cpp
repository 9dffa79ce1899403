#include "ir_lower.h"

#include "ir_builder.h"

namespace Tally::IR {
namespace {

bool WriteForm(const IrInst& inst, const IrOperand& dest, IrOperand* out, IrError* error) {
  switch (dest.kind) {
    case OperandKind::Position:
    case OperandKind::Relative:
      *out = dest;
      return true;
    case OperandKind::ImmediateAnchor:
      *out = IrBuilder::Pos(dest.name);
      return true;
    default:
      break;
  }
  return SetIrError(error, IrErrorKind::MalformedOperand,
                    std::string(InstKindName(inst.kind)) + " cannot write to " + FormatOperand(dest),
                    inst.line_no);
}

} // namespace

bool LowerInstruction(const IrInst& inst, IrInst* out, IrError* error) {
  if (!out) return SetIrError(error, IrErrorKind::MalformedOperand, "output instruction is null");
  if (!IsDerived(inst.kind)) {
    *out = inst;
    return true;
  }
  if (!ValidateInst(inst, error)) return false;

  IrInst lowered;
  lowered.line_no = inst.line_no;
  switch (inst.kind) {
    case InstKind::Copy:
      lowered.kind = InstKind::Add;
      lowered.operands = {inst.operands[1], IrBuilder::Imm(0), inst.operands[0]};
      break;
    case InstKind::Jump:
      lowered.kind = InstKind::JumpIfTrue;
      lowered.operands = {IrBuilder::Imm(1), inst.operands[0]};
      break;
    case InstKind::AddInPlace:
    case InstKind::MulInPlace: {
      IrOperand dest;
      if (!WriteForm(inst, inst.operands[0], &dest, error)) return false;
      lowered.kind = inst.kind == InstKind::AddInPlace ? InstKind::Add : InstKind::Mul;
      lowered.operands = {inst.operands[0], inst.operands[1], dest};
      break;
    }
    default:
      return SetIrError(error, IrErrorKind::MalformedOperand,
                        std::string("no lowering for ") + InstKindName(inst.kind), inst.line_no);
  }
  *out = std::move(lowered);
  return true;
}

bool LowerProgram(const IrProgram& program, IrProgram* out, IrError* error) {
  if (!out) return SetIrError(error, IrErrorKind::MalformedOperand, "output program is null");
  IrProgram lowered;
  lowered.insts.reserve(program.insts.size());
  for (const auto& inst : program.insts) {
    IrInst next;
    if (!LowerInstruction(inst, &next, error)) return false;
    lowered.insts.push_back(std::move(next));
  }
  *out = std::move(lowered);
  return true;
}

} // namespace Tally::IR
