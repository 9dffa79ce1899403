#include "ir_builder.h"

namespace Tally::IR {

IrOperand IrBuilder::Imm(int64_t value) {
  IrOperand operand;
  operand.kind = OperandKind::Immediate;
  operand.value = value;
  return operand;
}

IrOperand IrBuilder::Pos(const std::string& name) {
  IrOperand operand;
  operand.kind = OperandKind::Position;
  operand.name = name;
  return operand;
}

IrOperand IrBuilder::Rel(const std::string& name) {
  IrOperand operand;
  operand.kind = OperandKind::Relative;
  operand.name = name;
  return operand;
}

IrOperand IrBuilder::LabelRef(const std::string& name) {
  IrOperand operand;
  operand.kind = OperandKind::LabelRef;
  operand.name = name;
  return operand;
}

IrOperand IrBuilder::ImmAnchor(const std::string& name, int64_t value) {
  IrOperand operand;
  operand.kind = OperandKind::ImmediateAnchor;
  operand.name = name;
  operand.value = value;
  return operand;
}

IrOperand IrBuilder::PosAnchor(const std::string& name, int64_t value) {
  IrOperand operand;
  operand.kind = OperandKind::PositionAnchor;
  operand.name = name;
  operand.value = value;
  return operand;
}

void IrBuilder::EmitAdd(const IrOperand& a, const IrOperand& b, const IrOperand& dst) {
  Append(InstKind::Add, {a, b, dst});
}

void IrBuilder::EmitMul(const IrOperand& a, const IrOperand& b, const IrOperand& dst) {
  Append(InstKind::Mul, {a, b, dst});
}

void IrBuilder::EmitIn(const IrOperand& dst) {
  Append(InstKind::In, {dst});
}

void IrBuilder::EmitOut(const IrOperand& value) {
  Append(InstKind::Out, {value});
}

void IrBuilder::EmitJumpIfTrue(const IrOperand& cond, const IrOperand& target) {
  Append(InstKind::JumpIfTrue, {cond, target});
}

void IrBuilder::EmitJumpIfFalse(const IrOperand& cond, const IrOperand& target) {
  Append(InstKind::JumpIfFalse, {cond, target});
}

void IrBuilder::EmitLess(const IrOperand& a, const IrOperand& b, const IrOperand& dst) {
  Append(InstKind::Less, {a, b, dst});
}

void IrBuilder::EmitEquals(const IrOperand& a, const IrOperand& b, const IrOperand& dst) {
  Append(InstKind::Equals, {a, b, dst});
}

void IrBuilder::EmitAdjustBase(const IrOperand& delta) {
  Append(InstKind::AdjustBase, {delta});
}

void IrBuilder::EmitHalt() {
  Append(InstKind::Halt, {});
}

void IrBuilder::EmitCopy(const IrOperand& dst, const IrOperand& src) {
  Append(InstKind::Copy, {dst, src});
}

void IrBuilder::EmitJump(const IrOperand& target) {
  Append(InstKind::Jump, {target});
}

void IrBuilder::EmitAddInPlace(const IrOperand& dst, const IrOperand& value) {
  Append(InstKind::AddInPlace, {dst, value});
}

void IrBuilder::EmitMulInPlace(const IrOperand& dst, const IrOperand& value) {
  Append(InstKind::MulInPlace, {dst, value});
}

void IrBuilder::EmitLabel(const std::string& name) {
  IrInst inst;
  inst.kind = InstKind::Label;
  inst.label = name;
  insts_.push_back(std::move(inst));
}

void IrBuilder::EmitVar(const std::string& name, int64_t initial) {
  Append(InstKind::Var, {ImmAnchor(name, initial)});
}

void IrBuilder::Emit(IrInst inst) {
  insts_.push_back(std::move(inst));
}

bool IrBuilder::Finish(IrProgram* out, IrError* error) {
  if (!out) return SetIrError(error, IrErrorKind::MalformedOperand, "output program is null");
  for (size_t i = 0; i < insts_.size(); ++i) {
    if (!ValidateInst(insts_[i], error)) {
      if (error && error->line == 0) {
        error->message = "inst " + std::to_string(i) + ": " + error->message;
      }
      return false;
    }
  }
  out->insts = insts_;
  return true;
}

void IrBuilder::Append(InstKind kind, std::vector<IrOperand> operands) {
  IrInst inst;
  inst.kind = kind;
  inst.operands = std::move(operands);
  insts_.push_back(std::move(inst));
}

} // namespace Tally::IR
