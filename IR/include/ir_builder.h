#ifndef TALLY_IR_BUILDER_H
#define TALLY_IR_BUILDER_H

#include <cstdint>
#include <string>
#include <vector>

#include "ir_program.h"

namespace Tally::IR {

class TALLYVM_API IrBuilder {
 public:
  static IrOperand Imm(int64_t value);
  static IrOperand Pos(const std::string& name);
  static IrOperand Rel(const std::string& name);
  static IrOperand LabelRef(const std::string& name);
  static IrOperand ImmAnchor(const std::string& name, int64_t value = 0);
  static IrOperand PosAnchor(const std::string& name, int64_t value = 0);

  void EmitAdd(const IrOperand& a, const IrOperand& b, const IrOperand& dst);
  void EmitMul(const IrOperand& a, const IrOperand& b, const IrOperand& dst);
  void EmitIn(const IrOperand& dst);
  void EmitOut(const IrOperand& value);
  void EmitJumpIfTrue(const IrOperand& cond, const IrOperand& target);
  void EmitJumpIfFalse(const IrOperand& cond, const IrOperand& target);
  void EmitLess(const IrOperand& a, const IrOperand& b, const IrOperand& dst);
  void EmitEquals(const IrOperand& a, const IrOperand& b, const IrOperand& dst);
  void EmitAdjustBase(const IrOperand& delta);
  void EmitHalt();

  void EmitCopy(const IrOperand& dst, const IrOperand& src);
  void EmitJump(const IrOperand& target);
  void EmitAddInPlace(const IrOperand& dst, const IrOperand& value);
  void EmitMulInPlace(const IrOperand& dst, const IrOperand& value);

  void EmitLabel(const std::string& name);
  void EmitVar(const std::string& name, int64_t initial = 0);

  void Emit(IrInst inst);
  size_t size() const { return insts_.size(); }

  bool Finish(IrProgram* out, IrError* error);

 private:
  void Append(InstKind kind, std::vector<IrOperand> operands);

  std::vector<IrInst> insts_;
};

} // namespace Tally::IR

#endif // TALLY_IR_BUILDER_H
