#include "ir_layout.h"

#include "ir_lower.h"

namespace Tally::IR {
namespace {

IrLayout LayoutLowered(const IrInst& inst) {
  IrLayout layout;
  switch (inst.kind) {
    case InstKind::Label:
      layout.size = 0;
      layout.adjust = -1;
      layout.anchors[0] = inst.label;
      return layout;
    case InstKind::Var:
      layout.size = 1;
      layout.adjust = -1;
      if (!inst.operands.empty()) layout.anchors[0] = inst.operands[0].name;
      return layout;
    default:
      break;
  }
  layout.size = 1 + static_cast<uint32_t>(inst.operands.size());
  for (size_t i = 0; i < inst.operands.size() && i < layout.anchors.size(); ++i) {
    if (IsAnchor(inst.operands[i])) layout.anchors[i] = inst.operands[i].name;
  }
  return layout;
}

} // namespace

IrLayout LayoutInstruction(const IrInst& inst) {
  if (!IsDerived(inst.kind)) return LayoutLowered(inst);
  IrInst lowered;
  if (LowerInstruction(inst, &lowered, nullptr)) return LayoutLowered(lowered);
  // Malformed derived instructions are rejected at construction; size them by arity.
  IrLayout layout;
  Tally::Byte::OpInfo info{};
  Tally::Byte::OpCode op = inst.kind == InstKind::Jump ? Tally::Byte::OpCode::JumpIfTrue
                                                       : Tally::Byte::OpCode::Add;
  if (Tally::Byte::GetOpInfo(static_cast<uint8_t>(op), &info)) {
    layout.size = 1 + static_cast<uint32_t>(info.operand_count);
  }
  return layout;
}

std::vector<IrLayout> AnalyzeLayout(const IrProgram& program) {
  std::vector<IrLayout> layouts;
  layouts.reserve(program.insts.size());
  for (const auto& inst : program.insts) {
    layouts.push_back(LayoutInstruction(inst));
  }
  return layouts;
}

uint64_t TotalSize(const std::vector<IrLayout>& layouts) {
  uint64_t total = 0;
  for (const auto& layout : layouts) total += layout.size;
  return total;
}

} // namespace Tally::IR
