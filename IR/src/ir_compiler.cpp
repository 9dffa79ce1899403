#include "ir_compiler.h"

#include "ir_lower.h"

namespace Tally::IR {
namespace {

using Tally::Byte::AddrMode;

void AppendOp(const ResolvedInst& inst, Image* out) {
  AddrMode modes[Tally::Byte::kMaxOperands] = {AddrMode::Position, AddrMode::Position,
                                               AddrMode::Position};
  int count = 0;
  for (const auto& operand : inst.operands) {
    if (count == Tally::Byte::kMaxOperands) break;
    modes[count++] = operand.mode;
  }
  out->push_back(Tally::Byte::EncodeOpWord(inst.op, modes, count));
  for (const auto& operand : inst.operands) {
    out->push_back(operand.word);
  }
}

} // namespace

bool EmitImage(const std::vector<ResolvedInst>& insts, Image* out, IrError* error) {
  if (!out) return SetIrError(error, IrErrorKind::MalformedOperand, "output image is null");
  Image image;
  for (const auto& inst : insts) {
    switch (inst.kind) {
      case ResolvedKind::Op:
        if (inst.operands.size() > static_cast<size_t>(Tally::Byte::kMaxOperands)) {
          return SetIrError(error, IrErrorKind::MalformedOperand, "instruction has too many operands");
        }
        AppendOp(inst, &image);
        break;
      case ResolvedKind::Data:
        image.push_back(inst.data);
        break;
      case ResolvedKind::Marker:
        break;
    }
  }
  *out = std::move(image);
  return true;
}

bool CompileToImage(const IrProgram& program, CompileOutput* out, IrError* error) {
  if (!out) return SetIrError(error, IrErrorKind::MalformedOperand, "output is null");
  if (!ValidateProgram(program, error)) return false;

  CompileOutput result;
  if (!LowerProgram(program, &result.lowered, error)) return false;
  result.layouts = AnalyzeLayout(result.lowered);
  if (!BuildSymbolTable(result.lowered, result.layouts, &result.symbols, error)) return false;

  std::vector<ResolvedInst> resolved;
  if (!SubstituteSymbols(result.lowered, result.symbols, &resolved, error)) return false;
  if (!EmitImage(resolved, &result.image, error)) return false;
  if (result.image.size() != TotalSize(result.layouts)) {
    return SetIrError(error, IrErrorKind::MalformedOperand, "emitted image size does not match layout");
  }
  *out = std::move(result);
  return true;
}

bool CompileToImage(const IrProgram& program, Image* out, IrError* error) {
  if (!out) return SetIrError(error, IrErrorKind::MalformedOperand, "output image is null");
  CompileOutput result;
  if (!CompileToImage(program, &result, error)) return false;
  *out = std::move(result.image);
  return true;
}

} // namespace Tally::IR
