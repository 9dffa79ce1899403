#include "ir_resolver.h"

#include <sstream>

namespace Tally::IR {

using Tally::Byte::AddrMode;

bool SymbolTable::Insert(const std::string& name, int64_t address, uint32_t line_no) {
  auto inserted = addresses_.emplace(name, address);
  if (!inserted.second) return false;
  lines_[name] = line_no;
  return true;
}

bool SymbolTable::Lookup(const std::string& name, int64_t* out) const {
  auto it = addresses_.find(name);
  if (it == addresses_.end()) return false;
  if (out) *out = it->second;
  return true;
}

bool SymbolTable::Contains(const std::string& name) const {
  return addresses_.find(name) != addresses_.end();
}

uint32_t SymbolTable::LineOf(const std::string& name) const {
  auto it = lines_.find(name);
  return it == lines_.end() ? 0 : it->second;
}

void SymbolTable::Clear() {
  addresses_.clear();
  lines_.clear();
}

bool BuildSymbolTable(const IrProgram& program,
                      const std::vector<IrLayout>& layouts,
                      SymbolTable* out,
                      IrError* error) {
  if (!out) return SetIrError(error, IrErrorKind::MalformedOperand, "output symbol table is null");
  if (layouts.size() != program.insts.size()) {
    return SetIrError(error, IrErrorKind::MalformedOperand, "layout count does not match program");
  }
  SymbolTable table;
  int64_t current_index = 0;
  for (size_t i = 0; i < program.insts.size(); ++i) {
    const IrInst& inst = program.insts[i];
    const IrLayout& layout = layouts[i];
    for (size_t slot = 0; slot < layout.anchors.size(); ++slot) {
      if (!layout.anchors[slot]) continue;
      const std::string& name = *layout.anchors[slot];
      int64_t address = current_index + 1 + static_cast<int64_t>(slot) + layout.adjust;
      if (!table.Insert(name, address, inst.line_no)) {
        std::ostringstream msg;
        msg << "anchor '" << name << "' already declared";
        uint32_t first_line = table.LineOf(name);
        if (first_line != 0) msg << " at line " << first_line;
        return SetIrError(error, IrErrorKind::DuplicateAnchor, msg.str(), inst.line_no);
      }
    }
    current_index += layout.size;
  }
  *out = std::move(table);
  return true;
}

bool ResolveOperand(const IrOperand& operand,
                    const SymbolTable& symbols,
                    uint32_t line_no,
                    ResolvedOperand* out,
                    IrError* error) {
  switch (operand.kind) {
    case OperandKind::Immediate:
      *out = {AddrMode::Immediate, operand.value};
      return true;
    case OperandKind::ImmediateAnchor:
      *out = {AddrMode::Immediate, operand.value};
      return true;
    case OperandKind::PositionAnchor:
      *out = {AddrMode::Position, operand.value};
      return true;
    case OperandKind::Position:
    case OperandKind::Relative:
    case OperandKind::LabelRef:
      break;
  }
  int64_t address = 0;
  if (!symbols.Lookup(operand.name, &address)) {
    return SetIrError(error, IrErrorKind::UndefinedSymbol,
                      "undefined symbol '" + operand.name + "'", line_no);
  }
  AddrMode mode = AddrMode::Position;
  if (operand.kind == OperandKind::Relative) mode = AddrMode::Relative;
  if (operand.kind == OperandKind::LabelRef) mode = AddrMode::Immediate;
  *out = {mode, address};
  return true;
}

bool SubstituteSymbols(const IrProgram& program,
                       const SymbolTable& symbols,
                       std::vector<ResolvedInst>* out,
                       IrError* error) {
  if (!out) return SetIrError(error, IrErrorKind::MalformedOperand, "output instructions are null");
  std::vector<ResolvedInst> resolved;
  resolved.reserve(program.insts.size());
  for (const auto& inst : program.insts) {
    ResolvedInst next;
    if (inst.kind == InstKind::Label) {
      next.kind = ResolvedKind::Marker;
      resolved.push_back(std::move(next));
      continue;
    }
    if (inst.kind == InstKind::Var) {
      if (inst.operands.size() != 1) {
        return SetIrError(error, IrErrorKind::MalformedOperand, "VAR expects 1 operand", inst.line_no);
      }
      next.kind = ResolvedKind::Data;
      next.data = inst.operands[0].value;
      resolved.push_back(std::move(next));
      continue;
    }
    if (!PrimitiveOpCode(inst.kind, &next.op)) {
      return SetIrError(error, IrErrorKind::MalformedOperand,
                        std::string(InstKindName(inst.kind)) + " must be lowered before resolution",
                        inst.line_no);
    }
    Tally::Byte::OpInfo info{};
    if (!Tally::Byte::GetOpInfo(static_cast<uint8_t>(next.op), &info) ||
        static_cast<int>(inst.operands.size()) != info.operand_count) {
      return SetIrError(error, IrErrorKind::MalformedOperand,
                        std::string(InstKindName(inst.kind)) + " has wrong operand count", inst.line_no);
    }
    next.kind = ResolvedKind::Op;
    for (const auto& operand : inst.operands) {
      ResolvedOperand value;
      if (!ResolveOperand(operand, symbols, inst.line_no, &value, error)) return false;
      next.operands.push_back(value);
    }
    if (info.write_slot >= 0 &&
        next.operands[static_cast<size_t>(info.write_slot)].mode == AddrMode::Immediate) {
      return SetIrError(error, IrErrorKind::MalformedOperand,
                        std::string(InstKindName(inst.kind)) + " cannot write to " +
                            FormatOperand(inst.operands[static_cast<size_t>(info.write_slot)]),
                        inst.line_no);
    }
    resolved.push_back(std::move(next));
  }
  *out = std::move(resolved);
  return true;
}

} // namespace Tally::IR
