#ifndef TALLY_IR_RESOLVER_H
#define TALLY_IR_RESOLVER_H

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "ir_layout.h"
#include "ir_program.h"
#include "opcode.h"

namespace Tally::IR {

class TALLYVM_API SymbolTable {
 public:
  // False if name is already present; the existing entry is kept.
  bool Insert(const std::string& name, int64_t address, uint32_t line_no = 0);
  bool Lookup(const std::string& name, int64_t* out) const;
  bool Contains(const std::string& name) const;
  uint32_t LineOf(const std::string& name) const;
  size_t size() const { return addresses_.size(); }
  const std::unordered_map<std::string, int64_t>& entries() const { return addresses_; }
  void Clear();

 private:
  std::unordered_map<std::string, int64_t> addresses_;
  std::unordered_map<std::string, uint32_t> lines_;
};

struct ResolvedOperand {
  Tally::Byte::AddrMode mode = Tally::Byte::AddrMode::Position;
  int64_t word = 0;
};

enum class ResolvedKind : uint8_t {
  Op,
  Data,
  Marker,
};

struct ResolvedInst {
  ResolvedKind kind = ResolvedKind::Op;
  Tally::Byte::OpCode op = Tally::Byte::OpCode::Halt;
  std::vector<ResolvedOperand> operands;
  int64_t data = 0;
};

// Pass 1: assigns every anchor and label its absolute image address.
TALLYVM_API bool BuildSymbolTable(const IrProgram& program,
                                  const std::vector<IrLayout>& layouts,
                                  SymbolTable* out,
                                  IrError* error);

// Pass 2: replaces references with addresses and anchors with their initial
// values. The program must contain only primitive and pseudo instructions.
TALLYVM_API bool SubstituteSymbols(const IrProgram& program,
                                   const SymbolTable& symbols,
                                   std::vector<ResolvedInst>* out,
                                   IrError* error);

TALLYVM_API bool ResolveOperand(const IrOperand& operand,
                                const SymbolTable& symbols,
                                uint32_t line_no,
                                ResolvedOperand* out,
                                IrError* error);

} // namespace Tally::IR

#endif // TALLY_IR_RESOLVER_H
