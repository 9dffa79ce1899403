#include "ir_lang.h"

#include <cctype>
#include <sstream>
#include <vector>

#include "ir_builder.h"
#include "ir_compiler.h"

namespace Tally::IR::Text {
namespace {

constexpr InstKind kAllKinds[] = {
  InstKind::Add,        InstKind::Mul,         InstKind::In,         InstKind::Out,
  InstKind::JumpIfTrue, InstKind::JumpIfFalse, InstKind::Less,       InstKind::Equals,
  InstKind::AdjustBase, InstKind::Halt,        InstKind::Copy,       InstKind::Jump,
  InstKind::AddInPlace, InstKind::MulInPlace,  InstKind::Label,      InstKind::Var,
};

std::string StripComment(const std::string& line) {
  size_t cut = line.find(';');
  if (cut == std::string::npos) return line;
  return line.substr(0, cut);
}

std::vector<std::string> SplitTokens(const std::string& line) {
  std::vector<std::string> out;
  std::string cur;
  for (char ch : line) {
    if (std::isspace(static_cast<unsigned char>(ch)) || ch == ',') {
      if (!cur.empty()) {
        out.push_back(cur);
        cur.clear();
      }
      continue;
    }
    cur.push_back(ch);
  }
  if (!cur.empty()) out.push_back(cur);
  return out;
}

std::string Upper(const std::string& text) {
  std::string out = text;
  for (char& ch : out) {
    ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
  }
  return out;
}

bool ParseName(const std::string& text, const char* what, std::string* out, std::string* error) {
  if (!IsValidIdentifier(text)) {
    if (error) *error = std::string("invalid ") + what + " name '" + text + "'";
    return false;
  }
  *out = text;
  return true;
}

} // namespace

bool LookupMnemonic(const std::string& mnemonic, InstKind* out) {
  std::string upper = Upper(mnemonic);
  for (InstKind kind : kAllKinds) {
    if (upper == InstKindName(kind)) {
      if (out) *out = kind;
      return true;
    }
  }
  return false;
}

bool ParseOperand(const std::string& token, IrOperand* out, std::string* error) {
  if (!out) return false;
  if (token.empty()) {
    if (error) *error = "empty operand";
    return false;
  }
  IrOperand operand;
  char lead = token[0];
  if (lead == '-' || std::isdigit(static_cast<unsigned char>(lead))) {
    if (!Tally::Byte::ParseDecimalWord(token, &operand.value)) {
      if (error) *error = "invalid integer literal '" + token + "'";
      return false;
    }
    operand.kind = OperandKind::Immediate;
    *out = operand;
    return true;
  }

  std::string rest = token;
  bool has_initial = false;
  if (lead == '[') {
    size_t close = token.find(']');
    if (close == std::string::npos) {
      if (error) *error = "anchor initial value missing ']' in '" + token + "'";
      return false;
    }
    std::string literal = token.substr(1, close - 1);
    if (!literal.empty() && !Tally::Byte::ParseDecimalWord(literal, &operand.value)) {
      if (error) *error = "invalid anchor initial value '" + literal + "'";
      return false;
    }
    has_initial = true;
    rest = token.substr(close + 1);
  }

  if (rest.rfind("&#", 0) == 0) {
    operand.kind = OperandKind::PositionAnchor;
    if (!ParseName(rest.substr(2), "anchor", &operand.name, error)) return false;
  } else if (rest.rfind("#", 0) == 0) {
    operand.kind = OperandKind::ImmediateAnchor;
    if (!ParseName(rest.substr(1), "anchor", &operand.name, error)) return false;
  } else if (has_initial) {
    if (error) *error = "initial value must precede an anchor in '" + token + "'";
    return false;
  } else if (rest[0] == '&') {
    operand.kind = OperandKind::Position;
    if (!ParseName(rest.substr(1), "position", &operand.name, error)) return false;
  } else if (rest[0] == '@') {
    operand.kind = OperandKind::Relative;
    if (!ParseName(rest.substr(1), "relative", &operand.name, error)) return false;
  } else if (rest[0] == '$') {
    operand.kind = OperandKind::LabelRef;
    if (!ParseName(rest.substr(1), "label", &operand.name, error)) return false;
  } else {
    if (error) *error = "unrecognized operand '" + token + "'";
    return false;
  }
  *out = operand;
  return true;
}

bool ParseLlirText(const std::string& text, IrProgram* out, IrError* error) {
  if (!out) return SetIrError(error, IrErrorKind::Parse, "output program is null");
  IrProgram program;
  std::istringstream input(text);
  std::string raw;
  uint32_t line_no = 0;
  while (std::getline(input, raw)) {
    line_no++;
    std::vector<std::string> tokens = SplitTokens(StripComment(raw));
    if (tokens.empty()) continue;

    IrInst inst;
    inst.line_no = line_no;
    if (!LookupMnemonic(tokens[0], &inst.kind)) {
      return SetIrError(error, IrErrorKind::Parse, "unknown instruction '" + tokens[0] + "'", line_no);
    }

    std::string message;
    if (inst.kind == InstKind::Label) {
      if (tokens.size() != 2) {
        return SetIrError(error, IrErrorKind::Parse, "LBL expects a name", line_no);
      }
      if (!ParseName(tokens[1], "label", &inst.label, &message)) {
        return SetIrError(error, IrErrorKind::Parse, message, line_no);
      }
    } else if (inst.kind == InstKind::Var) {
      if (tokens.size() < 2 || tokens.size() > 3) {
        return SetIrError(error, IrErrorKind::Parse, "VAR expects a name and optional initial value",
                          line_no);
      }
      std::string name;
      if (!ParseName(tokens[1], "variable", &name, &message)) {
        return SetIrError(error, IrErrorKind::Parse, message, line_no);
      }
      int64_t initial = 0;
      if (tokens.size() == 3 && !Tally::Byte::ParseDecimalWord(tokens[2], &initial)) {
        return SetIrError(error, IrErrorKind::Parse, "invalid VAR initial value '" + tokens[2] + "'",
                          line_no);
      }
      inst.operands.push_back(IrBuilder::ImmAnchor(name, initial));
    } else {
      for (size_t i = 1; i < tokens.size(); ++i) {
        IrOperand operand;
        if (!ParseOperand(tokens[i], &operand, &message)) {
          return SetIrError(error, IrErrorKind::Parse, message, line_no);
        }
        inst.operands.push_back(std::move(operand));
      }
    }

    if (!ValidateInst(inst, error)) return false;
    program.insts.push_back(std::move(inst));
  }
  *out = std::move(program);
  return true;
}

bool CompileLlirText(const std::string& text, Tally::Byte::Image* out, IrError* error) {
  IrProgram program;
  if (!ParseLlirText(text, &program, error)) return false;
  return CompileToImage(program, out, error);
}

} // namespace Tally::IR::Text
