#include "vm.h"

#include <sstream>

namespace Tally::VM {
namespace {

using Tally::Byte::AddrMode;
using Tally::Byte::DecodedOp;
using Tally::Byte::OpCode;
using Tally::Byte::OpCodeName;
using Tally::Byte::OpInfo;

inline int64_t WrapAdd(int64_t a, int64_t b) {
  return static_cast<int64_t>(static_cast<uint64_t>(a) + static_cast<uint64_t>(b));
}

inline int64_t WrapMul(int64_t a, int64_t b) {
  return static_cast<int64_t>(static_cast<uint64_t>(a) * static_cast<uint64_t>(b));
}

ExecResult Continue() {
  return ExecResult{};
}

} // namespace

const char* ExecStatusName(ExecStatus status) {
  switch (status) {
    case ExecStatus::Ok: return "ok";
    case ExecStatus::Halted: return "halted";
    case ExecStatus::InputRequired: return "input required";
    case ExecStatus::Output: return "output";
    case ExecStatus::InvalidOpcode: return "invalid opcode";
    case ExecStatus::InvalidAddressingMode: return "invalid addressing mode";
    case ExecStatus::MemoryFault: return "memory fault";
  }
  return "unknown";
}

bool IsFault(ExecStatus status) {
  return status == ExecStatus::InvalidOpcode || status == ExecStatus::InvalidAddressingMode ||
         status == ExecStatus::MemoryFault;
}

Machine::Machine(Image image) : Machine(std::move(image), std::make_unique<GrowableTape>()) {}

Machine::Machine(Image image, std::unique_ptr<Tape> tape)
    : snapshot_(std::move(image)), tape_(std::move(tape)) {
  Reset(&load_error_);
}

bool Machine::Reset(std::string* error) {
  position_ = 0;
  relative_base_ = 0;
  ticks_ = 0;
  current_opcode_ = 0;
  input_.clear();
  loaded_ = false;
  if (!tape_) {
    load_error_ = "machine has no tape";
    if (error) *error = load_error_;
    return false;
  }
  tape_->Clear();
  for (size_t i = 0; i < snapshot_.size(); ++i) {
    if (!tape_->Write(static_cast<uint64_t>(i), snapshot_[i])) {
      std::ostringstream out;
      out << "image of " << snapshot_.size() << " words does not fit tape capacity "
          << tape_->Capacity();
      load_error_ = out.str();
      if (error) *error = load_error_;
      return false;
    }
  }
  load_error_.clear();
  loaded_ = true;
  return true;
}

void Machine::PushInput(int64_t value) {
  input_.push_back(value);
}

void Machine::PushInputs(const std::vector<int64_t>& values) {
  input_.insert(input_.end(), values.begin(), values.end());
}

bool Machine::Peek(uint64_t address, int64_t* out) const {
  if (!out || !tape_) return false;
  return tape_->Read(address, out);
}

bool Machine::Poke(uint64_t address, int64_t value) {
  if (!tape_) return false;
  return tape_->Write(address, value);
}

ExecResult Machine::Fault(ExecStatus status, int64_t value, const std::string& message) const {
  ExecResult result;
  result.status = status;
  result.value = value;
  std::ostringstream out;
  out << message << " (pc " << position_;
  if (current_opcode_ != 0) {
    out << " op " << OpCodeName(current_opcode_);
  }
  out << " rb " << relative_base_ << ")";
  result.error = out.str();
  return result;
}

bool Machine::ReadWord(uint64_t address, int64_t* out, ExecResult* fault) {
  if (tape_->Read(address, out)) return true;
  std::ostringstream msg;
  msg << "read outside tape at " << address;
  *fault = Fault(ExecStatus::MemoryFault, static_cast<int64_t>(address), msg.str());
  return false;
}

bool Machine::ResolveAddress(int64_t word, uint8_t mode, uint64_t* address, ExecResult* fault) {
  int64_t effective = word;
  if (static_cast<AddrMode>(mode) == AddrMode::Relative) {
    effective = WrapAdd(relative_base_, word);
  }
  if (effective < 0) {
    std::ostringstream msg;
    msg << "negative address " << effective;
    *fault = Fault(ExecStatus::MemoryFault, effective, msg.str());
    return false;
  }
  *address = static_cast<uint64_t>(effective);
  return true;
}

bool Machine::LoadOperand(int offset, uint8_t mode, int64_t* out, ExecResult* fault) {
  int64_t word = 0;
  if (!ReadWord(position_ + 1 + static_cast<uint64_t>(offset), &word, fault)) return false;
  if (static_cast<AddrMode>(mode) == AddrMode::Immediate) {
    *out = word;
    return true;
  }
  uint64_t address = 0;
  if (!ResolveAddress(word, mode, &address, fault)) return false;
  return ReadWord(address, out, fault);
}

bool Machine::StoreOperand(int offset, uint8_t mode, int64_t value, ExecResult* fault) {
  if (static_cast<AddrMode>(mode) == AddrMode::Immediate) {
    *fault = Fault(ExecStatus::InvalidAddressingMode, mode, "store through immediate operand");
    return false;
  }
  int64_t word = 0;
  if (!ReadWord(position_ + 1 + static_cast<uint64_t>(offset), &word, fault)) return false;
  uint64_t address = 0;
  if (!ResolveAddress(word, mode, &address, fault)) return false;
  if (tape_->Write(address, value)) return true;
  std::ostringstream msg;
  msg << "write outside tape at " << address;
  *fault = Fault(ExecStatus::MemoryFault, static_cast<int64_t>(address), msg.str());
  return false;
}

ExecResult Machine::Tick() {
  current_opcode_ = 0;
  if (!loaded_) return Fault(ExecStatus::MemoryFault, 0, load_error_);

  ExecResult fault;
  int64_t word = 0;
  if (!ReadWord(position_, &word, &fault)) return fault;

  DecodedOp decoded;
  OpInfo info{};
  if (!Tally::Byte::DecodeOpWord(word, &decoded) || !Tally::Byte::GetOpInfo(decoded.opcode, &info)) {
    std::ostringstream msg;
    msg << "invalid opcode word " << word;
    return Fault(ExecStatus::InvalidOpcode, word, msg.str());
  }
  current_opcode_ = decoded.opcode;
  for (int i = 0; i < info.operand_count; ++i) {
    if (!Tally::Byte::IsValidAddrMode(decoded.modes[i])) {
      std::ostringstream msg;
      msg << "unknown addressing mode " << static_cast<int>(decoded.modes[i]) << " for operand " << i;
      return Fault(ExecStatus::InvalidAddressingMode, decoded.modes[i], msg.str());
    }
  }
  if (info.write_slot >= 0 &&
      static_cast<AddrMode>(decoded.modes[info.write_slot]) == AddrMode::Immediate) {
    return Fault(ExecStatus::InvalidAddressingMode, decoded.modes[info.write_slot],
                 "store through immediate operand");
  }

  const uint64_t next = position_ + 1 + static_cast<uint64_t>(info.operand_count);
  const uint8_t* modes = decoded.modes;
  switch (static_cast<OpCode>(decoded.opcode)) {
    case OpCode::Add:
    case OpCode::Mul:
    case OpCode::Less:
    case OpCode::Equals: {
      int64_t a = 0;
      int64_t b = 0;
      if (!LoadOperand(0, modes[0], &a, &fault)) return fault;
      if (!LoadOperand(1, modes[1], &b, &fault)) return fault;
      int64_t value = 0;
      switch (static_cast<OpCode>(decoded.opcode)) {
        case OpCode::Add:
          value = WrapAdd(a, b);
          break;
        case OpCode::Mul:
          value = WrapMul(a, b);
          break;
        case OpCode::Less:
          value = a < b ? 1 : 0;
          break;
        default:
          value = a == b ? 1 : 0;
          break;
      }
      if (!StoreOperand(2, modes[2], value, &fault)) return fault;
      position_ = next;
      break;
    }
    case OpCode::In: {
      if (input_.empty()) {
        ExecResult result;
        result.status = ExecStatus::InputRequired;
        return result;
      }
      if (!StoreOperand(0, modes[0], input_.front(), &fault)) return fault;
      input_.pop_front();
      position_ = next;
      break;
    }
    case OpCode::Out: {
      int64_t value = 0;
      if (!LoadOperand(0, modes[0], &value, &fault)) return fault;
      position_ = next;
      ticks_++;
      ExecResult result;
      result.status = ExecStatus::Output;
      result.value = value;
      return result;
    }
    case OpCode::JumpIfTrue:
    case OpCode::JumpIfFalse: {
      int64_t cond = 0;
      int64_t target = 0;
      if (!LoadOperand(0, modes[0], &cond, &fault)) return fault;
      if (!LoadOperand(1, modes[1], &target, &fault)) return fault;
      bool taken = static_cast<OpCode>(decoded.opcode) == OpCode::JumpIfTrue ? cond != 0 : cond == 0;
      if (!taken) {
        position_ = next;
        break;
      }
      if (target < 0) {
        std::ostringstream msg;
        msg << "jump to negative address " << target;
        return Fault(ExecStatus::MemoryFault, target, msg.str());
      }
      position_ = static_cast<uint64_t>(target);
      break;
    }
    case OpCode::AdjustBase: {
      int64_t delta = 0;
      if (!LoadOperand(0, modes[0], &delta, &fault)) return fault;
      relative_base_ = WrapAdd(relative_base_, delta);
      position_ = next;
      break;
    }
    case OpCode::Halt: {
      ExecResult result;
      result.status = ExecStatus::Halted;
      if (!tape_->Read(0, &result.value)) result.value = 0;
      return result;
    }
  }
  ticks_++;
  return Continue();
}

ExecResult Machine::Run(const OutputSink& on_output) {
  for (;;) {
    ExecResult result = Tick();
    if (result.status == ExecStatus::Ok) continue;
    if (result.status == ExecStatus::Output) {
      if (on_output) on_output(result.value);
      continue;
    }
    return result;
  }
}

ExecResult Machine::Run(std::vector<int64_t>* outputs) {
  return Run([outputs](int64_t value) {
    if (outputs) outputs->push_back(value);
  });
}

ExecResult ExecuteImage(const Image& image) {
  return ExecuteImage(image, ExecOptions{});
}

ExecResult ExecuteImage(const Image& image, const ExecOptions& options) {
  std::unique_ptr<Tape> tape = MakeTape(options.tape_kind, options.tape_capacity);
  Machine machine(image, std::move(tape));
  std::string error;
  if (!machine.Reset(&error)) {
    ExecResult result;
    result.status = ExecStatus::MemoryFault;
    result.error = error;
    return result;
  }
  machine.PushInputs(options.inputs);
  std::vector<int64_t> outputs;
  ExecResult result = machine.Run([&](int64_t value) {
    outputs.push_back(value);
    if (options.on_output) options.on_output(value);
  });
  result.outputs = std::move(outputs);
  return result;
}

} // namespace Tally::VM
