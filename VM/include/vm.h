#ifndef TALLY_VM_H
#define TALLY_VM_H

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "image.h"
#include "opcode.h"
#include "tally_api.h"
#include "tape.h"

namespace Tally::VM {

using Tally::Byte::Image;

enum class ExecStatus {
  Ok,
  Halted,
  InputRequired,
  Output,
  InvalidOpcode,
  InvalidAddressingMode,
  MemoryFault,
};

struct ExecResult {
  ExecStatus status = ExecStatus::Ok;
  // Halted: tape[0]. Output: the emitted word. InvalidOpcode: the raw instruction word.
  int64_t value = 0;
  std::string error;
  std::vector<int64_t> outputs;
};

using OutputSink = std::function<void(int64_t)>;

struct ExecOptions {
  TapeKind tape_kind = TapeKind::Growable;
  size_t tape_capacity = kDefaultTapeLimit;
  std::vector<int64_t> inputs;
  OutputSink on_output;
};

TALLYVM_API const char* ExecStatusName(ExecStatus status);
TALLYVM_API bool IsFault(ExecStatus status);

class TALLYVM_API Machine {
 public:
  explicit Machine(Image image);
  Machine(Image image, std::unique_ptr<Tape> tape);

  Machine(const Machine&) = delete;
  Machine& operator=(const Machine&) = delete;

  // Restores the initial image, zeroes position and relative base, drops queued input.
  bool Reset(std::string* error);

  ExecResult Tick();
  ExecResult Run(const OutputSink& on_output);
  ExecResult Run(std::vector<int64_t>* outputs);

  void PushInput(int64_t value);
  void PushInputs(const std::vector<int64_t>& values);

  bool Peek(uint64_t address, int64_t* out) const;
  bool Poke(uint64_t address, int64_t value);

  uint64_t position() const { return position_; }
  int64_t relative_base() const { return relative_base_; }
  size_t pending_input() const { return input_.size(); }
  uint64_t ticks() const { return ticks_; }
  const Image& initial_image() const { return snapshot_; }
  const Tape& tape() const { return *tape_; }

 private:
  bool ResolveAddress(int64_t word, uint8_t mode, uint64_t* address, ExecResult* fault);
  bool LoadOperand(int offset, uint8_t mode, int64_t* out, ExecResult* fault);
  bool StoreOperand(int offset, uint8_t mode, int64_t value, ExecResult* fault);
  bool ReadWord(uint64_t address, int64_t* out, ExecResult* fault);
  ExecResult Fault(ExecStatus status, int64_t value, const std::string& message) const;

  Image snapshot_;
  std::unique_ptr<Tape> tape_;
  std::deque<int64_t> input_;
  uint64_t position_ = 0;
  int64_t relative_base_ = 0;
  uint64_t ticks_ = 0;
  uint8_t current_opcode_ = 0;
  bool loaded_ = false;
  std::string load_error_;
};

// Builds a Machine for the image, queues options.inputs, and runs it to the first non-output stop.
TALLYVM_API ExecResult ExecuteImage(const Image& image);
TALLYVM_API ExecResult ExecuteImage(const Image& image, const ExecOptions& options);

} // namespace Tally::VM

#endif // TALLY_VM_H
