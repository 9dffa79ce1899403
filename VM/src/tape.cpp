#include "tape.h"

#include <algorithm>

namespace Tally::VM {

FixedTape::FixedTape(size_t capacity) : words_(capacity, 0) {}

bool FixedTape::Read(uint64_t address, int64_t* out) const {
  if (address >= words_.size()) return false;
  *out = words_[static_cast<size_t>(address)];
  return true;
}

bool FixedTape::Write(uint64_t address, int64_t value) {
  if (address >= words_.size()) return false;
  words_[static_cast<size_t>(address)] = value;
  return true;
}

void FixedTape::Clear() {
  std::fill(words_.begin(), words_.end(), 0);
}

GrowableTape::GrowableTape(size_t limit) : limit_(limit) {}

bool GrowableTape::Read(uint64_t address, int64_t* out) const {
  if (address >= limit_) return false;
  if (address >= words_.size()) {
    *out = 0;
    return true;
  }
  *out = words_[static_cast<size_t>(address)];
  return true;
}

bool GrowableTape::Write(uint64_t address, int64_t value) {
  if (address >= limit_) return false;
  size_t index = static_cast<size_t>(address);
  if (index >= words_.size()) {
    if (value == 0) return true;
    words_.resize(index + 1, 0);
  }
  words_[index] = value;
  return true;
}

void GrowableTape::Clear() {
  words_.clear();
}

SparseTape::SparseTape(size_t limit) : limit_(limit) {}

bool SparseTape::Read(uint64_t address, int64_t* out) const {
  if (address >= limit_) return false;
  auto it = words_.find(address);
  *out = it == words_.end() ? 0 : it->second;
  return true;
}

bool SparseTape::Write(uint64_t address, int64_t value) {
  if (address >= limit_) return false;
  if (value == 0) {
    words_.erase(address);
    return true;
  }
  words_[address] = value;
  return true;
}

void SparseTape::Clear() {
  words_.clear();
}

std::unique_ptr<Tape> MakeTape(TapeKind kind, size_t capacity) {
  switch (kind) {
    case TapeKind::Fixed:
      return std::make_unique<FixedTape>(capacity);
    case TapeKind::Growable:
      return std::make_unique<GrowableTape>(capacity);
    case TapeKind::Sparse:
      return std::make_unique<SparseTape>(capacity);
  }
  return nullptr;
}

const char* TapeKindName(TapeKind kind) {
  switch (kind) {
    case TapeKind::Fixed: return "fixed";
    case TapeKind::Growable: return "growable";
    case TapeKind::Sparse: return "sparse";
  }
  return "unknown";
}

} // namespace Tally::VM
