#ifndef TALLY_VM_TAPE_H
#define TALLY_VM_TAPE_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <unordered_map>
#include <vector>

namespace Tally::VM {

enum class TapeKind : uint8_t {
  Fixed,
  Growable,
  Sparse,
};

constexpr size_t kDefaultTapeLimit = static_cast<size_t>(1) << 24;

// Word storage for a Machine. Unwritten addresses read as 0; Read/Write return
// false when the address is outside what the backend can hold.
class Tape {
 public:
  virtual ~Tape() = default;

  virtual bool Read(uint64_t address, int64_t* out) const = 0;
  virtual bool Write(uint64_t address, int64_t value) = 0;
  virtual void Clear() = 0;
  virtual size_t Capacity() const = 0;
};

class FixedTape : public Tape {
 public:
  explicit FixedTape(size_t capacity);

  bool Read(uint64_t address, int64_t* out) const override;
  bool Write(uint64_t address, int64_t value) override;
  void Clear() override;
  size_t Capacity() const override { return words_.size(); }

 private:
  std::vector<int64_t> words_;
};

class GrowableTape : public Tape {
 public:
  explicit GrowableTape(size_t limit = kDefaultTapeLimit);

  bool Read(uint64_t address, int64_t* out) const override;
  bool Write(uint64_t address, int64_t value) override;
  void Clear() override;
  size_t Capacity() const override { return limit_; }
  size_t Used() const { return words_.size(); }

 private:
  std::vector<int64_t> words_;
  size_t limit_;
};

class SparseTape : public Tape {
 public:
  explicit SparseTape(size_t limit = kDefaultTapeLimit);

  bool Read(uint64_t address, int64_t* out) const override;
  bool Write(uint64_t address, int64_t value) override;
  void Clear() override;
  size_t Capacity() const override { return limit_; }
  size_t Used() const { return words_.size(); }

 private:
  std::unordered_map<uint64_t, int64_t> words_;
  size_t limit_;
};

std::unique_ptr<Tape> MakeTape(TapeKind kind, size_t capacity);
const char* TapeKindName(TapeKind kind);

} // namespace Tally::VM

#endif // TALLY_VM_TAPE_H
