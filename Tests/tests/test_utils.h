#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "image.h"
#include "ir_program.h"
#include "vm.h"

namespace Tally::VM::Tests {

struct TestCase {
  const char* name;
  bool (*fn)();
};

struct TestSection {
  const char* name;
  const TestCase* tests;
  size_t count;
};

struct TestResult {
  size_t total = 0;
  size_t failed = 0;
};

Tally::Byte::Image CompileText(const std::string& text, const char* name);
bool CompileTextExpectError(const std::string& text, Tally::IR::IrErrorKind kind, const char* name);

bool ExpectImageEqual(const Tally::Byte::Image& got,
                      const Tally::Byte::Image& expected,
                      const char* name);
bool ExpectOutputs(const std::vector<int64_t>& got,
                   const std::vector<int64_t>& expected,
                   const char* name);
bool ExpectStatus(const ExecResult& result, ExecStatus expected, const char* name);

bool RunExpectOutputs(const Tally::Byte::Image& image,
                      const std::vector<int64_t>& inputs,
                      const std::vector<int64_t>& expected,
                      const char* name);
bool RunExpectFault(const Tally::Byte::Image& image, ExecStatus expected, const char* name);

TestResult RunSection(const TestSection& section);
TestResult RunAllSections(const TestSection* sections, size_t count);

} // namespace Tally::VM::Tests
