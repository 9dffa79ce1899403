#include "image.h"

#include <cctype>
#include <limits>
#include <sstream>

namespace Tally::Byte {
namespace {

LoadResult LoadFail(const std::string& message) {
  LoadResult result;
  result.ok = false;
  result.error = message;
  return result;
}

} // namespace

bool ParseDecimalWord(const std::string& text, int64_t* out) {
  if (text.empty()) return false;
  size_t i = 0;
  bool negative = false;
  if (text[0] == '-') {
    negative = true;
    i = 1;
  }
  if (i >= text.size()) return false;
  uint64_t magnitude = 0;
  const uint64_t limit = negative
                             ? static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + 1u
                             : static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
  for (; i < text.size(); ++i) {
    unsigned char ch = static_cast<unsigned char>(text[i]);
    if (!std::isdigit(ch)) return false;
    uint64_t digit = static_cast<uint64_t>(ch - '0');
    if (magnitude > (limit - digit) / 10u) return false;
    magnitude = magnitude * 10u + digit;
  }
  if (negative) {
    *out = static_cast<int64_t>(0u - magnitude);
  } else {
    *out = static_cast<int64_t>(magnitude);
  }
  return true;
}

LoadResult LoadImageFromText(const std::string& text) {
  LoadResult result;
  size_t start = 0;
  size_t end = text.size();
  while (start < end && std::isspace(static_cast<unsigned char>(text[start]))) start++;
  while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) end--;
  if (start < end && text[start] == '[') {
    if (text[end - 1] != ']') return LoadFail("image missing closing ']'");
    start++;
    end--;
  }

  std::string token;
  size_t word_index = 0;
  bool expect_word = false;
  auto flush = [&](size_t at) -> bool {
    if (token.empty()) return true;
    int64_t value = 0;
    if (!ParseDecimalWord(token, &value)) {
      std::ostringstream out;
      out << "invalid word '" << token << "' at offset " << at;
      result.error = out.str();
      return false;
    }
    result.image.push_back(value);
    token.clear();
    word_index++;
    expect_word = false;
    return true;
  };

  for (size_t i = start; i < end; ++i) {
    char ch = text[i];
    if (ch == ',') {
      if (token.empty() && (expect_word || word_index == 0)) {
        return LoadFail("empty word in image");
      }
      if (!flush(i)) return LoadFail(result.error);
      expect_word = true;
      continue;
    }
    if (std::isspace(static_cast<unsigned char>(ch))) {
      if (!flush(i)) return LoadFail(result.error);
      continue;
    }
    token.push_back(ch);
  }
  if (!flush(end)) return LoadFail(result.error);
  if (expect_word) return LoadFail("trailing ',' in image");
  result.ok = true;
  return result;
}

std::string FormatImage(const Image& image) {
  std::ostringstream out;
  for (size_t i = 0; i < image.size(); ++i) {
    if (i != 0) out << ",";
    out << image[i];
  }
  return out.str();
}

} // namespace Tally::Byte
