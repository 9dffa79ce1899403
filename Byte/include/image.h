#ifndef TALLY_BYTE_IMAGE_H
#define TALLY_BYTE_IMAGE_H

#include <cstdint>
#include <string>
#include <vector>

#include "tally_api.h"

namespace Tally::Byte {

using Image = std::vector<int64_t>;

struct LoadResult {
  bool ok = false;
  std::string error;
  Image image;
};

// Optional leading '-' then decimal digits; false on overflow or stray characters.
TALLYVM_API bool ParseDecimalWord(const std::string& text, int64_t* out);

// Accepts decimal words separated by commas and/or whitespace, optionally wrapped in [ ].
TALLYVM_API LoadResult LoadImageFromText(const std::string& text);
TALLYVM_API std::string FormatImage(const Image& image);

TALLYVM_API std::string DisassembleImage(const Image& image);

} // namespace Tally::Byte

#endif // TALLY_BYTE_IMAGE_H
