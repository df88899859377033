#include <llvm/Support/ConvertUTF.h>

#include "utf8.h"

namespace llvm::rs {

bool validate_utf8(std::string_view bytes, std::size_t& bad_offset) {
  const auto* begin = reinterpret_cast<const llvm::UTF8*>(bytes.data());
  const auto* end = begin + bytes.size();

  // Stops on the first byte of the offending sequence.
  const llvm::UTF8* cursor = begin;
  if (!llvm::isLegalUTF8String(&cursor, end)) {
    bad_offset = static_cast<std::size_t>(cursor - begin);
    return false;
  }

  return true;
}

}  // namespace llvm::rs
