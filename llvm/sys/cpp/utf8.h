#ifndef LLVM_RS_API_UTF8_H
#define LLVM_RS_API_UTF8_H

#include <cstddef>
#include <string_view>

namespace llvm::rs {

// Strict UTF-8 validation through LLVMSupport. Overlong encodings, surrogates
// and code points above U+10FFFF are rejected. On failure bad_offset is the
// byte offset of the first invalid sequence.
bool validate_utf8(std::string_view bytes, std::size_t& bad_offset);

}  // namespace llvm::rs

#endif  // LLVM_RS_API_UTF8_H
