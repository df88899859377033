#ifndef LLVM_RS_API_BRIDGE_H
#define LLVM_RS_API_BRIDGE_H

#include <rust/cxx.h>

#include "string.h"

namespace llvm::rs {

// Borrows the bytes of `str`. The result is only valid as long as `str` is.
rust::Str to_rust_str(Str str);

rust::String to_rust_string(Str str);

// Copies the text out and releases the LLVM buffer before returning.
rust::String take_rust_string(String str);

}  // namespace llvm::rs

#endif  // LLVM_RS_API_BRIDGE_H
