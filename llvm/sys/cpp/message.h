#ifndef LLVM_RS_API_MESSAGE_H
#define LLVM_RS_API_MESSAGE_H

#include "string.h"

namespace llvm::rs {

// Each of these returns a string allocated by LLVM that is released with
// LLVMDisposeMessage.

String create_message(Str message);

String default_target_triple();
String normalize_target_triple(Str triple);

String host_cpu_name();
String host_cpu_features();

}  // namespace llvm::rs

#endif  // LLVM_RS_API_MESSAGE_H
