#include <string>

#include <llvm-c/Core.h>
#include <llvm-c/TargetMachine.h>
#include <spdlog/spdlog.h>

#include "exception.h"
#include "message.h"

namespace llvm::rs {

static String take_message(char* msg, const char* entry_point) {
  if (msg == nullptr) {
    SPDLOG_ERROR("{} returned a null string", entry_point);
    throw LLVMError(std::string(entry_point) + " returned a null string");
  }

  return String(msg, LLVMDisposeMessage);
}

String create_message(Str message) {
  return take_message(
      LLVMCreateMessage(message.as_ptr()), "LLVMCreateMessage");
}

String default_target_triple() {
  return take_message(
      LLVMGetDefaultTargetTriple(), "LLVMGetDefaultTargetTriple");
}

String normalize_target_triple(Str triple) {
  return take_message(
      LLVMNormalizeTargetTriple(triple.as_ptr()), "LLVMNormalizeTargetTriple");
}

String host_cpu_name() {
  return take_message(LLVMGetHostCPUName(), "LLVMGetHostCPUName");
}

String host_cpu_features() {
  return take_message(LLVMGetHostCPUFeatures(), "LLVMGetHostCPUFeatures");
}

}  // namespace llvm::rs
