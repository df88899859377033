#ifndef LLVM_RS_API_EXCEPTION_H
#define LLVM_RS_API_EXCEPTION_H

#include <stdexcept>
#include <string>

namespace llvm::rs {

/**
 * Exception indicating a broken contract with an LLVM string: a null pointer,
 * invalid UTF-8, or use of a moved-from owner. Never a transient condition.
 *
 * what() carries the "[LLVM::RS] Error: " prefix; detail() is the message
 * without it.
 */
class LLVMError : public std::runtime_error {
 public:
  explicit LLVMError(const std::string& detail)
      : std::runtime_error(prefix + detail)
      , detail_(detail) {
  }

  const std::string& detail() const noexcept {
    return detail_;
  }

 private:
  static constexpr const char* prefix = "[LLVM::RS] Error: ";

  std::string detail_;
};

}  // namespace llvm::rs

#endif  // LLVM_RS_API_EXCEPTION_H
