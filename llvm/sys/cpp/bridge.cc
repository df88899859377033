#include <string_view>
#include <utility>

#include "bridge.h"

namespace llvm::rs {

rust::Str to_rust_str(Str str) {
  std::string_view text = str.as_str();
  return rust::Str(text.data(), text.size());
}

rust::String to_rust_string(Str str) {
  std::string_view text = str.as_str();
  return rust::String(text.data(), text.size());
}

rust::String take_rust_string(String str) {
  String owned(std::move(str));
  return to_rust_string(owned.view());
}

}  // namespace llvm::rs
