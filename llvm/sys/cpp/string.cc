#include <cstring>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "exception.h"
#include "string.h"
#include "utf8.h"

namespace llvm::rs {

Str Str::from_string(const std::string& str) {
  return Str(str.c_str());
}

std::string_view Str::as_str() const {
  std::string_view bytes(str_, std::strlen(str_));

  std::size_t bad_offset = 0;
  if (!validate_utf8(bytes, bad_offset)) {
    SPDLOG_ERROR(
        "LLVM string at {} contained invalid UTF-8 at byte {} of {}",
        static_cast<const void*>(str_),
        bad_offset,
        bytes.size());
    throw LLVMError(
        "LLVM string contained invalid UTF-8 at byte " +
        std::to_string(bad_offset));
  }

  return bytes;
}

std::size_t Str::len() const {
  return std::strlen(str_);
}

bool Str::is_empty() const {
  return str_[0] == '\0';
}

std::string Str::to_string() const {
  return std::string(as_str());
}

std::filesystem::path Str::as_path() const {
  return std::filesystem::path(as_str());
}

bool operator==(Str lhs, Str rhs) {
  return lhs.as_str() == rhs.as_str();
}

bool operator!=(Str lhs, Str rhs) {
  return !(lhs == rhs);
}

bool operator==(Str lhs, std::string_view rhs) {
  return lhs.as_str() == rhs;
}

bool operator!=(Str lhs, std::string_view rhs) {
  return !(lhs == rhs);
}

bool operator==(std::string_view lhs, Str rhs) {
  return rhs == lhs;
}

bool operator!=(std::string_view lhs, Str rhs) {
  return !(rhs == lhs);
}

std::ostream& operator<<(std::ostream& os, Str str) {
  return os << str.as_str();
}

void String::Releaser::operator()(char* str) const {
  SPDLOG_TRACE("Releasing LLVM string at {}", static_cast<const void*>(str));
  release(str);
}

String::String(char* str, Release release)
    : str_(nullptr, Releaser{release}) {
  if (str == nullptr) {
    throw LLVMError("Null pointer passed as owned LLVM string");
  }
  if (release == nullptr) {
    throw LLVMError("Owned LLVM string has no release function");
  }

  str_.reset(str);
}

Str String::view() const& {
  if (!str_) {
    throw LLVMError("Use of moved-from LLVM string");
  }
  return Str::from_ptr(str_.get());
}

const char* String::as_ptr() const& {
  return view().as_ptr();
}

std::string_view String::as_str() const& {
  return view().as_str();
}

std::size_t String::len() const {
  return view().len();
}

bool String::is_empty() const {
  return view().is_empty();
}

std::string String::to_string() const {
  return view().to_string();
}

std::filesystem::path String::as_path() const {
  return view().as_path();
}

std::ostream& operator<<(std::ostream& os, const String& str) {
  return os << str.view();
}

}  // namespace llvm::rs
