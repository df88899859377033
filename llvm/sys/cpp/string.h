#ifndef LLVM_RS_API_STRING_H
#define LLVM_RS_API_STRING_H

#include <cstddef>
#include <filesystem>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>

#include <llvm-c/Core.h>

#include "exception.h"

namespace llvm::rs {

/**
 * Borrowed view of a null-terminated string whose memory is owned elsewhere,
 * usually by LLVM or by an llvm::rs::String.
 *
 * A Str is a single pointer. It carries no length; every decode scans for the
 * terminator again. The backing buffer must stay valid and unmodified for as
 * long as the view is used.
 */
class Str {
 public:
  /**
   * View over a C string that must originate from LLVM (or otherwise outlive
   * the view). The pointer must be null-terminated. A null pointer throws
   * LLVMError; any other invalid pointer is undefined behavior.
   */
  static constexpr Str from_ptr(const char* str) {
    if (str == nullptr) {
      throw LLVMError("Null pointer passed as LLVM string");
    }
    return Str(str);
  }

  /** View over the buffer of `str`. Valid while `str` is alive and unchanged. */
  static Str from_string(const std::string& str);
  static Str from_string(std::string&&) = delete;

  /** View over a string literal. Use LLVM_STR rather than calling this. */
  template <std::size_t N>
  static constexpr Str from_literal(const char (&literal)[N]) noexcept {
    return Str(literal);
  }

  constexpr const char* as_ptr() const noexcept {
    return str_;
  }

  constexpr Str as_ref() const noexcept {
    return *this;
  }

  /**
   * Text up to the terminator. This performs a length calculation and a UTF-8
   * check on every call; invalid UTF-8 throws LLVMError.
   */
  std::string_view as_str() const;

  std::size_t len() const;
  bool is_empty() const;

  std::string to_string() const;
  std::filesystem::path as_path() const;

  operator std::string_view() const {
    return as_str();
  }

 private:
  constexpr explicit Str(const char* str) noexcept
      : str_(str) {
  }

  const char* str_;
};

static_assert(sizeof(Str) == sizeof(const char*));

bool operator==(Str lhs, Str rhs);
bool operator!=(Str lhs, Str rhs);
bool operator==(Str lhs, std::string_view rhs);
bool operator!=(Str lhs, std::string_view rhs);
bool operator==(std::string_view lhs, Str rhs);
bool operator!=(std::string_view lhs, Str rhs);

std::ostream& operator<<(std::ostream& os, Str str);

/**
 * Owned string received from LLVM.
 *
 * Parts of the LLVM C API return strings that the caller has to hand back to
 * LLVMDisposeMessage. String takes that responsibility: the release function
 * runs exactly once, when the wrapper is destroyed. String is move-only.
 *
 * Views borrowed from a String point into its buffer, so they can only be
 * taken from an lvalue; borrowing from a temporary does not compile.
 */
class String {
 public:
  using Release = void (*)(char*);

  /**
   * Takes ownership of `str`, which must have been allocated by an LLVM
   * function documented to require `release`. A null pointer throws LLVMError
   * and nothing is released.
   */
  explicit String(char* str, Release release = LLVMDisposeMessage);

  String(String&& other) noexcept = default;
  String& operator=(String&& other) noexcept = default;

  String(const String&) = delete;
  String& operator=(const String&) = delete;

  Str view() const&;
  Str view() const&& = delete;

  operator Str() const& {
    return view();
  }
  operator Str() const&& = delete;

  const char* as_ptr() const&;
  const char* as_ptr() const&& = delete;

  std::string_view as_str() const&;
  std::string_view as_str() const&& = delete;

  operator std::string_view() const& {
    return as_str();
  }
  operator std::string_view() const&& = delete;

  // These copy, so they are fine on temporaries too.
  std::size_t len() const;
  bool is_empty() const;
  std::string to_string() const;
  std::filesystem::path as_path() const;

 private:
  struct Releaser {
    Release release;

    void operator()(char* str) const;
  };

  std::unique_ptr<char, Releaser> str_;
};

std::ostream& operator<<(std::ostream& os, const String& str);

}  // namespace llvm::rs

/**
 * Turns a string literal into a `llvm::rs::Str` over static storage. The view
 * never needs releasing and can be used in constant expressions.
 *
 * Passing no argument creates an empty string, equivalent to `LLVM_STR("")`.
 *
 *     constexpr llvm::rs::Str name = LLVM_STR("my module");
 */
#define LLVM_STR(...) (::llvm::rs::Str::from_literal("" __VA_ARGS__))

#endif  // LLVM_RS_API_STRING_H
