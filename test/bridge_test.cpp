// Test suite for the cxx bridge conversions

#include "llvm/sys/cpp/bridge.h"

#include <cassert>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/cfg/env.h>

using namespace llvm::rs;

static std::vector<char*> released;

static void counting_release(char* str) {
    released.push_back(str);
    std::free(str);
}

void test_to_rust_str() {
    std::cout << "Testing to_rust_str..." << std::endl;

    Str view = LLVM_STR("my module");
    rust::Str borrowed = to_rust_str(view);

    // Same bytes, no copy
    assert(borrowed.data() == view.as_ptr());
    assert(borrowed.size() == 9);
    assert(std::string(borrowed) == "my module");

    rust::Str empty = to_rust_str(LLVM_STR());
    assert(empty.size() == 0);

    std::cout << "✓ to_rust_str tests passed" << std::endl;
}

void test_to_rust_string() {
    std::cout << "Testing to_rust_string..." << std::endl;

    const char buf[] = "x86_64-unknown-linux-gnu";
    rust::String copy = to_rust_string(Str::from_ptr(buf));

    assert(copy.data() != buf);
    assert(std::string(copy) == buf);

    std::cout << "✓ to_rust_string tests passed" << std::endl;
}

void test_take_rust_string() {
    std::cout << "Testing take_rust_string..." << std::endl;

    released.clear();
    char* raw = static_cast<char*>(std::malloc(6));
    std::memcpy(raw, "owned", 6);

    String owned(raw, counting_release);
    rust::String copy = take_rust_string(std::move(owned));

    assert(released.size() == 1);
    assert(released[0] == raw);
    assert(std::string(copy) == "owned");

    std::cout << "✓ take_rust_string tests passed" << std::endl;
}

void test_invalid_utf8_rejected() {
    std::cout << "Testing bridge UTF-8 checks..." << std::endl;

    bool thrown = false;
    try {
        (void)to_rust_str(Str::from_ptr("\xC3\x28"));
    } catch (const LLVMError&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "✓ Bridge UTF-8 tests passed" << std::endl;
}

int main() {
    spdlog::cfg::load_env_levels();

    std::cout << "=== Running llvm::rs bridge tests ===" << std::endl;

    test_to_rust_str();
    test_to_rust_string();
    test_take_rust_string();
    test_invalid_utf8_rejected();

    std::cout << "\n=== All bridge tests passed ===" << std::endl;
    return 0;
}
