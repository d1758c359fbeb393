#include <cassert>
#include <iostream>
#include <string>

#include "infrastructure/Sha256Hasher.hpp"

using fileextractor::infrastructure::Sha256Hasher;

int main() {
    std::cout << "[Test] Starting Sha256Hasher Test..." << std::endl;

    Sha256Hasher hasher;
    std::string hex;
    assert(hasher.finalHex(hex));
    assert(hex == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    std::cout << "[PASS] Empty input digest." << std::endl;

    assert(!hasher.update("abc", 3));
    assert(hasher.reset());
    assert(hasher.update("a", 1));
    assert(hasher.update("", 0));
    assert(hasher.update("bc", 2));
    assert(hasher.finalHex(hex));
    assert(hex == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    assert(!hasher.finalHex(hex));
    std::cout << "[PASS] Chunked input matches the one-shot digest." << std::endl;

    std::cout << "[Test] All Sha256Hasher tests passed." << std::endl;
    return 0;
}
