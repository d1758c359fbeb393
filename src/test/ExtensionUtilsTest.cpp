#include <cassert>
#include <iostream>

#include "domain/ExtensionUtils.hpp"
#include "domain/ExtractionRequest.hpp"

using namespace fileextractor::domain;

int main() {
    std::cout << "[Test] Starting ExtensionUtils Test..." << std::endl;

    auto tokens = NormaliseExtensionTokens({" TXT", "*.Md", ".py", "txt", "", "   ", "*.*", "*"});
    assert(tokens.size() == 4);
    assert(tokens[0] == ".txt");
    assert(tokens[1] == ".md");
    assert(tokens[2] == ".py");
    assert(tokens[3] == kWildcardExtension);
    std::cout << "[PASS] Tokens are trimmed, lower-cased, dotted and de-duplicated." << std::endl;

    assert(NormaliseExtensionTokens({}).empty());
    assert(NormaliseExtensionTokens({"", " "}).empty());
    std::cout << "[PASS] Empty input yields no tokens." << std::endl;

    assert(CanonicalExtension("dir/Notes.TXT") == ".txt");
    assert(CanonicalExtension("archive.tar.GZ") == ".gz");
    assert(CanonicalExtension("Makefile").empty());
    std::cout << "[PASS] CanonicalExtension lower-cases the last extension." << std::endl;

    auto parts = SplitCommaSeparated({"a, b", "b,c", " ", ",,d"});
    assert(parts.size() == 4);
    assert(parts[0] == "a" && parts[1] == "b" && parts[2] == "c" && parts[3] == "d");
    std::cout << "[PASS] Comma separated values are split and de-duplicated." << std::endl;

    const auto& defaults = DefaultExtensions();
    assert(!defaults.empty());
    for (const auto& ext : defaults) {
        assert(ext.front() == '.');
        assert(NormaliseExtensionTokens({ext}).front() == ext);
    }
    assert(DefaultPriorityFiles().front() == "README.md");
    std::cout << "[PASS] Defaults are already canonical." << std::endl;

    std::cout << "[Test] All ExtensionUtils tests passed." << std::endl;
    return 0;
}
