#pragma once
#include <cstddef>
#include <string>

// Random identifiers over the 64-symbol URL-safe alphabet [A-Za-z0-9_-].
// Entropy comes from OpenSSL's CSPRNG; no state is kept between calls.
class CodeGenerator {
public:
    static constexpr std::size_t kCodeLength = 6;
    static constexpr std::size_t kIdLength = 10;

    static const std::string& alphabet() noexcept;

    // Throws std::runtime_error only if the entropy source fails.
    std::string generate(std::size_t length) const;

    static bool is_valid_code(const std::string& s, std::size_t length) noexcept;
};
