#include "code_generator.h"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <stdexcept>

namespace {

// 64 symbols, so a byte masked to 6 bits indexes it without bias
const std::string kAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789_-";

constexpr unsigned char kMask = 0x3F;

bool in_alphabet(char c) noexcept {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '_' || c == '-';
}

} // namespace

const std::string& CodeGenerator::alphabet() noexcept {
    return kAlphabet;
}

std::string CodeGenerator::generate(std::size_t length) const {
    std::string out;
    out.reserve(length);

    std::array<unsigned char, 64> bytes{};
    while (out.size() < length) {
        const std::size_t n = std::min(bytes.size(), length - out.size());
        if (RAND_bytes(bytes.data(), static_cast<int>(n)) != 1) {
            throw std::runtime_error("CodeGenerator: RAND_bytes failed (err=" +
                                     std::to_string(ERR_get_error()) + ")");
        }
        for (std::size_t i = 0; i < n; ++i) out.push_back(kAlphabet[bytes[i] & kMask]);
    }
    return out;
}

bool CodeGenerator::is_valid_code(const std::string& s, std::size_t length) noexcept {
    if (s.size() != length) return false;
    for (char c : s) {
        if (!in_alphabet(c)) return false;
    }
    return true;
}
