#include "emp/id_generator.hpp"

#include <cctype>
#include <cstdint>
#include <random>

namespace emp {

namespace {

constexpr char kHex[] = "0123456789abcdef";

std::mt19937_64& thread_engine() {
    thread_local std::mt19937_64 engine{[] {
        std::random_device rd;
        std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
        return std::mt19937_64{seq};
    }()};
    return engine;
}

bool is_dash_position(size_t i) {
    return i == 8 || i == 13 || i == 18 || i == 23;
}

} // namespace

std::string IdGenerator::generate() {
    auto& engine = thread_engine();
    uint64_t hi = engine();
    uint64_t lo = engine();

    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL; // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL; // variant 1

    std::string out;
    out.reserve(36);
    for (int shift = 60; shift >= 0; shift -= 4) {
        out.push_back(kHex[(hi >> shift) & 0xF]);
        if (out.size() == 8 || out.size() == 13 || out.size() == 18)
            out.push_back('-');
    }
    for (int shift = 60; shift >= 0; shift -= 4) {
        out.push_back(kHex[(lo >> shift) & 0xF]);
        if (out.size() == 23)
            out.push_back('-');
    }
    return out;
}

std::optional<std::string> IdGenerator::normalize(std::string_view text) {
    if (text.size() != 36)
        return std::nullopt;

    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < text.size(); i++) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (is_dash_position(i)) {
            if (c != '-')
                return std::nullopt;
            out.push_back('-');
            continue;
        }
        if (!std::isxdigit(c))
            return std::nullopt;
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

} // namespace emp
