#pragma once
#include <algorithm>
#include <cctype>
#include <string>

#include <openssl/crypto.h>   // OPENSSL_cleanse

// Characters treated as blank around a line of input.
inline constexpr const char* kBlankChars = " \t\r\n\v\f";

// Trim leading and trailing blanks; inner whitespace is left alone.
inline std::string trim_whitespace(const std::string& s) {
    const auto start = s.find_first_not_of(kBlankChars);
    if (start == std::string::npos) return {};
    const auto end = s.find_last_not_of(kBlankChars);
    return s.substr(start, end - start + 1);
}

inline std::string to_lower_ascii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

// Overwrite a secret in place, then empty it.
inline void secure_wipe(std::string& secret) {
    if (!secret.empty()) {
        OPENSSL_cleanse(&secret[0], secret.size());
    }
    secret.clear();
}
