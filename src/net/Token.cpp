#include "Token.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <vector>

#include <nlohmann/json.hpp>
#include <openssl/evp.h>

using json = nlohmann::json;

namespace auth {

std::optional<std::string> base64UrlDecode(const std::string& in) {
    std::string b64 = in;
    for (char& c : b64) {
        if (c == '-') c = '+';
        else if (c == '_') c = '/';
    }
    if (b64.size() % 4 == 1) return std::nullopt;
    while (b64.size() % 4 != 0) b64.push_back('=');
    if (b64.empty()) return std::string{};

    std::vector<unsigned char> out(b64.size() / 4 * 3);
    const int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(b64.data()),
        static_cast<int>(b64.size()));
    if (n < 0) return std::nullopt;

    // EVP_DecodeBlock counts the padding bytes as output
    const size_t pad = (size_t)std::count(b64.end() - 2, b64.end(), '=');
    const size_t len = (size_t)n >= pad ? (size_t)n - pad : 0;
    return std::string(reinterpret_cast<const char*>(out.data()), len);
}

std::optional<game::PlayerId> decodeSubject(const std::string& token, std::string& error) {
    const auto first = token.find('.');
    const auto second = (first == std::string::npos) ? std::string::npos : token.find('.', first + 1);
    if (first == std::string::npos || second == std::string::npos || token.find('.', second + 1) != std::string::npos) {
        error = "token is not a JWT";
        return std::nullopt;
    }

    const auto claimsText = base64UrlDecode(token.substr(first + 1, second - first - 1));
    if (!claimsText) {
        error = "token claims are not base64url";
        return std::nullopt;
    }

    json claims;
    try {
        claims = json::parse(*claimsText);
    }
    catch (const json::parse_error& e) {
        error = std::string("token claims are not JSON: ") + e.what();
        return std::nullopt;
    }

    const auto sub = claims.is_object() ? claims.find("sub") : claims.end();
    if (!claims.is_object() || sub == claims.end()) {
        error = "token has no sub claim";
        return std::nullopt;
    }

    if (sub->is_number_unsigned() &&
        sub->get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<game::PlayerId>::max())) {
        error = "sub claim out of range: " + sub->dump();
        return std::nullopt;
    }
    if (sub->is_number_integer()) return sub->get<game::PlayerId>();

    if (sub->is_string()) {
        const std::string s = sub->get<std::string>();
        const size_t sign = (!s.empty() && s[0] == '-') ? 1 : 0;
        const bool digits = s.size() > sign &&
            std::all_of(s.begin() + sign, s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
        if (digits) {
            try {
                return static_cast<game::PlayerId>(std::stoll(s));
            }
            catch (const std::out_of_range&) {
                error = "sub claim out of range: " + s;
                return std::nullopt;
            }
        }
        error = "sub claim is not numeric: " + s;
        return std::nullopt;
    }

    error = "sub claim has unexpected type";
    return std::nullopt;
}

} // namespace auth
