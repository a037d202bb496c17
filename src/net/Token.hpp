#pragma once
#include <optional>
#include <string>

#include "GameProtocol.hpp"

namespace auth {

    // Decodes base64url (padding optional). nullopt on invalid input.
    std::optional<std::string> base64UrlDecode(const std::string& in);

    // Reads the numeric user id from the JWT "sub" claim. The signature is NOT
    // verified; the server checks it on every request.
    std::optional<game::PlayerId> decodeSubject(const std::string& token, std::string& error);

} // namespace auth
