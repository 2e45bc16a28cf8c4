#include "tokenguard/auth/jwt_utils.h"

#include <algorithm>
#include <cctype>

#include <openssl/evp.h>

namespace tokenguard::auth {

namespace {

bool IsBase64UrlChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
}

}  // namespace

core::Result<std::vector<unsigned char>> Base64UrlDecode(const std::string& input) {
    // A lone trailing sextet cannot encode a whole byte.
    if (input.size() % 4 == 1 || !std::all_of(input.begin(), input.end(), IsBase64UrlChar)) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid base64url input"};
    }

    // Normalize base64url to base64 and pad for EVP_DecodeBlock.
    std::string padded = input;
    std::replace(padded.begin(), padded.end(), '-', '+');
    std::replace(padded.begin(), padded.end(), '_', '/');
    while (padded.size() % 4 != 0) {
        padded.push_back('=');
    }
    if (padded.empty()) {
        return std::vector<unsigned char>{};
    }

    std::vector<unsigned char> output((padded.size() / 4) * 3);
    int out_len = EVP_DecodeBlock(output.data(),
                                  reinterpret_cast<const unsigned char*>(padded.data()),
                                  static_cast<int>(padded.size()));
    if (out_len < 0) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid base64url input"};
    }
    // EVP_DecodeBlock counts padding as zero bytes.
    const auto padding = padded.size() - input.size();
    output.resize(static_cast<size_t>(out_len) - padding);
    return output;
}

core::Result<std::string> Base64UrlDecodeToString(const std::string& input) {
    auto decoded = Base64UrlDecode(input);
    if (!decoded.ok()) {
        return decoded.error();
    }
    return std::string(reinterpret_cast<const char*>(decoded.value().data()),
                       decoded.value().size());
}

std::vector<std::string> Split(const std::string& input, char delimiter) {
    // Simple splitter without trimming; callers can Trim() if needed.
    std::vector<std::string> parts;
    std::string current;
    for (char c : input) {
        if (c == delimiter) {
            parts.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    parts.push_back(current);
    return parts;
}

std::string Trim(const std::string& input) {
    auto start = input.begin();
    while (start != input.end() && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }
    auto end = input.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }
    return std::string(start, end);
}

std::optional<std::string> ExtractBearerToken(const std::string& authorization) {
    // Scheme is case-insensitive; the token itself is returned as-is.
    std::string value = Trim(authorization);
    if (value.size() < 7) {
        return std::nullopt;
    }
    std::string prefix = value.substr(0, 7);
    for (auto& c : prefix) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (prefix != "bearer ") {
        return std::nullopt;
    }
    auto token = Trim(value.substr(7));
    if (token.empty()) {
        return std::nullopt;
    }
    return token;
}

}  // namespace tokenguard::auth
