/**
 * @file    external_tools.cpp
 * @brief   Shared helpers for external tool adapters
 * @license MIT
 */

#include "external/external_tools.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace nxc::external {

std::string format_token(
    std::optional<std::string_view> value,
    std::string_view field,
    std::string_view fallback)
{
    if (!value || value->empty()) {
        return std::string(fallback);
    }

    std::string token(*value);
    std::transform(token.begin(), token.end(), token.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (!is_format_token(token)) {
        throw PipelineError(ErrorKind::Validation,
                            fmt::format("Field \"{}\" has an unsupported value", field),
                            std::string(*value));
    }
    return token;
}

bool is_format_token(std::string_view token) noexcept {
    constexpr std::size_t kMaxTokenLength = 10;
    return !token.empty() && token.size() <= kMaxTokenLength &&
           std::all_of(token.begin(), token.end(), [](char c) {
               return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
           });
}

std::string document_content_type(std::string_view format) {
    static const std::unordered_map<std::string_view, std::string_view> kTypes = {
        {"pdf",  "application/pdf"},
        {"docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {"xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {"pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
        {"odt",  "application/vnd.oasis.opendocument.text"},
        {"ods",  "application/vnd.oasis.opendocument.spreadsheet"},
        {"odp",  "application/vnd.oasis.opendocument.presentation"},
        {"rtf",  "application/rtf"},
        {"txt",  "text/plain"},
        {"html", "text/html"},
        {"csv",  "text/csv"},
        {"png",  "image/png"},
        {"jpg",  "image/jpeg"},
        {"svg",  "image/svg+xml"},
    };

    const auto it = kTypes.find(format);
    return it != kTypes.end() ? std::string(it->second) : "application/octet-stream";
}

bool is_fetchable_url(std::string_view url) noexcept {
    constexpr std::string_view kHttp = "http://";
    constexpr std::string_view kHttps = "https://";

    std::string_view rest;
    if (url.substr(0, kHttps.size()) == kHttps) {
        rest = url.substr(kHttps.size());
    } else if (url.substr(0, kHttp.size()) == kHttp) {
        rest = url.substr(kHttp.size());
    } else {
        return false;
    }

    if (rest.empty() || rest.front() == '/') return false;

    return std::none_of(rest.begin(), rest.end(), [](unsigned char c) {
        return c <= 0x20 || c == 0x7f;
    });
}

}  // namespace nxc::external
