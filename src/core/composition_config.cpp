/**
 * @file    composition_config.cpp
 * @brief   Composition config resolver
 * @license MIT
 */

#include "core/composition_config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <type_traits>

namespace nxc {

namespace {

std::string_view trim(std::string_view text) noexcept {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

bool matches(std::optional<std::string_view> value, std::string_view keyword) noexcept {
    return value && iequals(trim(*value), keyword);
}

// Bound of T that an out-of-range number falls on; tiny floats become zero
template <typename T>
T saturated(std::string_view number) noexcept {
    const bool negative = !number.empty() && number.front() == '-';
    if constexpr (std::is_floating_point_v<T>) {
        const auto exponent = number.find_first_of("eE");
        if (exponent != std::string_view::npos && exponent + 1 < number.size() &&
            number[exponent + 1] == '-') {
            return T{0};
        }
    }
    return negative ? std::numeric_limits<T>::lowest() : std::numeric_limits<T>::max();
}

// Parse the leading number of a field, ignoring any trailing text ("12px" -> 12)
template <typename T>
std::optional<T> parse_leading(std::optional<std::string_view> value) noexcept {
    if (!value) return std::nullopt;

    std::string_view text = trim(*value);
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
    }
    if (text.empty()) return std::nullopt;

    T parsed{};
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (ec == std::errc::result_out_of_range) {
        return saturated<T>(std::string_view(text.data(), ptr - text.data()));
    }
    if (ec != std::errc{} || ptr == text.data()) {
        return std::nullopt;
    }
    if constexpr (std::is_floating_point_v<T>) {
        if (!std::isfinite(parsed)) return std::nullopt;
    }
    return parsed;
}

}  // anonymous namespace

OutputFormat parse_output_format(std::optional<std::string_view> value) noexcept {
    return matches(value, "png") ? OutputFormat::Png : OutputFormat::Jpeg;
}

int parse_quality(std::optional<std::string_view> value) noexcept {
    constexpr int kDefaultQuality = 90;

    int quality = parse_leading<int>(value).value_or(0);
    if (quality == 0) {
        quality = kDefaultQuality;
    }
    return std::clamp(quality, kMinQuality, kMaxQuality);
}

Layout parse_layout(std::optional<std::string_view> value) noexcept {
    return matches(value, "overlay") ? Layout::Overlay : Layout::Sheet;
}

WatermarkMode parse_watermark_mode(std::optional<std::string_view> value) noexcept {
    return matches(value, "center") ? WatermarkMode::Center : WatermarkMode::Diagonal;
}

float parse_watermark_opacity(std::optional<std::string_view> value) noexcept {
    const auto opacity = parse_leading<float>(value);
    if (!opacity) return 0.30f;
    return std::clamp(*opacity, 0.0f, 1.0f);
}

float parse_watermark_scale(std::optional<std::string_view> value) noexcept {
    const auto scale = parse_leading<float>(value);
    if (!scale) return 2.5f;
    return std::max(*scale, kMinWatermarkScale);
}

float parse_watermark_angle(std::optional<std::string_view> value) noexcept {
    return parse_leading<float>(value).value_or(45.0f);
}

std::optional<std::string_view> find_field(const FormFields& fields, const std::string& name) {
    const auto it = fields.find(name);
    if (it == fields.end()) return std::nullopt;
    return std::string_view(it->second);
}

CompositionConfig resolve_config(const FormFields& fields) {
    CompositionConfig config;
    config.output_format     = parse_output_format(find_field(fields, field::kFormat));
    config.quality           = parse_quality(find_field(fields, field::kQuality));
    config.layout            = parse_layout(find_field(fields, field::kLayout));
    config.watermark_mode    = parse_watermark_mode(find_field(fields, field::kWatermarkMode));
    config.watermark_opacity = parse_watermark_opacity(find_field(fields, field::kWatermarkOpacity));
    config.watermark_scale   = parse_watermark_scale(find_field(fields, field::kWatermarkScale));
    config.watermark_angle   = parse_watermark_angle(find_field(fields, field::kWatermarkAngle));
    return config;
}

}  // namespace nxc
