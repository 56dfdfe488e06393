#pragma once

#include <glm/vec4.hpp>
#include <optional>
#include <string>
#include <string_view>

/**
 * @brief Linear RGBA color, each channel in [0, 1].
 */
struct Color
{
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 1.0f;

    /// Accepts "#rrggbb", "#rrggbbaa", or the same without '#'.
    [[nodiscard]] static std::optional<Color> fromHex(std::string_view hex);

    /// "#rrggbbaa", lower case.
    [[nodiscard]] std::string toHex() const;

    /// Channel-wise sum, clamped to [0, 1].
    [[nodiscard]] Color add(const Color& other) const noexcept;

    /// Channel-wise product, clamped to [0, 1].
    [[nodiscard]] Color multiply(const Color& other) const noexcept;

    [[nodiscard]] Color clamped() const noexcept;

    [[nodiscard]] glm::vec4 toVec4() const noexcept
    {
        return glm::vec4(r, g, b, a);
    }

    bool operator==(const Color&) const = default;
};
