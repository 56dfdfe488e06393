#include "Color.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace
{
    int hexDigit(char c) noexcept
    {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return 10 + (c - 'a');
        if (c >= 'A' && c <= 'F')
            return 10 + (c - 'A');
        return -1;
    }

    bool parseByte(std::string_view s, size_t at, float& out) noexcept
    {
        const int hi = hexDigit(s[at]);
        const int lo = hexDigit(s[at + 1]);
        if (hi < 0 || lo < 0)
            return false;

        out = float(hi * 16 + lo) / 255.0f;
        return true;
    }

    float clamp01(float v) noexcept
    {
        return std::clamp(v, 0.0f, 1.0f);
    }

    int toByte(float v) noexcept
    {
        return int(std::lround(clamp01(v) * 255.0f));
    }
} // namespace

std::optional<Color> Color::fromHex(std::string_view hex)
{
    if (!hex.empty() && hex.front() == '#')
        hex.remove_prefix(1);

    if (hex.size() != 6 && hex.size() != 8)
        return std::nullopt;

    Color c = {};
    if (!parseByte(hex, 0, c.r) || !parseByte(hex, 2, c.g) || !parseByte(hex, 4, c.b))
        return std::nullopt;

    if (hex.size() == 8 && !parseByte(hex, 6, c.a))
        return std::nullopt;

    return c;
}

std::string Color::toHex() const
{
    char buf[10] = {};
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x%02x", toByte(r), toByte(g), toByte(b), toByte(a));
    return std::string(buf);
}

Color Color::add(const Color& o) const noexcept
{
    return Color{r + o.r, g + o.g, b + o.b, a + o.a}.clamped();
}

Color Color::multiply(const Color& o) const noexcept
{
    return Color{r * o.r, g * o.g, b * o.b, a * o.a}.clamped();
}

Color Color::clamped() const noexcept
{
    return Color{clamp01(r), clamp01(g), clamp01(b), clamp01(a)};
}
