#pragma once
// Types.hpp - Fixed-width aliases and small value types shared everywhere

#include <algorithm>
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace lf {

using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;
using i32 = std::int32_t;
using i64 = std::int64_t;
using f32 = float;
using f64 = double;
using usize = std::size_t;

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

struct Vec2 {
    f32 x{0.0f};
    f32 y{0.0f};

    Vec2 operator+(Vec2 o) const {
        return {x + o.x, y + o.y};
    }
    Vec2 operator-(Vec2 o) const {
        return {x - o.x, y - o.y};
    }
    bool operator==(const Vec2&) const = default;
};

struct Size {
    f32 width{0.0f};
    f32 height{0.0f};

    bool operator==(const Size&) const = default;
};

struct Rect {
    f32 x{0.0f};
    f32 y{0.0f};
    f32 width{0.0f};
    f32 height{0.0f};

    f32 left() const {
        return x;
    }
    f32 top() const {
        return y;
    }
    f32 right() const {
        return x + width;
    }
    f32 bottom() const {
        return y + height;
    }
    Rect translated(f32 dx, f32 dy) const {
        return {x + dx, y + dy, width, height};
    }
    bool operator==(const Rect&) const = default;
};

struct Color {
    u8 r{255};
    u8 g{255};
    u8 b{255};
    u8 a{255};

    static constexpr Color white() {
        return {255, 255, 255, 255};
    }
    static constexpr Color black() {
        return {0, 0, 0, 255};
    }
    static constexpr Color transparent() {
        return {0, 0, 0, 0};
    }

    // Accepts #RRGGBB and #RRGGBBAA, returns white on malformed input
    static Color fromHex(std::string_view hex);
    std::string toHex() const;

    bool operator==(const Color&) const = default;
};

inline Color Color::fromHex(std::string_view hex) {
    if (!hex.empty() && hex.front() == '#')
        hex.remove_prefix(1);
    if (hex.size() != 6 && hex.size() != 8)
        return white();

    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        return -1;
    };

    std::array<u8, 4> out{255, 255, 255, 255};
    for (usize i = 0; i < hex.size() / 2; ++i) {
        int hi = nibble(hex[i * 2]);
        int lo = nibble(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0)
            return white();
        out[i] = static_cast<u8>(hi * 16 + lo);
    }
    return {out[0], out[1], out[2], out[3]};
}

inline std::string Color::toHex() const {
    static constexpr char digits[] = "0123456789ABCDEF";
    std::string s = "#";
    auto put = [&](u8 v) {
        s += digits[v >> 4];
        s += digits[v & 0x0F];
    };
    put(r);
    put(g);
    put(b);
    if (a != 255)
        put(a);
    return s;
}

} // namespace lf
