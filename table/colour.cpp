#include "colour.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace edgearc {

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

int channel(double value) {
    return static_cast<int>(std::lround(std::clamp(value, 0.0, 255.0)));
}

}  // namespace

std::optional<Colour> parse_colour(const std::string& text) {
    if (text.size() != 7 && text.size() != 9) {
        return std::nullopt;
    }
    if (text[0] != '#') {
        return std::nullopt;
    }

    double channels[4] = {0.0, 0.0, 0.0, 255.0};
    size_t count = (text.size() - 1) / 2;
    for (size_t i = 0; i < count; ++i) {
        int hi = hex_digit(text[1 + 2 * i]);
        int lo = hex_digit(text[2 + 2 * i]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        channels[i] = static_cast<double>(hi * 16 + lo);
    }

    Colour colour;
    colour.r = channels[0];
    colour.g = channels[1];
    colour.b = channels[2];
    colour.a = channels[3];
    colour.has_alpha = count == 4;
    return colour;
}

std::string format_colour(const Colour& colour) {
    std::ostringstream ss;
    ss << '#' << std::uppercase << std::hex << std::setfill('0')
       << std::setw(2) << channel(colour.r)
       << std::setw(2) << channel(colour.g)
       << std::setw(2) << channel(colour.b);
    if (colour.has_alpha) {
        ss << std::setw(2) << channel(colour.a);
    }
    return ss.str();
}

Colour lerp(const Colour& a, const Colour& b, double t) {
    Colour result;
    result.r = a.r + (b.r - a.r) * t;
    result.g = a.g + (b.g - a.g) * t;
    result.b = a.b + (b.b - a.b) * t;
    result.a = a.a + (b.a - a.a) * t;
    result.has_alpha = a.has_alpha || b.has_alpha;
    return result;
}

}  // namespace edgearc
