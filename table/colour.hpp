#ifndef EDGEARC_TABLE_COLOUR_HPP
#define EDGEARC_TABLE_COLOUR_HPP

#include <optional>
#include <string>

namespace edgearc {

// RGBA colour with channels in [0, 255]
struct Colour {
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;
    double a = 255.0;
    bool has_alpha = false;  // Written back as #RRGGBBAA when set
};

// Parse "#RRGGBB" or "#RRGGBBAA" (case-insensitive). Anything else is nullopt.
std::optional<Colour> parse_colour(const std::string& text);

std::string format_colour(const Colour& colour);

// Per-channel linear interpolation
Colour lerp(const Colour& a, const Colour& b, double t);

}  // namespace edgearc

#endif // EDGEARC_TABLE_COLOUR_HPP
