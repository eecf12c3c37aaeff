#ifndef EDGEARC_SVG_SVG_EXPORT_HPP
#define EDGEARC_SVG_SVG_EXPORT_HPP

#include <table/edge_table.hpp>
#include <string>

namespace edgearc {

struct SvgOptions {
    double width = 800.0;
    double height = 600.0;
    double margin = 20.0;
    std::string default_colour = "#000000";
    double default_line_width = 1.0;
};

// How the rows of each group are drawn
enum class SvgGeometry {
    Polyline,  // Sampled points, in order
    Bezier     // Four control points per group
};

// Render an assembled arc table (x, y, group, optional edge_colour,
// edge_width and edge_alpha) as an SVG document. Data y points up.
// Rows of a group must be contiguous. Bezier groups must hold four rows.
std::string to_svg(const EdgeTable& table, SvgGeometry geometry,
                   const SvgOptions& options = {});

}  // namespace edgearc

#endif // EDGEARC_SVG_SVG_EXPORT_HPP
