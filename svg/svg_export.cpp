#include "svg_export.hpp"
#include <math/vec2.hpp>
#include <common/errors.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <vector>

namespace edgearc {

namespace {

// Maps data coordinates into the drawing area, flipping y
struct Viewport {
    double min_x = 0.0, min_y = 0.0;
    double scale = 1.0;
    double offset_x = 0.0, offset_y = 0.0;
    double height = 0.0;

    Vec2 map(double x, double y) const {
        return {offset_x + (x - min_x) * scale,
                height - (offset_y + (y - min_y) * scale)};
    }
};

Viewport fit_viewport(const std::vector<double>& xs, const std::vector<double>& ys,
                      const SvgOptions& options) {
    double min_x = std::numeric_limits<double>::infinity();
    double min_y = min_x, max_x = -min_x, max_y = -min_x;
    for (size_t i = 0; i < xs.size(); ++i) {
        if (std::isnan(xs[i]) || std::isnan(ys[i])) continue;
        min_x = std::min(min_x, xs[i]);
        max_x = std::max(max_x, xs[i]);
        min_y = std::min(min_y, ys[i]);
        max_y = std::max(max_y, ys[i]);
    }

    Viewport vp;
    vp.height = options.height;
    if (min_x > max_x) {
        return vp;
    }

    double span_x = max_x - min_x;
    double span_y = max_y - min_y;
    double avail_w = std::max(options.width - 2.0 * options.margin, 1.0);
    double avail_h = std::max(options.height - 2.0 * options.margin, 1.0);

    double sx = span_x > 0.0 ? avail_w / span_x : std::numeric_limits<double>::infinity();
    double sy = span_y > 0.0 ? avail_h / span_y : std::numeric_limits<double>::infinity();
    vp.scale = std::min(sx, sy);
    if (!std::isfinite(vp.scale)) {
        vp.scale = 1.0;
    }

    vp.min_x = min_x;
    vp.min_y = min_y;
    vp.offset_x = options.margin + (avail_w - span_x * vp.scale) / 2.0;
    vp.offset_y = options.margin + (avail_h - span_y * vp.scale) / 2.0;
    return vp;
}

// [begin, end) row ranges sharing one group value
std::vector<std::pair<size_t, size_t>> group_runs(const Column& group) {
    std::vector<std::pair<size_t, size_t>> runs;
    size_t rows = group.size();
    size_t begin = 0;
    for (size_t r = 1; r <= rows; ++r) {
        bool boundary = r == rows || std::visit([&](const auto& values) -> bool {
            return !(values[r] == values[begin]);
        }, group.data);
        if (boundary) {
            runs.emplace_back(begin, r);
            begin = r;
        }
    }
    return runs;
}

struct StrokeStyle {
    std::string colour;
    double width = 1.0;
    double alpha = 1.0;

    bool operator==(const StrokeStyle& other) const {
        return colour == other.colour && width == other.width && alpha == other.alpha;
    }
};

class StyleLookup {
public:
    StyleLookup(const EdgeTable& table, const SvgOptions& options) : options_(options) {
        if (table.has_column("edge_colour") &&
            table.column("edge_colour").type() == ColumnType::Text) {
            colours_ = &table.texts("edge_colour");
        }
        if (table.has_column("edge_width") &&
            table.column("edge_width").type() == ColumnType::Number) {
            widths_ = &table.numbers("edge_width");
        }
        if (table.has_column("edge_alpha") &&
            table.column("edge_alpha").type() == ColumnType::Number) {
            alphas_ = &table.numbers("edge_alpha");
        }
    }

    StrokeStyle at(size_t row) const {
        StrokeStyle style{options_.default_colour, options_.default_line_width, 1.0};
        if (colours_) style.colour = (*colours_)[row];
        if (widths_ && !std::isnan((*widths_)[row])) style.width = (*widths_)[row];
        if (alphas_ && !std::isnan((*alphas_)[row])) style.alpha = (*alphas_)[row];
        return style;
    }

private:
    const SvgOptions& options_;
    const std::vector<std::string>* colours_ = nullptr;
    const std::vector<double>* widths_ = nullptr;
    const std::vector<double>* alphas_ = nullptr;
};

// Attribute-safe text: colour columns are free text
std::string xml_escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default: out += c; break;
        }
    }
    return out;
}

void write_stroke(std::ostringstream& ss, const StrokeStyle& style) {
    ss << " fill=\"none\" stroke=\"" << xml_escape(style.colour)
       << "\" stroke-width=\"" << style.width << "\"";
    if (style.alpha < 1.0) {
        ss << " stroke-opacity=\"" << style.alpha << "\"";
    }
}

void write_header(std::ostringstream& ss, const SvgOptions& options, size_t edge_count) {
    ss << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << options.width
       << "\" height=\"" << options.height << "\" viewBox=\"0 0 " << options.width
       << " " << options.height << "\">\n";
    ss << "<!-- edgearc: " << edge_count << " edges -->\n";
}

}  // namespace

std::string to_svg(const EdgeTable& table, SvgGeometry geometry, const SvgOptions& options) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(3);

    // A batch with nothing left after filtering reads back without columns
    if (table.column_count() == 0) {
        write_header(ss, options, 0);
        ss << "</svg>\n";
        return ss.str();
    }

    const auto& xs = table.numbers("x");
    const auto& ys = table.numbers("y");
    const Column& group = table.column("group");

    Viewport vp = fit_viewport(xs, ys, options);
    StyleLookup styles(table, options);
    auto runs = group_runs(group);

    write_header(ss, options, runs.size());

    for (const auto& [begin, end] : runs) {
        if (geometry == SvgGeometry::Bezier) {
            if (end - begin != 4) {
                throw InputValidationError("bezier edges need 4 control points, found " +
                                           std::to_string(end - begin));
            }
            Vec2 p[4];
            for (size_t i = 0; i < 4; ++i) {
                p[i] = vp.map(xs[begin + i], ys[begin + i]);
            }
            ss << "<path d=\"M " << p[0].x << " " << p[0].y
               << " C " << p[1].x << " " << p[1].y
               << ", " << p[2].x << " " << p[2].y
               << ", " << p[3].x << " " << p[3].y << "\"";
            write_stroke(ss, styles.at(begin));
            ss << "/>\n";
            continue;
        }

        bool uniform = true;
        for (size_t r = begin + 1; r < end && uniform; ++r) {
            uniform = styles.at(r) == styles.at(begin);
        }

        if (uniform) {
            ss << "<polyline points=\"";
            for (size_t r = begin; r < end; ++r) {
                Vec2 p = vp.map(xs[r], ys[r]);
                ss << (r == begin ? "" : " ") << p.x << "," << p.y;
            }
            ss << "\"";
            write_stroke(ss, styles.at(begin));
            ss << "/>\n";
            continue;
        }

        // Interpolated styling, one segment per sample step
        ss << "<g>\n";
        for (size_t r = begin; r + 1 < end; ++r) {
            Vec2 a = vp.map(xs[r], ys[r]);
            Vec2 b = vp.map(xs[r + 1], ys[r + 1]);
            ss << "<line x1=\"" << a.x << "\" y1=\"" << a.y
               << "\" x2=\"" << b.x << "\" y2=\"" << b.y << "\"";
            write_stroke(ss, styles.at(r));
            ss << " stroke-linecap=\"round\"/>\n";
        }
        ss << "</g>\n";
    }

    ss << "</svg>\n";
    return ss.str();
}

}  // namespace edgearc
