#ifndef EDGEARC_ASSEMBLER_ARC_ASSEMBLER_HPP
#define EDGEARC_ASSEMBLER_ARC_ASSEMBLER_HPP

#include <math/vec2.hpp>
#include <geometry/cubic_bezier.hpp>
#include <table/edge_table.hpp>
#include "arc_params.hpp"
#include <optional>
#include <string>
#include <vector>

namespace edgearc {

// Column names understood by the assembler
namespace col {
    inline constexpr const char* x = "x";
    inline constexpr const char* y = "y";
    inline constexpr const char* xend = "xend";
    inline constexpr const char* yend = "yend";
    inline constexpr const char* circular = "circular";
    inline constexpr const char* filter = "filter";
    inline constexpr const char* group = "group";
    inline constexpr const char* index = "index";
}

enum class ArcVariant {
    Arc,   // One row per edge, sampled
    Arc2,  // Two rows per edge sharing a group, sampled and interpolated
    Arc0   // One row per edge, raw control points
};

const char* variant_name(ArcVariant variant);
std::optional<ArcVariant> parse_variant(const std::string& name);
bool variant_samples(ArcVariant variant);

// One edge ready for geometry
struct EndpointPair {
    Vec2 start;
    Vec2 end;
    bool circular = false;
};

// A control point tagged with its draw position in the batch.
// Edge k owns draw indices 4k .. 4k+3.
struct ControlRow {
    size_t draw_index = 0;
    size_t edge = 0;
    Vec2 point;
};

// Drop rows whose filter is false and remove the filter column.
// A table without a filter column is returned unchanged.
// Throws InputValidationError when the filter column is not logical.
EdgeTable apply_filter(const EdgeTable& table);

// Control polygon for every pair, computed independently per edge
std::vector<CubicBezier> derive_control_polygons(const std::vector<EndpointPair>& pairs,
                                                 const ArcParams& params);

// Flatten polygons into draw-ordered rows [P0, P1, P2, P3] per edge
std::vector<ControlRow> interleave_control_points(const std::vector<CubicBezier>& polygons);

// Edge rows (x, y, xend, yend, circular) -> n sampled rows per edge with
// the position along the path in "index" and a fresh 0-based "group".
EdgeTable assemble_arc(const EdgeTable& edges, const ArcParams& params);

// Endpoint rows (x, y, group, circular), two per group -> n sampled rows per
// edge. Other columns are interpolated from the start to the end row.
EdgeTable assemble_arc2(const EdgeTable& endpoints, const ArcParams& params);

// Edge rows (x, y, xend, yend, circular) -> 4 control point rows per edge
EdgeTable assemble_arc0(const EdgeTable& edges, const ArcParams& params);

EdgeTable assemble(ArcVariant variant, const EdgeTable& input, const ArcParams& params);

}  // namespace edgearc

#endif // EDGEARC_ASSEMBLER_ARC_ASSEMBLER_HPP
