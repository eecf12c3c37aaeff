#include "cli_common.hpp"
#include <assembler/arc_assembler.hpp>
#include <svg/svg_export.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/edge_table_json.hpp>
#include <common/logging.hpp>

namespace edgearc::cli {

int command_svg(int argc, char** argv) {
    auto log = edgearc::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty()) {
            std::cerr << "Usage: edgearc svg <arcs.json> [-o <output.svg>] "
                         "[--width <px>] [--height <px>]\n";
            return 1;
        }
        if (ctx.verbose) {
            log->set_level(spdlog::level::debug);
        }

        std::string output_path = resolve_output_path(ctx.input_path, ".svg", ctx.output_path);
        log->info("Exporting SVG from: {}", ctx.input_path);

        json::SerializedData input_data = json::read_serialized(ctx.input_path);
        auto variant = parse_variant(input_data.step);
        if (!variant) {
            log->error("Input step '{}' is not an arc table (expected arc, arc2 or arc0)",
                       input_data.step);
            return 1;
        }

        EdgeTable points = edge_table_from_json(input_data.data);

        SvgOptions options;
        if (ctx.width) options.width = *ctx.width;
        if (ctx.height) options.height = *ctx.height;

        SvgGeometry geometry = variant_samples(*variant) ? SvgGeometry::Polyline
                                                         : SvgGeometry::Bezier;
        log->debug("Rendering {} rows as {}", points.row_count(),
                   geometry == SvgGeometry::Bezier ? "cubic paths" : "polylines");

        std::string svg = to_svg(points, geometry, options);
        write_file(output_path, svg);

        log->info("Wrote SVG to {} ({} bytes)", output_path, svg.size());
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        return 1;
    }
}

}  // namespace edgearc::cli
