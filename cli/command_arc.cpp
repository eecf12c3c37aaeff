#include "cli_common.hpp"
#include <assembler/arc_assembler.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/config_json.hpp>
#include <serialization/edge_table_json.hpp>
#include <common/errors.hpp>
#include <common/logging.hpp>

namespace edgearc::cli {

namespace {

ArcParams resolve_params(const CommandContext& ctx) {
    ArcParams params;
    if (ctx.config_path) {
        params = json::read_json_file(*ctx.config_path).get<ArcParams>();
    }
    if (ctx.curvature) params.curvature = *ctx.curvature;
    if (ctx.n) params.n = *ctx.n;
    if (ctx.num_threads) params.num_threads = *ctx.num_threads;
    if (ctx.fold) params.fold = true;
    if (ctx.na_rm) params.na_rm = true;
    return params;
}

void print_usage(ArcVariant variant) {
    std::cerr << "Usage: edgearc " << variant_name(variant)
              << " <edges.json> [-o <output.json>] [-c <params.json>]\n"
              << "       [--curvature <x>] [--fold] [--na-rm] [--threads <k>]";
    if (variant_samples(variant)) {
        std::cerr << " [-n <points>]";
    }
    std::cerr << "\n";
    if (variant == ArcVariant::Arc2) {
        std::cerr << "Input rows: x, y, group, circular (two rows per edge)\n";
    } else {
        std::cerr << "Input rows: x, y, xend, yend, circular (one row per edge)\n";
    }
}

int run_assembly(int argc, char** argv, ArcVariant variant) {
    auto log = edgearc::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty()) {
            print_usage(variant);
            return 1;
        }
        if (ctx.verbose) {
            log->set_level(spdlog::level::debug);
        }

        ArcParams params = resolve_params(ctx);
        std::string output_path = resolve_output_path(
            ctx.input_path, std::string(".") + variant_name(variant) + ".json", ctx.output_path);

        log->info("Building {} edges from: {}", variant_name(variant), ctx.input_path);

        json::SerializedData input_data = json::read_serialized(ctx.input_path);
        EdgeTable edges = edge_table_from_json(input_data.data);
        log->debug("Loaded {} rows, {} columns", edges.row_count(), edges.column_count());

        EdgeTable points = assemble(variant, edges, params);

        size_t edge_count = 0;
        if (variant_samples(variant)) {
            edge_count = points.row_count() / static_cast<size_t>(params.n);
        } else {
            edge_count = points.row_count() / 4;
        }

        json::SerializedData data;
        data.step = variant_name(variant);
        data.timestamp = json::get_timestamp();
        data.source_file = input_data.source_file;
        data.config = params;
        data.data = edge_table_to_json(points);
        data.stats = {
            {"edge_count", edge_count},
            {"row_count", points.row_count()}
        };

        json::write_serialized(output_path, data);

        log->info("Wrote {} ({} edges, {} rows)", output_path, edge_count, points.row_count());
        return 0;

    } catch (const InputValidationError& e) {
        log->error("Invalid input: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        return 1;
    }
}

}  // namespace

int command_arc(int argc, char** argv) {
    return run_assembly(argc, argv, ArcVariant::Arc);
}

int command_arc2(int argc, char** argv) {
    return run_assembly(argc, argv, ArcVariant::Arc2);
}

int command_arc0(int argc, char** argv) {
    return run_assembly(argc, argv, ArcVariant::Arc0);
}

}  // namespace edgearc::cli
