#include "arc_assembler.hpp"
#include <geometry/arc_geometry.hpp>
#include <geometry/segment_sampler.hpp>
#include <table/colour.hpp>
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <string>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace edgearc {

namespace {

constexpr size_t kParallelThreshold = 50;

void configure_threads(const ArcParams& params) {
    auto log = edgearc::logging::get_logger();

    #ifdef _OPENMP
    int max_threads = omp_get_max_threads();
    int use_threads = (params.num_threads > 0) ? params.num_threads : max_threads;
    omp_set_num_threads(use_threads);
    log->debug("Arc assembler using {} OpenMP threads", use_threads);
    #else
    (void)params;
    log->debug("Arc assembler running single-threaded (OpenMP not available)");
    #endif
}

void validate_sample_count(int n) {
    if (n < 2) {
        throw InputValidationError("n must be at least 2, got " + std::to_string(n));
    }
}

const std::vector<std::string>& structural_columns() {
    static const std::vector<std::string> names = {
        col::x, col::y, col::xend, col::yend, col::filter, col::group, col::index
    };
    return names;
}

// Filter, type-check and NA-check a table of one-row-per-edge input
EdgeTable prepare_edge_rows(const EdgeTable& edges, const ArcParams& params) {
    auto log = edgearc::logging::get_logger();

    EdgeTable table = apply_filter(edges);

    const auto& x = table.numbers(col::x);
    const auto& y = table.numbers(col::y);
    const auto& xend = table.numbers(col::xend);
    const auto& yend = table.numbers(col::yend);
    table.logicals(col::circular);

    std::vector<size_t> keep;
    keep.reserve(table.row_count());
    for (size_t r = 0; r < table.row_count(); ++r) {
        bool missing = std::isnan(x[r]) || std::isnan(y[r]) ||
                       std::isnan(xend[r]) || std::isnan(yend[r]);
        if (!missing) {
            keep.push_back(r);
        }
    }

    size_t dropped = table.row_count() - keep.size();
    if (dropped == 0) {
        return table;
    }
    if (!params.na_rm) {
        throw InputValidationError(std::to_string(dropped) +
                                   " edge rows have missing coordinates");
    }
    log->warn("Removed {} edge rows containing missing coordinates", dropped);
    return table.select_rows(keep);
}

std::vector<EndpointPair> edge_pairs(const EdgeTable& table) {
    const auto& x = table.numbers(col::x);
    const auto& y = table.numbers(col::y);
    const auto& xend = table.numbers(col::xend);
    const auto& yend = table.numbers(col::yend);
    const auto& circular = table.logicals(col::circular);

    std::vector<EndpointPair> pairs(table.row_count());
    for (size_t r = 0; r < pairs.size(); ++r) {
        pairs[r].start = Vec2(x[r], y[r]);
        pairs[r].end = Vec2(xend[r], yend[r]);
        pairs[r].circular = circular[r];
    }
    return pairs;
}

std::vector<SampledPoint> sample_polygons(const std::vector<CubicBezier>& polygons, int n) {
    std::vector<SampledPoint> samples(polygons.size() * static_cast<size_t>(n));
    const long count = static_cast<long>(polygons.size());

    #pragma omp parallel for schedule(static) if(polygons.size() > kParallelThreshold)
    for (long k = 0; k < count; ++k) {
        sample_bezier_into(polygons[static_cast<size_t>(k)], n,
                           samples.data() + static_cast<size_t>(k) * static_cast<size_t>(n));
    }
    return samples;
}

// Row k of the source for every output row, each repeated `times`
std::vector<size_t> repeat_rows(size_t count, size_t times) {
    std::vector<size_t> rows;
    rows.reserve(count * times);
    for (size_t k = 0; k < count; ++k) {
        rows.insert(rows.end(), times, k);
    }
    return rows;
}

// x, y, group and index columns for a sampled batch
EdgeTable sampled_point_table(const std::vector<SampledPoint>& samples, ColumnData group) {
    std::vector<double> xs, ys, ts;
    xs.reserve(samples.size());
    ys.reserve(samples.size());
    ts.reserve(samples.size());
    for (const auto& s : samples) {
        xs.push_back(s.position.x);
        ys.push_back(s.position.y);
        ts.push_back(s.t);
    }

    EdgeTable out;
    out.add_column(col::x, std::move(xs));
    out.add_column(col::y, std::move(ys));
    out.add_column(col::group, std::move(group));
    out.add_column(col::index, std::move(ts));
    return out;
}

void append_columns(EdgeTable& out, const EdgeTable& extra) {
    for (const auto& c : extra.columns()) {
        out.add_column(c.name, c.data);
    }
}

std::vector<double> fresh_group_ids(const std::vector<size_t>& edge_of_row) {
    std::vector<double> ids;
    ids.reserve(edge_of_row.size());
    for (size_t e : edge_of_row) {
        ids.push_back(static_cast<double>(e));
    }
    return ids;
}

EdgeTable empty_output(bool sampled) {
    EdgeTable out;
    out.add_column(col::x, std::vector<double>{});
    out.add_column(col::y, std::vector<double>{});
    out.add_column(col::group, std::vector<double>{});
    if (sampled) {
        out.add_column(col::index, std::vector<double>{});
    }
    return out;
}

// Row order that sorts the table by group, stable within a group
std::vector<size_t> group_order(const Column& group) {
    std::vector<size_t> order(group.size());
    std::iota(order.begin(), order.end(), size_t{0});

    if (group.type() == ColumnType::Number) {
        const auto& values = std::get<std::vector<double>>(group.data);
        if (std::any_of(values.begin(), values.end(), [](double v) { return std::isnan(v); })) {
            throw InputValidationError("group column contains missing values");
        }
    }

    std::visit([&](const auto& values) {
        std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
            return values[a] < values[b];
        });
    }, group.data);
    return order;
}

bool same_value(const Column& column, size_t a, size_t b) {
    return std::visit([&](const auto& values) -> bool {
        return values[a] == values[b];
    }, column.data);
}

ColumnData interpolate_column(const Column& from, const Column& to,
                              const std::vector<SampledPoint>& samples, size_t n) {
    switch (from.type()) {
        case ColumnType::Number: {
            const auto& a = std::get<std::vector<double>>(from.data);
            const auto& b = std::get<std::vector<double>>(to.data);
            std::vector<double> values(samples.size());
            for (size_t i = 0; i < samples.size(); ++i) {
                size_t k = i / n;
                values[i] = a[k] + (b[k] - a[k]) * samples[i].t;
            }
            return values;
        }
        case ColumnType::Text: {
            const auto& a = std::get<std::vector<std::string>>(from.data);
            const auto& b = std::get<std::vector<std::string>>(to.data);
            std::vector<std::string> values(samples.size());
            for (size_t k = 0; k * n < samples.size(); ++k) {
                auto ca = parse_colour(a[k]);
                auto cb = parse_colour(b[k]);
                for (size_t i = k * n; i < (k + 1) * n; ++i) {
                    if (ca && cb) {
                        values[i] = format_colour(lerp(*ca, *cb, samples[i].t));
                    } else {
                        values[i] = a[k];
                    }
                }
            }
            return values;
        }
        case ColumnType::Logical:
            break;
    }
    return select_column_rows(from.data, repeat_rows(from.size(), n));
}

}  // namespace

const char* variant_name(ArcVariant variant) {
    switch (variant) {
        case ArcVariant::Arc: return "arc";
        case ArcVariant::Arc2: return "arc2";
        case ArcVariant::Arc0: return "arc0";
    }
    return "unknown";
}

std::optional<ArcVariant> parse_variant(const std::string& name) {
    if (name == "arc") return ArcVariant::Arc;
    if (name == "arc2") return ArcVariant::Arc2;
    if (name == "arc0") return ArcVariant::Arc0;
    return std::nullopt;
}

bool variant_samples(ArcVariant variant) {
    return variant != ArcVariant::Arc0;
}

EdgeTable apply_filter(const EdgeTable& table) {
    if (!table.has_column(col::filter)) {
        return table;
    }

    const Column& filter = table.column(col::filter);
    if (filter.type() != ColumnType::Logical) {
        throw InputValidationError("filter must be logical, found " +
                                   std::string(column_type_name(filter.type())));
    }

    const auto& keep_flags = std::get<std::vector<bool>>(filter.data);
    std::vector<size_t> keep;
    for (size_t r = 0; r < keep_flags.size(); ++r) {
        if (keep_flags[r]) {
            keep.push_back(r);
        }
    }

    auto log = edgearc::logging::get_logger();
    log->debug("Filter kept {} of {} rows", keep.size(), table.row_count());

    return table.without_columns({col::filter}).select_rows(keep);
}

std::vector<CubicBezier> derive_control_polygons(const std::vector<EndpointPair>& pairs,
                                                 const ArcParams& params) {
    std::vector<CubicBezier> polygons(pairs.size());
    const long count = static_cast<long>(pairs.size());

    #pragma omp parallel for schedule(static) if(pairs.size() > kParallelThreshold)
    for (long k = 0; k < count; ++k) {
        const auto& pair = pairs[static_cast<size_t>(k)];
        polygons[static_cast<size_t>(k)] = derive_control_polygon(
            pair.start, pair.end, pair.circular, params.curvature, params.fold);
    }
    return polygons;
}

std::vector<ControlRow> interleave_control_points(const std::vector<CubicBezier>& polygons) {
    std::vector<ControlRow> rows;
    rows.reserve(polygons.size() * 4);

    // Emitted slot-major, like stacking the P0, P1, P2 and P3 columns
    for (size_t slot = 0; slot < 4; ++slot) {
        for (size_t k = 0; k < polygons.size(); ++k) {
            rows.push_back(ControlRow{4 * k + slot, k, polygons[k].control_points[slot]});
        }
    }

    std::sort(rows.begin(), rows.end(), [](const ControlRow& a, const ControlRow& b) {
        return a.draw_index < b.draw_index;
    });
    return rows;
}

EdgeTable assemble_arc(const EdgeTable& edges, const ArcParams& params) {
    auto log = edgearc::logging::get_logger();

    validate_sample_count(params.n);
    if (edges.column_count() == 0) {
        return empty_output(true);
    }

    EdgeTable table = prepare_edge_rows(edges, params);
    size_t n = static_cast<size_t>(params.n);
    log->debug("Assembling {} arcs with {} points each", table.row_count(), n);

    configure_threads(params);
    auto polygons = derive_control_polygons(edge_pairs(table), params);
    auto samples = sample_polygons(polygons, params.n);

    auto edge_of_row = repeat_rows(table.row_count(), n);
    EdgeTable out = sampled_point_table(samples, fresh_group_ids(edge_of_row));
    append_columns(out, table.without_columns(structural_columns()).select_rows(edge_of_row));
    return out;
}

EdgeTable assemble_arc0(const EdgeTable& edges, const ArcParams& params) {
    auto log = edgearc::logging::get_logger();

    if (edges.column_count() == 0) {
        return empty_output(false);
    }

    EdgeTable table = prepare_edge_rows(edges, params);
    log->debug("Assembling {} raw arcs", table.row_count());

    configure_threads(params);
    auto polygons = derive_control_polygons(edge_pairs(table), params);
    auto rows = interleave_control_points(polygons);

    std::vector<double> xs, ys;
    std::vector<size_t> edge_of_row;
    xs.reserve(rows.size());
    ys.reserve(rows.size());
    edge_of_row.reserve(rows.size());
    for (const auto& row : rows) {
        xs.push_back(row.point.x);
        ys.push_back(row.point.y);
        edge_of_row.push_back(row.edge);
    }

    EdgeTable out;
    out.add_column(col::x, std::move(xs));
    out.add_column(col::y, std::move(ys));
    out.add_column(col::group, fresh_group_ids(edge_of_row));
    append_columns(out, table.without_columns(structural_columns()).select_rows(edge_of_row));
    return out;
}

EdgeTable assemble_arc2(const EdgeTable& endpoints, const ArcParams& params) {
    auto log = edgearc::logging::get_logger();

    validate_sample_count(params.n);
    if (endpoints.column_count() == 0) {
        return empty_output(true);
    }

    EdgeTable table = apply_filter(endpoints);
    const auto& x = table.numbers(col::x);
    const auto& y = table.numbers(col::y);
    const auto& circular = table.logicals(col::circular);
    const Column& group = table.column(col::group);

    auto order = group_order(group);
    if (order.size() % 2 != 0) {
        throw InputValidationError("endpoint rows must come in pairs, found " +
                                   std::to_string(order.size()) + " rows");
    }

    size_t pair_count = order.size() / 2;
    for (size_t k = 0; k < pair_count; ++k) {
        bool paired = same_value(group, order[2 * k], order[2 * k + 1]);
        bool closed = k + 1 == pair_count || !same_value(group, order[2 * k + 1], order[2 * k + 2]);
        if (!paired || !closed) {
            throw InputValidationError("every group must contain exactly two endpoint rows");
        }
    }

    std::vector<size_t> start_rows, end_rows;
    std::vector<EndpointPair> pairs;
    size_t dropped = 0;
    for (size_t k = 0; k < pair_count; ++k) {
        size_t s = order[2 * k];
        size_t e = order[2 * k + 1];
        if (std::isnan(x[s]) || std::isnan(y[s]) || std::isnan(x[e]) || std::isnan(y[e])) {
            ++dropped;
            continue;
        }
        start_rows.push_back(s);
        end_rows.push_back(e);
        pairs.push_back(EndpointPair{Vec2(x[s], y[s]), Vec2(x[e], y[e]), circular[s]});
    }

    if (dropped > 0) {
        if (!params.na_rm) {
            throw InputValidationError(std::to_string(dropped) +
                                       " edges have endpoints with missing coordinates");
        }
        log->warn("Removed {} edges with endpoints containing missing coordinates", dropped);
    }

    size_t n = static_cast<size_t>(params.n);
    log->debug("Assembling {} arcs from endpoint pairs with {} points each", pairs.size(), n);

    configure_threads(params);
    auto polygons = derive_control_polygons(pairs, params);
    auto samples = sample_polygons(polygons, params.n);

    auto edge_of_row = repeat_rows(pairs.size(), n);
    EdgeTable starts = table.select_rows(start_rows);
    EdgeTable ends = table.select_rows(end_rows);

    EdgeTable out = sampled_point_table(
        samples, select_column_rows(starts.column(col::group).data, edge_of_row));

    EdgeTable start_extra = starts.without_columns(structural_columns());
    for (const auto& c : start_extra.columns()) {
        out.add_column(c.name, interpolate_column(c, ends.column(c.name), samples, n));
    }
    return out;
}

EdgeTable assemble(ArcVariant variant, const EdgeTable& input, const ArcParams& params) {
    switch (variant) {
        case ArcVariant::Arc: return assemble_arc(input, params);
        case ArcVariant::Arc2: return assemble_arc2(input, params);
        case ArcVariant::Arc0: return assemble_arc0(input, params);
    }
    throw std::invalid_argument("unknown arc variant");
}

}  // namespace edgearc
