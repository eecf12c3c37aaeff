#ifndef EDGEARC_ASSEMBLER_ARC_PARAMS_HPP
#define EDGEARC_ASSEMBLER_ARC_PARAMS_HPP

namespace edgearc {

// Layer parameters shared by all arc variants
struct ArcParams {
    // Bend of linear arcs. 1 approximates a half circle, 0 is a straight
    // line, a negative value bends to the other side. Ignored for circular
    // edges.
    double curvature = 1.0;

    // Put all linear arcs on the side given by the sign of curvature
    bool fold = false;

    // Points per sampled arc (Arc and Arc2 only)
    int n = 100;

    // Drop rows with missing coordinates instead of rejecting the batch
    bool na_rm = false;

    // Parallelization settings
    int num_threads = 0;  // 0 = auto-detect, > 0 = use specific count
};

}  // namespace edgearc

#endif // EDGEARC_ASSEMBLER_ARC_PARAMS_HPP
