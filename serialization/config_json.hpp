#ifndef EDGEARC_SERIALIZATION_CONFIG_JSON_HPP
#define EDGEARC_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <assembler/arc_params.hpp>

namespace edgearc {

// ArcParams serialization
inline void to_json(nlohmann::json& j, const ArcParams& params) {
    j = {
        {"curvature", params.curvature},
        {"fold", params.fold},
        {"n", params.n},
        {"na_rm", params.na_rm},
        {"num_threads", params.num_threads}
    };
}

inline void from_json(const nlohmann::json& j, ArcParams& params) {
    params.curvature = j.value("curvature", 1.0);
    params.fold = j.value("fold", false);
    params.n = j.value("n", 100);
    params.na_rm = j.value("na_rm", false);
    params.num_threads = j.value("num_threads", 0);
}

}  // namespace edgearc

#endif // EDGEARC_SERIALIZATION_CONFIG_JSON_HPP
