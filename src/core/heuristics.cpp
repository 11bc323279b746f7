#include "tile_csp/heuristics.hpp"
#include <algorithm>
#include <utility>

namespace tile_csp {

size_t HeuristicSelector::select_variable(const Model& model) const {
    const auto& variables = model.variables();

    size_t best_idx = SIZE_MAX;
    size_t best_size = 0;
    size_t best_degree = 0;

    for (size_t i = 0; i < variables.size(); ++i) {
        if (model.is_assigned(i)) continue;

        size_t size = model.domain_size(i);
        if (best_idx == SIZE_MAX || size < best_size) {
            best_idx = i;
            best_size = size;
            best_degree = degree_enabled_ ? degree(model, i) : 0;
            continue;
        }
        if (size > best_size || !degree_enabled_) continue;

        // MRV 同点 → 次数の大きい方。それも同点なら先に見つかった方
        size_t d = degree(model, i);
        if (d > best_degree) {
            best_idx = i;
            best_degree = d;
        }
    }

    return best_idx;
}

size_t HeuristicSelector::degree(const Model& model, size_t var_idx) const {
    size_t count = 0;
    for (size_t n : model.neighbors(var_idx)) {
        if (!model.is_assigned(n)) {
            ++count;
        }
    }
    return count;
}

std::vector<Domain::value_type> HeuristicSelector::order_values(const Model& model,
                                                                size_t var_idx) const {
    auto values = model.variables()[var_idx]->domain().values();
    if (!lcv_enabled_ || values.size() <= 1) {
        return values;
    }

    std::vector<std::pair<size_t, Domain::value_type>> scored;
    scored.reserve(values.size());
    for (auto v : values) {
        scored.emplace_back(count_eliminations(model, var_idx, v), v);
    }
    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    for (size_t i = 0; i < scored.size(); ++i) {
        values[i] = scored[i].second;
    }
    return values;
}

size_t HeuristicSelector::count_eliminations(const Model& model, size_t var_idx,
                                             Domain::value_type value) const {
    const auto& arcs = model.arcs();
    const auto& constraints = model.constraints();
    const auto& variables = model.variables();

    size_t eliminated = 0;
    // (Y, var_idx) アーク: Y の各値が var_idx = value のもとで支持されるか
    for (size_t a : model.arcs_into(var_idx)) {
        const Arc& arc = arcs[a];
        if (model.is_assigned(arc.from)) continue;

        for (auto vy : variables[arc.from]->domain()) {
            for (const auto& link : arc.links) {
                if (!constraints[link.constraint_idx]->supports(link.from_internal, vy,
                                                                link.to_internal, value)) {
                    ++eliminated;
                    break;
                }
            }
        }
    }
    return eliminated;
}

} // namespace tile_csp
