#include "tile_csp/tiling/tiling_solver.hpp"
#include "tile_csp/tiling/constraints.hpp"
#include <iostream>

namespace tile_csp {
namespace tiling {

TilingSolver::TilingSolver(TilingProblem problem, TilingOptions options)
    : problem_(std::move(problem))
    , options_(options) {}

std::unique_ptr<Model> TilingSolver::build_model() {
    DomainBuilder builder(problem_);
    builder.check_static_bounds();
    placements_ = builder.placements();

    auto model = std::make_unique<Model>();
    std::vector<VariablePtr> vars;
    vars.reserve(placements_.size());
    for (const auto& p : placements_) {
        vars.push_back(model->create_variable(p.name(), builder.initial_domain(p)));
    }

    for (size_t s = 0; s < NUM_SHAPES; ++s) {
        auto shape = static_cast<TileShape>(s);
        model->add_constraint(std::make_shared<InventoryConstraint>(
            vars, shape, problem_.inventory.count(shape)));
    }
    for (const auto& [color, target] : problem_.target) {
        model->add_constraint(std::make_shared<VisibilityConstraint>(
            vars, placements_, color, target));
    }

    return model;
}

TilingResult TilingSolver::solve() {
    TilingResult result;

    std::unique_ptr<Model> model;
    try {
        model = build_model();
    } catch (const ConfigurationError& e) {
        result.status = TilingStatus::InvalidProblem;
        result.message = e.what();
        if (options_.verbose) {
            std::cerr << "% [verbose] invalid problem: " << result.message << "\n";
        }
        return result;
    }

    solver_.set_verbose(options_.verbose);
    solver_.set_degree_enabled(options_.degree_tiebreak);
    solver_.set_lcv_enabled(options_.lcv);
    solver_.set_node_limit(options_.node_limit);
    solver_.set_depth_limit(options_.depth_limit);

    auto sol = solver_.solve(*model);
    result.stats = solver_.stats();

    if (!sol) {
        result.status = solver_.result() == SearchResult::UNKNOWN
                            ? TilingStatus::Aborted
                            : TilingStatus::NoSolution;
        return result;
    }

    result.status = TilingStatus::Solved;
    result.choices.reserve(placements_.size());
    for (const auto& p : placements_) {
        result.choices.push_back({p.row, p.col, sol->at(p.name())});
    }
    result.visible = count_visible(problem_.landscape, result.choices);
    result.used = count_usage(result.choices);
    return result;
}

std::map<Landscape::Color, int64_t> count_visible(const Landscape& landscape,
                                                  const std::vector<PlacementChoice>& choices) {
    std::map<Landscape::Color, int64_t> visible;
    for (Landscape::Color c = 1; c <= NUM_COLORS; ++c) {
        visible[c] = 0;
    }

    for (const auto& choice : choices) {
        for (size_t r = 0; r < TILE_SIZE; ++r) {
            for (size_t c = 0; c < TILE_SIZE; ++c) {
                auto color = landscape.color(choice.row + r, choice.col + c);
                if (color != Landscape::NONE && !covers(choice.value, r, c)) {
                    visible[color]++;
                }
            }
        }
    }
    return visible;
}

std::array<int64_t, NUM_SHAPES> count_usage(const std::vector<PlacementChoice>& choices) {
    std::array<int64_t, NUM_SHAPES> used{};
    for (const auto& choice : choices) {
        if (auto shape = shape_of(choice.value)) {
            used[static_cast<size_t>(*shape)]++;
        }
    }
    return used;
}

std::string to_string(TilingStatus status) {
    switch (status) {
        case TilingStatus::Solved:         return "Solved";
        case TilingStatus::NoSolution:     return "NoSolution";
        case TilingStatus::InvalidProblem: return "InvalidProblem";
        case TilingStatus::Aborted:        return "Aborted";
    }
    return "";
}

} // namespace tiling
} // namespace tile_csp
