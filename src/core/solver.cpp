#include "tile_csp/solver.hpp"
#include <algorithm>
#include <iostream>

namespace tile_csp {

std::optional<Solution> Solver::solve(Model& model) {
    std::optional<Solution> solution;

    stats_ = SolverStats{};
    propagator_.reset_stats();

    if (!presolve(model)) {
        if (verbose_) std::cerr << "% [verbose] presolve failed\n";
        result_ = SearchResult::UNSAT;
        collect_propagation_stats();
        return std::nullopt;
    }

    result_ = run_search(model, [&solution](const Solution& sol) {
        solution = sol;
        return false;  // 最初の解で停止
    });

    collect_propagation_stats();
    return solution;
}

size_t Solver::solve_all(Model& model, SolutionCallback callback) {
    stats_ = SolverStats{};
    propagator_.reset_stats();

    if (!presolve(model)) {
        if (verbose_) std::cerr << "% [verbose] presolve failed\n";
        result_ = SearchResult::UNSAT;
        collect_propagation_stats();
        return 0;
    }

    result_ = run_search(model, callback);

    // 全解探索を尽くした場合でも解があれば SAT
    if (result_ == SearchResult::UNSAT && stats_.solution_count > 0) {
        result_ = SearchResult::SAT;
    }

    collect_propagation_stats();
    return stats_.solution_count;
}

bool Solver::presolve(Model& model) {
    model.build_constraint_watch_list();
    model.build_arcs();
    model.sync_constraints();

    if (verbose_) {
        std::cerr << "% [verbose] presolve start: " << model.constraints().size()
                  << " constraints, " << model.variables().size() << " variables, "
                  << model.arcs().size() << " arcs\n";
    }

    if (!propagator_.propagate(model, 0)) {
        return false;
    }

    if (verbose_) {
        size_t remaining = 0;
        for (const auto& var : model.variables()) {
            remaining += var->domain().size();
        }
        std::cerr << "% [verbose] presolve done: pruned=" << propagator_.stats().prune_count
                  << " remaining_values=" << remaining << "\n";
    }
    return true;
}

SearchResult Solver::run_search(Model& model, const SolutionCallback& callback) {
    const size_t num_vars = model.variables().size();

    std::vector<SearchFrame> stack;
    stack.reserve(num_vars);
    SearchState state = SearchState::Active;
    bool expand = true;  // 新しいノードに到達した

    while (state == SearchState::Active) {
        if (expand) {
            expand = false;

            if (should_abort(stack.size())) {
                model.rewind_to(0);
                if (verbose_) {
                    std::cerr << "% [verbose] search aborted: nodes=" << stats_.node_count
                              << " depth=" << stack.size() << "\n";
                }
                return SearchResult::UNKNOWN;
            }

            stats_.node_count++;
            stats_.max_depth = std::max(stats_.max_depth, stack.size());

            if (model.assigned_count() == num_vars) {
                if (verify_solution(model)) {
                    stats_.solution_count++;
                    if (!callback(build_solution(model))) {
                        state = SearchState::Success;
                        continue;
                    }
                } else {
                    stats_.fail_count++;
                }
                // 全解探索の継続、または検証失敗 → 現在のフレームの次の値へ
            } else {
                SearchFrame frame;
                frame.var_idx = selector_.select_variable(model);
                frame.values = selector_.order_values(model, frame.var_idx);
                frame.save_point = static_cast<int>(stack.size()) + 1;
                stack.push_back(std::move(frame));
            }
        }

        if (stack.empty()) {
            state = SearchState::Failure;
            continue;
        }

        SearchFrame& top = stack.back();

        // 前の値の割り当てと伝播（より深いフレームの分も含む）を取り消す
        model.rewind_to(top.save_point - 1);

        if (top.next >= top.values.size()) {
            stack.pop_back();
            stats_.fail_count++;
            continue;
        }

        auto val = top.values[top.next++];
        if (!model.assign(top.save_point, top.var_idx, val)) {
            continue;
        }
        if (!propagator_.propagate_assignment(model, top.save_point, top.var_idx)) {
            stats_.fail_count++;
            continue;
        }
        expand = true;
    }

    if (verbose_) {
        std::cerr << "% [verbose] search " << (state == SearchState::Success ? "succeeded" : "exhausted")
                  << ": nodes=" << stats_.node_count
                  << " fails=" << stats_.fail_count
                  << " max_depth=" << stats_.max_depth << "\n";
    }

    return state == SearchState::Success ? SearchResult::SAT : SearchResult::UNSAT;
}

bool Solver::should_abort(size_t depth) const {
    if (stopped_) {
        return true;
    }
    if (node_limit_ > 0 && stats_.node_count >= node_limit_) {
        return true;
    }
    if (depth_limit_ > 0 && depth > depth_limit_) {
        return true;
    }
    return false;
}

Solution Solver::build_solution(const Model& model) const {
    Solution sol;
    const auto& variables = model.variables();
    for (size_t i = 0; i < variables.size(); ++i) {
        if (model.is_assigned(i)) {
            sol[variables[i]->name()] = model.value(i);
        }
    }
    return sol;
}

bool Solver::verify_solution(const Model& model) const {
    for (const auto& constraint : model.constraints()) {
        auto satisfied = constraint->is_satisfied();
        if (!satisfied.value_or(false)) {
            return false;
        }
    }
    return true;
}

void Solver::collect_propagation_stats() {
    stats_.revise_count = propagator_.stats().revise_count;
    stats_.prune_count = propagator_.stats().prune_count;
}

} // namespace tile_csp
