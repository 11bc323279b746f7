#include <catch2/catch_test_macros.hpp>
#include "tile_csp/solver.hpp"
#include "tile_csp/heuristics.hpp"
#include "tile_csp/model.hpp"

using namespace tile_csp;

namespace {

using Weights = LinearBoundConstraint::WeightTable;

void add_linear(Model& model, std::vector<VariablePtr> vars, std::vector<Weights> weights,
                int64_t lb, int64_t ub) {
    model.add_constraint(std::make_shared<LinearBoundConstraint>(
        std::move(vars), std::move(weights), lb, ub));
}

void prepare(Model& model) {
    model.build_constraint_watch_list();
    model.build_arcs();
    model.sync_constraints();
}

/// x + y == 1, y + z == 1, x + z == 1（0/1 変数では解なし、AC-3 では検出できない）
void build_odd_cycle(Model& model) {
    auto x = model.create_variable("x", Domain(0, 1));
    auto y = model.create_variable("y", Domain(0, 1));
    auto z = model.create_variable("z", Domain(0, 1));
    add_linear(model, {x, y}, {{0, 1}, {0, 1}}, 1, 1);
    add_linear(model, {y, z}, {{0, 1}, {0, 1}}, 1, 1);
    add_linear(model, {x, z}, {{0, 1}, {0, 1}}, 1, 1);
}

} // namespace

// ============================================================================
// HeuristicSelector tests
// ============================================================================

TEST_CASE("HeuristicSelector MRV", "[heuristics][mrv]") {
    Model model;
    model.create_variable("x", Domain(0, 3));
    model.create_variable("y", Domain(0, 1));
    model.create_variable("z", Domain(0, 2));
    prepare(model);

    HeuristicSelector selector;
    REQUIRE(selector.select_variable(model) == 1);

    REQUIRE(model.assign(1, 1, 0));
    REQUIRE(selector.select_variable(model) == 2);
}

TEST_CASE("HeuristicSelector degree tie-break", "[heuristics][degree]") {
    Model model;
    auto x = model.create_variable("x", Domain(0, 1));
    auto y = model.create_variable("y", Domain(0, 1));
    auto z = model.create_variable("z", Domain(0, 1));
    auto w = model.create_variable("w", Domain(0, 1));
    add_linear(model, {y, x}, {{0, 1}, {0, 1}}, 0, 1);
    add_linear(model, {y, z}, {{0, 1}, {0, 1}}, 0, 1);
    add_linear(model, {y, w}, {{0, 1}, {0, 1}}, 0, 1);
    prepare(model);

    HeuristicSelector selector;

    SECTION("degree counts unassigned neighbors") {
        REQUIRE(selector.degree(model, 1) == 3);
        REQUIRE(selector.degree(model, 0) == 1);
        REQUIRE(model.assign(1, 0, 0));
        REQUIRE(selector.degree(model, 1) == 2);
    }

    SECTION("most constrained neighbor count wins a MRV tie") {
        REQUIRE(selector.select_variable(model) == 1);
    }

    SECTION("disabled degree falls back to variable order") {
        selector.set_degree_enabled(false);
        REQUIRE(selector.select_variable(model) == 0);
    }

    SECTION("full ties fall back to variable order") {
        REQUIRE(model.assign(1, 1, 0));
        REQUIRE(selector.select_variable(model) == 0);
    }
}

TEST_CASE("HeuristicSelector returns SIZE_MAX when everything is assigned", "[heuristics]") {
    Model model;
    model.create_variable("x", Domain(0, 1));
    prepare(model);
    REQUIRE(model.assign(1, 0, 1));

    HeuristicSelector selector;
    REQUIRE(selector.select_variable(model) == SIZE_MAX);
}

TEST_CASE("HeuristicSelector LCV ordering", "[heuristics][lcv]") {
    Model model;
    auto x = model.create_variable("x", Domain(0, 2));
    auto y = model.create_variable("y", Domain(0, 2));
    model.create_variable("z", Domain(0, 2));
    // x = 0 は重み 2 なので y の値を最も多く消す
    add_linear(model, {x, y}, {{2, 1, 0}, {0, 1, 2}}, 0, 2);
    prepare(model);

    HeuristicSelector selector;

    SECTION("elimination counts") {
        REQUIRE(selector.count_eliminations(model, 0, 0) == 2);
        REQUIRE(selector.count_eliminations(model, 0, 1) == 1);
        REQUIRE(selector.count_eliminations(model, 0, 2) == 0);
    }

    SECTION("least constraining value first") {
        REQUIRE(selector.order_values(model, 0) == std::vector<Domain::value_type>{2, 1, 0});
    }

    SECTION("ties keep ascending order") {
        REQUIRE(selector.order_values(model, 2) == std::vector<Domain::value_type>{0, 1, 2});
    }

    SECTION("disabled LCV keeps ascending order") {
        selector.set_lcv_enabled(false);
        REQUIRE(selector.order_values(model, 0) == std::vector<Domain::value_type>{0, 1, 2});
    }

    SECTION("assigned neighbors are not counted") {
        REQUIRE(model.assign(1, 1, 0));
        REQUIRE(selector.count_eliminations(model, 0, 0) == 0);
    }
}

// ============================================================================
// Solver tests
// ============================================================================

TEST_CASE("Solver finds the first solution", "[solver]") {
    Model model;
    auto x = model.create_variable("x", Domain(0, 2));
    auto y = model.create_variable("y", Domain(0, 2));
    add_linear(model, {x, y}, {{0, 1, 2}, {0, 1, 2}}, 3, 3);

    Solver solver;
    auto sol = solver.solve(model);

    REQUIRE(sol.has_value());
    REQUIRE(solver.result() == SearchResult::SAT);
    REQUIRE(sol->at("x") + sol->at("y") == 3);
    // MRV・次数が同点なので x が先、LCV も同点なので x = 1 が先
    REQUIRE(sol->at("x") == 1);
    REQUIRE(sol->at("y") == 2);
    REQUIRE(solver.stats().solution_count == 1);
}

TEST_CASE("Solver presolve detects unsatisfiable problems", "[solver]") {
    Model model;
    auto x = model.create_variable("x", Domain(0, 2));
    auto y = model.create_variable("y", Domain(0, 2));
    add_linear(model, {x, y}, {{0, 1, 2}, {0, 1, 2}}, 5, 5);

    Solver solver;
    REQUIRE(!solver.solve(model).has_value());
    REQUIRE(solver.result() == SearchResult::UNSAT);
    REQUIRE(solver.stats().node_count == 0);
}

TEST_CASE("Solver exhausts the search on an odd cycle", "[solver]") {
    Model model;
    build_odd_cycle(model);
    std::vector<std::vector<Domain::value_type>> before;
    for (const auto& var : model.variables()) before.push_back(var->domain().dense());

    Solver solver;
    REQUIRE(!solver.solve(model).has_value());
    REQUIRE(solver.result() == SearchResult::UNSAT);
    REQUIRE(solver.stats().fail_count > 0);
    REQUIRE(solver.stats().node_count >= 1);

    SECTION("state is restored after exhaustion") {
        REQUIRE(model.assigned_count() == 0);
        REQUIRE(model.trail_size() == 0);
        for (size_t i = 0; i < before.size(); ++i) {
            REQUIRE(model.variables()[i]->domain().dense() == before[i]);
        }
    }
}

TEST_CASE("Solver solve_all", "[solver]") {
    Model model;
    auto x = model.create_variable("x", Domain(0, 2));
    auto y = model.create_variable("y", Domain(0, 2));
    add_linear(model, {x, y}, {{0, 1, 2}, {0, 1, 2}}, 2, 2);

    Solver solver;

    SECTION("enumerates every solution") {
        std::vector<Solution> solutions;
        size_t count = solver.solve_all(model, [&solutions](const Solution& sol) {
            solutions.push_back(sol);
            return true;
        });
        REQUIRE(count == 3);
        REQUIRE(solutions.size() == 3);
        for (const auto& sol : solutions) {
            REQUIRE(sol.at("x") + sol.at("y") == 2);
        }
        REQUIRE(solver.result() == SearchResult::SAT);
        REQUIRE(model.assigned_count() == 0);
    }

    SECTION("callback can stop the enumeration") {
        size_t count = solver.solve_all(model, [](const Solution&) { return false; });
        REQUIRE(count == 1);
        REQUIRE(solver.result() == SearchResult::SAT);
    }
}

TEST_CASE("Solver node limit aborts", "[solver][limit]") {
    Model model;
    model.create_variable("x", Domain(0, 1));
    model.create_variable("y", Domain(0, 1));

    Solver solver;
    solver.set_node_limit(1);
    REQUIRE(!solver.solve(model).has_value());
    REQUIRE(solver.result() == SearchResult::UNKNOWN);
    REQUIRE(solver.stats().node_count == 1);
    REQUIRE(model.assigned_count() == 0);
    REQUIRE(model.trail_size() == 0);
}

TEST_CASE("Solver depth limit aborts", "[solver][limit]") {
    Model model;
    model.create_variable("x", Domain(0, 1));
    model.create_variable("y", Domain(0, 1));
    model.create_variable("z", Domain(0, 1));

    Solver solver;
    solver.set_depth_limit(1);
    REQUIRE(!solver.solve(model).has_value());
    REQUIRE(solver.result() == SearchResult::UNKNOWN);
    REQUIRE(solver.stats().max_depth == 1);
}

TEST_CASE("Solver stop flag", "[solver][limit]") {
    Model model;
    model.create_variable("x", Domain(0, 1));

    Solver solver;
    solver.stop();
    REQUIRE(solver.is_stopped());
    REQUIRE(!solver.solve(model).has_value());
    REQUIRE(solver.result() == SearchResult::UNKNOWN);

    solver.reset_stop();
    REQUIRE(!solver.is_stopped());
    auto sol = solver.solve(model);
    REQUIRE(sol.has_value());
    REQUIRE(solver.result() == SearchResult::SAT);
}

TEST_CASE("Solver heuristics can be disabled", "[solver]") {
    Model model;
    auto x = model.create_variable("x", Domain(0, 2));
    auto y = model.create_variable("y", Domain(0, 2));
    auto z = model.create_variable("z", Domain(0, 2));
    add_linear(model, {x, y, z}, {{0, 1, 2}, {0, 1, 2}, {0, 1, 2}}, 3, 3);
    add_linear(model, {x, z}, {{0, 1, 2}, {0, 1, 2}}, 0, 1);

    Solver solver;
    solver.set_degree_enabled(false);
    solver.set_lcv_enabled(false);
    auto sol = solver.solve(model);

    REQUIRE(sol.has_value());
    REQUIRE(sol->at("x") + sol->at("y") + sol->at("z") == 3);
    REQUIRE(sol->at("x") + sol->at("z") <= 1);
    REQUIRE(solver.stats().max_depth <= 3);
}
