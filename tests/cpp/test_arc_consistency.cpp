#include <catch2/catch_test_macros.hpp>
#include "tile_csp/arc_consistency.hpp"
#include "tile_csp/model.hpp"
#include "tile_csp/solver.hpp"
#include <set>

using namespace tile_csp;

namespace {

using Weights = LinearBoundConstraint::WeightTable;
using LinearPtr = std::shared_ptr<LinearBoundConstraint>;

LinearPtr add_linear(Model& model, std::vector<VariablePtr> vars, std::vector<Weights> weights,
                     int64_t lb, int64_t ub) {
    auto c = std::make_shared<LinearBoundConstraint>(std::move(vars), std::move(weights), lb, ub);
    model.add_constraint(c);
    return c;
}

void prepare(Model& model) {
    model.build_constraint_watch_list();
    model.build_arcs();
    model.sync_constraints();
}

std::vector<std::vector<Domain::value_type>> snapshot(const Model& model) {
    std::vector<std::vector<Domain::value_type>> dense;
    for (const auto& var : model.variables()) {
        dense.push_back(var->domain().dense());
    }
    return dense;
}

/// 全割り当てを列挙して制約を直接評価する
std::set<std::vector<Domain::value_type>> brute_force(const Model& model,
                                                      const std::vector<LinearPtr>& constraints) {
    std::set<std::vector<Domain::value_type>> solutions;
    const auto& vars = model.variables();
    std::vector<std::vector<Domain::value_type>> values;
    for (const auto& v : vars) values.push_back(v->domain().values());

    std::vector<size_t> pos(vars.size(), 0);
    while (true) {
        std::vector<Domain::value_type> assignment;
        for (size_t i = 0; i < vars.size(); ++i) assignment.push_back(values[i][pos[i]]);

        bool ok = true;
        for (const auto& c : constraints) {
            int64_t sum = 0;
            const auto& cv = c->variables();
            for (size_t i = 0; i < cv.size(); ++i) {
                sum += c->weight(i, assignment[cv[i]->id()]);
            }
            if (sum < c->lower_bound() || sum > c->upper_bound()) {
                ok = false;
                break;
            }
        }
        if (ok) solutions.insert(assignment);

        size_t k = 0;
        while (k < vars.size() && ++pos[k] == values[k].size()) {
            pos[k] = 0;
            ++k;
        }
        if (k == vars.size()) break;
    }
    return solutions;
}

} // namespace

// ============================================================================
// Pruning
// ============================================================================

TEST_CASE("ArcConsistency node consistency prunes unreachable values", "[ac3]") {
    Model model;
    auto x = model.create_variable("x", Domain(0, 2));
    auto y = model.create_variable("y", Domain(0, 2));
    add_linear(model, {x, y}, {{0, 1, 2}, {0, 1, 2}}, 4, 4);
    prepare(model);

    ArcConsistency ac;
    REQUIRE(ac.propagate(model, 0));
    REQUIRE(x->domain().values() == std::vector<Domain::value_type>{2});
    REQUIRE(y->domain().values() == std::vector<Domain::value_type>{2});
    REQUIRE(ac.stats().prune_count == 4);
}

TEST_CASE("ArcConsistency arc revision needs all shared constraints at once", "[ac3]") {
    Model model;
    auto x = model.create_variable("x", Domain(0, 2));
    auto y = model.create_variable("y", Domain(0, 2));
    // x + y == 2 かつ x - y == 0 → x = y = 1 のみ
    add_linear(model, {x, y}, {{0, 1, 2}, {0, 1, 2}}, 2, 2);
    add_linear(model, {x, y}, {{0, 1, 2}, {0, -1, -2}}, 0, 0);
    prepare(model);

    SECTION("each constraint alone has full unary support") {
        for (const auto& c : model.constraints()) {
            for (Domain::value_type v = 0; v <= 2; ++v) {
                REQUIRE(c->supports(0, v));
            }
        }
    }

    SECTION("the arc carrying both constraints prunes") {
        REQUIRE(model.arcs().size() == 2);
        ArcConsistency ac;
        bool changed = false;
        REQUIRE(ac.revise(model, 0, 0, changed));
        REQUIRE(changed);
        REQUIRE(x->domain().values() == std::vector<Domain::value_type>{1});
    }

    SECTION("propagate reaches the fixpoint") {
        ArcConsistency ac;
        REQUIRE(ac.propagate(model, 0));
        REQUIRE(x->domain().values() == std::vector<Domain::value_type>{1});
        REQUIRE(y->domain().values() == std::vector<Domain::value_type>{1});
    }
}

TEST_CASE("ArcConsistency has_support", "[ac3]") {
    Model model;
    auto x = model.create_variable("x", Domain(0, 1));
    auto y = model.create_variable("y", Domain(0, 1));
    add_linear(model, {x, y}, {{0, 1}, {0, 1}}, 0, 1);
    prepare(model);

    const Arc& arc = model.arcs()[0];
    REQUIRE(ArcConsistency::has_support(model, arc, 0));
    REQUIRE(ArcConsistency::has_support(model, arc, 1));  // y = 0 が支持

    REQUIRE(model.remove_value(1, 1, 0));
    REQUIRE(!ArcConsistency::has_support(model, arc, 1));
}

// ============================================================================
// Contradiction
// ============================================================================

TEST_CASE("ArcConsistency detects contradiction", "[ac3]") {
    Model model;
    auto x = model.create_variable("x", Domain(0, 2));
    auto y = model.create_variable("y", Domain(0, 2));
    add_linear(model, {x, y}, {{0, 1, 2}, {0, 1, 2}}, 5, 5);
    prepare(model);

    ArcConsistency ac;
    REQUIRE(!ac.propagate(model, 0));
}

TEST_CASE("ArcConsistency contradiction after assignment", "[ac3]") {
    Model model;
    auto x = model.create_variable("x", Domain(0, 1));
    auto y = model.create_variable("y", Domain(0, 1));
    auto z = model.create_variable("z", Domain(0, 1));
    add_linear(model, {x, y, z}, {{0, 1}, {0, 1}, {0, 1}}, 1, 1);
    add_linear(model, {y, z}, {{0, 1}, {0, 1}}, 1, 1);
    prepare(model);

    ArcConsistency ac;
    REQUIRE(ac.propagate(model, 0));
    auto before = snapshot(model);

    // x = 1 なら y + z == 0 だが y + z == 1
    REQUIRE(model.assign(1, 0, 1));
    REQUIRE(!ac.propagate_assignment(model, 1, 0));

    model.rewind_to(0);
    REQUIRE(snapshot(model) == before);
}

TEST_CASE("ArcConsistency propagates through shrinking running sums", "[ac3]") {
    Model model;
    auto x = model.create_variable("x", Domain(0, 1));
    auto y = model.create_variable("y", Domain(0, 1));
    auto z = model.create_variable("z", Domain(0, 1));
    add_linear(model, {x, y, z}, {{0, 1}, {0, 1}, {0, 1}}, 0, 2);
    add_linear(model, {y, z}, {{0, 1}, {0, 1}}, 2, 2);
    prepare(model);

    ArcConsistency ac;
    REQUIRE(ac.propagate(model, 0));
    REQUIRE(y->domain().values() == std::vector<Domain::value_type>{1});
    REQUIRE(z->domain().values() == std::vector<Domain::value_type>{1});
    REQUIRE(x->domain().values() == std::vector<Domain::value_type>{0});
}

// ============================================================================
// Idempotence and undo
// ============================================================================

TEST_CASE("ArcConsistency is idempotent", "[ac3]") {
    Model model;
    std::vector<VariablePtr> vars;
    for (int i = 0; i < 4; ++i) {
        vars.push_back(model.create_variable("v" + std::to_string(i), Domain(0, 3)));
    }
    add_linear(model, vars, {{0, 1, 2, 3}, {0, 1, 2, 3}, {0, 1, 2, 3}, {0, 1, 2, 3}}, 9, 9);
    add_linear(model, {vars[0], vars[1]}, {{0, 1, 2, 3}, {0, 1, 2, 3}}, 0, 2);
    add_linear(model, {vars[2], vars[3]}, {{0, 2, 0, 2}, {0, 0, 1, 1}}, 3, 3);
    prepare(model);

    ArcConsistency ac;
    REQUIRE(ac.propagate(model, 0));
    size_t pruned = ac.stats().prune_count;
    REQUIRE(pruned > 0);
    REQUIRE(ac.stats().sweep_count >= 1);
    auto after_first = snapshot(model);

    REQUIRE(ac.propagate(model, 0));
    REQUIRE(ac.stats().prune_count == pruned);
    REQUIRE(snapshot(model) == after_first);
}

TEST_CASE("ArcConsistency without pruning needs no confirming sweep", "[ac3]") {
    Model model;
    auto x = model.create_variable("x", Domain(0, 2));
    auto y = model.create_variable("y", Domain(0, 2));
    add_linear(model, {x, y}, {{0, 1, 2}, {0, 1, 2}}, 0, 4);
    prepare(model);

    ArcConsistency ac;
    REQUIRE(ac.propagate(model, 0));
    REQUIRE(ac.stats().prune_count == 0);
    REQUIRE(ac.stats().sweep_count == 0);
    REQUIRE(ac.stats().revise_count == 2);
}

TEST_CASE("ArcConsistency pruning is undone by rewind", "[ac3][trail]") {
    Model model;
    auto x = model.create_variable("x", Domain(0, 2));
    auto y = model.create_variable("y", Domain(0, 2));
    auto z = model.create_variable("z", Domain(0, 2));
    auto c = add_linear(model, {x, y, z}, {{0, 1, 2}, {0, 1, 2}, {0, 1, 2}}, 3, 3);
    prepare(model);

    ArcConsistency ac;
    REQUIRE(ac.propagate(model, 0));
    auto before = snapshot(model);
    int64_t lo = c->min_sum();
    int64_t hi = c->max_sum();

    REQUIRE(model.assign(1, 0, 2));
    REQUIRE(ac.propagate_assignment(model, 1, 0));
    REQUIRE(y->domain().values() == std::vector<Domain::value_type>{0, 1});
    REQUIRE(z->domain().values() == std::vector<Domain::value_type>{0, 1});

    model.rewind_to(0);
    REQUIRE(snapshot(model) == before);
    REQUIRE(c->min_sum() == lo);
    REQUIRE(c->max_sum() == hi);
    REQUIRE(!model.is_assigned(0));
}

// ============================================================================
// Soundness
// ============================================================================

TEST_CASE("ArcConsistency never removes a value of a solution", "[ac3][soundness]") {
    Model model;
    auto a = model.create_variable("a", Domain(0, 2));
    auto b = model.create_variable("b", Domain(0, 2));
    auto c = model.create_variable("c", Domain(0, 2));
    auto d = model.create_variable("d", Domain(0, 2));
    std::vector<LinearPtr> constraints{
        add_linear(model, {a, b, c, d}, {{0, 1, 2}, {0, 1, 2}, {0, 1, 2}, {0, 1, 2}}, 5, 5),
        add_linear(model, {a, b}, {{0, 1, 2}, {0, 1, 2}}, 0, 1),
        add_linear(model, {c, d}, {{0, 2, 4}, {0, 1, 2}}, 3, 6),
    };
    auto expected = brute_force(model, constraints);
    REQUIRE(expected.size() == 2);

    SECTION("propagation keeps every solution value") {
        prepare(model);
        ArcConsistency ac;
        REQUIRE(ac.propagate(model, 0));
        for (const auto& sol : expected) {
            for (size_t i = 0; i < sol.size(); ++i) {
                REQUIRE(model.contains(i, sol[i]));
            }
        }
    }

    SECTION("search enumerates exactly the brute-force solutions") {
        Solver solver;
        std::set<std::vector<Domain::value_type>> found;
        size_t count = solver.solve_all(model, [&found](const Solution& sol) {
            found.insert({sol.at("a"), sol.at("b"), sol.at("c"), sol.at("d")});
            return true;
        });
        REQUIRE(count == expected.size());
        REQUIRE(found == expected);
        REQUIRE(solver.result() == SearchResult::SAT);
    }
}

TEST_CASE("ArcConsistency empties only unsatisfiable instances", "[ac3][soundness]") {
    Model model;
    auto a = model.create_variable("a", Domain(0, 2));
    auto b = model.create_variable("b", Domain(0, 2));
    auto c = model.create_variable("c", Domain(0, 2));
    std::vector<LinearPtr> constraints{
        add_linear(model, {a, b, c}, {{0, 1, 2}, {0, 1, 2}, {0, 1, 2}}, 5, 5),
        add_linear(model, {a, b}, {{0, 1, 2}, {0, 1, 2}}, 0, 1),
        add_linear(model, {c}, {{0, 1, 2}}, 0, 2),
    };
    REQUIRE(brute_force(model, constraints).empty());

    prepare(model);
    ArcConsistency ac;
    REQUIRE(!ac.propagate(model, 0));
}
