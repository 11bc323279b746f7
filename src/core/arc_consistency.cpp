#include "tile_csp/arc_consistency.hpp"
#include <vector>

namespace tile_csp {

bool ArcConsistency::propagate(Model& model, int save_point) {
    reset_queue(model);
    enqueue_all(model);
    return run(model, save_point, true);
}

bool ArcConsistency::propagate_assignment(Model& model, int save_point, size_t var_idx) {
    reset_queue(model);
    for (size_t a : model.arcs_into(var_idx)) {
        if (!model.is_assigned(model.arcs()[a].from)) {
            enqueue(a);
        }
    }
    return run(model, save_point, false);
}

bool ArcConsistency::run(Model& model, int save_point, bool full_sweep) {
    const auto& arcs = model.arcs();

    while (true) {
        bool pruned = false;

        while (!queue_.empty()) {
            size_t a = queue_.front();
            queue_.pop_front();
            in_queue_[a] = false;

            bool changed = false;
            if (!revise(model, save_point, a, changed)) {
                clear_queue();
                return false;
            }
            if (!changed) continue;
            pruned = true;

            // from の定義域が変わった → (Z, from) を積み直す（Z != to）
            size_t x = arcs[a].from;
            for (size_t b : model.arcs_into(x)) {
                if (arcs[b].from != arcs[a].to) {
                    enqueue(b);
                }
            }
        }

        bool unary_changed = false;
        if (!node_consistency(model, save_point, unary_changed)) {
            return false;
        }

        if (full_sweep && !pruned && !unary_changed) {
            return true;  // 確認パスで何も削除されなかった → 固定点
        }

        // 他の変数の定義域変化で2項射影が厳しくなっている可能性がある
        enqueue_all(model);
        full_sweep = true;
        stats_.sweep_count++;
    }
}

bool ArcConsistency::revise(Model& model, int save_point, size_t arc_idx, bool& changed) {
    const Arc& arc = model.arcs()[arc_idx];
    stats_.revise_count++;

    const auto& domain = model.variables()[arc.from]->domain();
    std::vector<Domain::value_type> unsupported;
    for (auto vx : domain) {
        if (!has_support(model, arc, vx)) {
            unsupported.push_back(vx);
        }
    }

    for (auto vx : unsupported) {
        if (!model.remove_value(save_point, arc.from, vx)) {
            return false;  // 定義域が空になる
        }
        changed = true;
        stats_.prune_count++;
    }
    return true;
}

bool ArcConsistency::has_support(const Model& model, const Arc& arc, Domain::value_type vx) {
    const auto& constraints = model.constraints();
    const auto& to_domain = model.variables()[arc.to]->domain();

    for (auto vy : to_domain) {
        bool ok = true;
        for (const auto& link : arc.links) {
            if (!constraints[link.constraint_idx]->supports(link.from_internal, vx,
                                                            link.to_internal, vy)) {
                ok = false;
                break;
            }
        }
        if (ok) {
            return true;
        }
    }
    return false;
}

bool ArcConsistency::node_consistency(Model& model, int save_point, bool& changed) {
    const auto& constraints = model.constraints();
    const auto& variables = model.variables();

    for (size_t i = 0; i < variables.size(); ++i) {
        for (const auto& w : model.constraints_for_var(i)) {
            const auto& constraint = constraints[w.constraint_idx];

            std::vector<Domain::value_type> unsupported;
            for (auto v : variables[i]->domain()) {
                if (!constraint->supports(w.internal_var_idx, v)) {
                    unsupported.push_back(v);
                }
            }
            for (auto v : unsupported) {
                if (!model.remove_value(save_point, i, v)) {
                    return false;
                }
                changed = true;
                stats_.prune_count++;
            }
        }
    }

    for (const auto& constraint : constraints) {
        if (!constraint->is_feasible()) {
            return false;
        }
    }
    return true;
}

void ArcConsistency::enqueue(size_t arc_idx) {
    if (in_queue_[arc_idx]) return;
    in_queue_[arc_idx] = true;
    queue_.push_back(arc_idx);
}

void ArcConsistency::enqueue_all(const Model& model) {
    const auto& arcs = model.arcs();
    for (size_t a = 0; a < arcs.size(); ++a) {
        // 割り当て済み変数の整合性は node_consistency で検査される
        if (!model.is_assigned(arcs[a].from)) {
            enqueue(a);
        }
    }
}

void ArcConsistency::reset_queue(const Model& model) {
    if (in_queue_.size() != model.arcs().size()) {
        queue_.clear();
        in_queue_.assign(model.arcs().size(), false);
        return;
    }
    clear_queue();
}

void ArcConsistency::clear_queue() {
    for (size_t a : queue_) {
        in_queue_[a] = false;
    }
    queue_.clear();
}

} // namespace tile_csp
