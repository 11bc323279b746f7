#include "tile_csp/model.hpp"
#include <stdexcept>
#include <algorithm>
#include <iostream>

namespace tile_csp {

VariablePtr Model::create_variable(std::string name, Domain domain) {
    auto var = std::make_shared<Variable>(std::move(name), std::move(domain));
    add_variable(var);
    return var;
}

VariablePtr Model::create_variable(std::string name, std::vector<Domain::value_type> values) {
    return create_variable(std::move(name), Domain(std::move(values)));
}

size_t Model::add_variable(VariablePtr var) {
    size_t id = variables_.size();
    var->set_id(id);
    name_to_id_[var->name()] = id;
    variables_.push_back(std::move(var));
    assigned_.push_back(false);
    return id;
}

void Model::add_constraint(ConstraintPtr constraint) {
    constraint->set_model_index(constraints_.size());
    constraint_ptrs_.push_back(constraint.get());
    constraints_.push_back(std::move(constraint));
}

const std::vector<VariablePtr>& Model::variables() const {
    return variables_;
}

const std::vector<ConstraintPtr>& Model::constraints() const {
    return constraints_;
}

VariablePtr Model::variable(size_t id) const {
    if (id >= variables_.size()) {
        throw std::out_of_range("Variable ID out of range");
    }
    return variables_[id];
}

VariablePtr Model::variable(const std::string& name) const {
    auto it = name_to_id_.find(name);
    if (it == name_to_id_.end()) {
        throw std::out_of_range("Variable not found: " + name);
    }
    return variables_[it->second];
}

size_t Model::find_variable_index(const std::string& name) const {
    auto it = name_to_id_.find(name);
    if (it != name_to_id_.end()) return it->second;
    return SIZE_MAX;
}

bool Model::remove_value(int save_point, size_t var_idx, Domain::value_type value) {
    auto& domain = variables_[var_idx]->domain();
    size_t idx = domain.index_of(value);
    if (idx == SIZE_MAX) {
        return true;  // 変更不要
    }
    if (domain.size() == 1) {
        return false;  // ドメインが空になる
    }

    domain.remove(value);
    trail_.push_back({save_point, TrailEntry{TrailEntry::Kind::Remove, var_idx, value, idx}});
    notify_domain_change(var_idx);
    return true;
}

bool Model::assign(int save_point, size_t var_idx, Domain::value_type value) {
    const auto& domain = variables_[var_idx]->domain();
    if (!domain.contains(value)) {
        return false;
    }

    // 他の値をすべて削除（1つずつ Trail に積む）
    std::vector<Domain::value_type> others;
    others.reserve(domain.size());
    for (auto v : domain) {
        if (v != value) others.push_back(v);
    }
    for (auto v : others) {
        if (!remove_value(save_point, var_idx, v)) {
            return false;
        }
    }

    if (!assigned_[var_idx]) {
        assigned_[var_idx] = true;
        assigned_count_++;
        trail_.push_back({save_point, TrailEntry{TrailEntry::Kind::Assign, var_idx, value, 0}});
    }
    return true;
}

void Model::rewind_to(int save_point) {
    while (!trail_.empty() && trail_.back().first > save_point) {
        const TrailEntry entry = trail_.back().second;
        trail_.pop_back();

        if (entry.kind == TrailEntry::Kind::Assign) {
            assigned_[entry.var_idx] = false;
            assigned_count_--;
            continue;
        }

        variables_[entry.var_idx]->domain().restore(entry.value, entry.old_index);
        notify_domain_change(entry.var_idx);
    }
}

void Model::notify_domain_change(size_t var_idx) {
    if (var_idx >= var_to_constraint_indices_.size()) {
        return;  // ウォッチリスト構築前
    }
    for (const auto& w : var_to_constraint_indices_[var_idx]) {
        constraint_ptrs_[w.constraint_idx]->on_domain_change(w.internal_var_idx);
    }
}

void Model::sync_constraints() {
    for (size_t i = 0; i < variables_.size(); ++i) {
        notify_domain_change(i);
    }
}

void Model::build_constraint_watch_list() {
    // 変数インデックス → 関連する制約インデックスのリスト
    var_to_constraint_indices_.clear();
    var_to_constraint_indices_.resize(variables_.size());

    for (size_t c_idx = 0; c_idx < constraints_.size(); ++c_idx) {
        const auto& constraint = constraints_[c_idx];
        const auto& vars = constraint->variables();

        for (size_t i = 0; i < vars.size(); ++i) {
            // 変数の ID を直接インデックスとして使用
            size_t v_idx = vars[i]->id();
            if (v_idx < var_to_constraint_indices_.size()) {
                var_to_constraint_indices_[v_idx].push_back({c_idx, i});
            } else {
                std::cerr << "% [watchlist] WARNING: var " << vars[i]->name()
                          << " id=" << v_idx << " >= variables_.size()=" << variables_.size()
                          << " in constraint #" << c_idx << " (" << constraint->name() << ")\n";
            }
        }
    }
}

void Model::build_arcs() {
    arcs_.clear();
    arcs_into_.assign(variables_.size(), {});
    arcs_from_.assign(variables_.size(), {});
    neighbors_.assign(variables_.size(), {});

    // (小さいID, 大きいID) → arcs_ 上の (a → b) アークのインデックス
    // (b → a) はその次に置く
    std::map<std::pair<size_t, size_t>, size_t> pair_to_arc;

    for (size_t c_idx = 0; c_idx < constraints_.size(); ++c_idx) {
        const auto& constraint = constraints_[c_idx];
        const auto& vars = constraint->variables();

        std::vector<size_t> coupled;
        for (size_t i = 0; i < vars.size(); ++i) {
            if (constraint->couples(i)) {
                coupled.push_back(i);
            }
        }

        for (size_t p = 0; p < coupled.size(); ++p) {
            for (size_t q = p + 1; q < coupled.size(); ++q) {
                size_t ip = coupled[p];
                size_t iq = coupled[q];
                size_t vp = vars[ip]->id();
                size_t vq = vars[iq]->id();
                if (vp == vq) continue;
                if (vp > vq) {
                    std::swap(vp, vq);
                    std::swap(ip, iq);
                }

                auto key = std::make_pair(vp, vq);
                auto it = pair_to_arc.find(key);
                size_t arc_idx;
                if (it == pair_to_arc.end()) {
                    arc_idx = arcs_.size();
                    pair_to_arc.emplace(key, arc_idx);
                    arcs_.push_back(Arc{vp, vq, {}});
                    arcs_.push_back(Arc{vq, vp, {}});
                } else {
                    arc_idx = it->second;
                }
                arcs_[arc_idx].links.push_back({c_idx, ip, iq});
                arcs_[arc_idx + 1].links.push_back({c_idx, iq, ip});
            }
        }
    }

    for (size_t a = 0; a < arcs_.size(); ++a) {
        arcs_from_[arcs_[a].from].push_back(a);
        arcs_into_[arcs_[a].to].push_back(a);
        neighbors_[arcs_[a].from].push_back(arcs_[a].to);
    }
    for (auto& n : neighbors_) {
        std::sort(n.begin(), n.end());
    }
}

} // namespace tile_csp
