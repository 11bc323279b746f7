#include "tile_csp/variable.hpp"

namespace tile_csp {

Variable::Variable(std::string name, Domain domain)
    : name_(std::move(name)), domain_(std::move(domain)) {}

const std::string& Variable::name() const {
    return name_;
}

Domain& Variable::domain() {
    return domain_;
}

const Domain& Variable::domain() const {
    return domain_;
}

} // namespace tile_csp
