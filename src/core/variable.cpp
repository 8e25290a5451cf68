#include "puzzle_validator/variable.hpp"

namespace puzzle_validator {

Variable::Variable(size_t id, std::string name, Domain domain)
    : id_(id), name_(std::move(name)), domain_(std::move(domain)) {}

const std::string& Variable::name() const {
    return name_;
}

const Domain& Variable::domain() const {
    return domain_;
}

} // namespace puzzle_validator
