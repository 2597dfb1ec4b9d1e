#include "edakari/variable.hpp"

namespace edakari {

Variable::Variable(std::string name, Domain domain)
    : name_(std::move(name)), domain_(std::move(domain)) {}

} // namespace edakari
