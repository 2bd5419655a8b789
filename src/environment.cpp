#include "corvo/environment.hpp"
#include "corvo/error.hpp"

#include <utility>

namespace corvo {

const Value& Environment::get(const std::string& name) const {
    auto it = vars_.find(name);
    if (it == vars_.end()) throw UndefinedVariableError("Variable '" + name + "' has not been set");
    return it->second;
}

void Environment::set(const std::string& name, Value v) {
    vars_[name] = std::move(v);
}

void Environment::define_section(const std::string& name, BlockPtr body) {
    sections_[name] = std::move(body);
}

BlockPtr Environment::section(const std::string& name) const {
    auto it = sections_.find(name);
    if (it == sections_.end()) throw UndefinedSectionError("Section '" + name + "' is not defined");
    return it->second;
}

void Environment::clear() {
    vars_.clear();
    sections_.clear();
}

} // namespace corvo
