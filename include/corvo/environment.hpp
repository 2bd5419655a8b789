#pragma once

#include <map>
#include <string>

#include "corvo/program.hpp"
#include "corvo/value.hpp"

namespace corvo {

/// Variable and section tables for one program run. Loop and section bodies
/// all read and write this single table; there is no nested scope.
class Environment {
public:
    /// Throws UndefinedVariableError if `name` was never assigned.
    const Value& get(const std::string& name) const;
    void set(const std::string& name, Value v);
    bool has(const std::string& name) const { return vars_.count(name) != 0; }

    /// Last definition wins.
    void define_section(const std::string& name, BlockPtr body);
    /// Throws UndefinedSectionError.
    BlockPtr section(const std::string& name) const;
    bool has_section(const std::string& name) const { return sections_.count(name) != 0; }

    const std::map<std::string, Value>& variables() const noexcept { return vars_; }
    void clear();

private:
    std::map<std::string, Value> vars_;
    std::map<std::string, BlockPtr> sections_;
};

} // namespace corvo
