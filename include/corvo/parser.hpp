#pragma once
#include <string_view>
#include "corvo/grammar.hpp"
#include "corvo/program.hpp"

namespace corvo {

// Map a "start" parse tree onto typed statements. Single-statement bodies
// become one-element blocks.
Program build_program(const ParseNode& root);

// parse_tree + build_program. Throws SyntaxError; nothing is executed.
Program parse(std::string_view source);

} // namespace corvo
