#include <corvo/error.hpp>
#include <corvo/interpreter.hpp>

#include <fmt/format.h>

#include <iostream>
#include <sstream>
#include <string>

// Run Corvo programs from strings and inspect the environment afterwards.
int main() {
    std::ostringstream out;
    std::istringstream in("Ada\n");
    corvo::Interpreter interp(out, in);

    // 1) arithmetic and display
    interp.run_source(R"(
        the price is 12
        the total is price times 3 plus 4
        display "total: " plus total
    )");

    // 2) lists are shared: appending through one name shows through the other
    interp.run_source(R"(
        the scores is [90, 72]
        the same is scores
        append 85 to same
        display scores
        display count of scores
    )");

    // 3) sections, loops and input
    interp.run_source(R"(
        ask "name? " remember as who
        section greet is [
            display "hello " plus who
        ]
        repeat 2 loops greet
    )");

    std::cout << out.str();

    const corvo::Value& total = interp.environment().get("total");
    fmt::print("total = {}\n", corvo::to_display(total)); // 40

    // 4) errors carry the failing line
    try {
        interp.run_source("display 1\ndisplay missing\n");
    } catch (const corvo::Error& e) {
        fmt::print("{}\n", corvo::format_error(e));
    }
    return 0;
}
