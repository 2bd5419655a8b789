#include <gtest/gtest.h>
#include <corvo/error.hpp>
#include <corvo/interpreter.hpp>

#include <sstream>
#include <string>
#include <utility>

namespace {

using namespace corvo;

std::string run(const std::string& src, const std::string& input = "", Config cfg = {}) {
    std::ostringstream out;
    std::istringstream in(input);
    Interpreter interp(out, in, cfg);
    interp.run_source(src);
    return out.str();
}

// Runs `src`, expecting it to fail; returns the error's kind and line.
template <class E>
std::pair<ErrorKind, int> run_error(const std::string& src, Config cfg = {}) {
    try {
        run(src, "", cfg);
    } catch (const E& e) {
        return {e.kind(), e.line()};
    }
    ADD_FAILURE() << "no error raised by:\n" << src;
    return {ErrorKind::Syntax, -2};
}

TEST(Interpreter, Arithmetic) {
    EXPECT_EQ(run("display 1 plus 2 times 3"), "7\n");
    EXPECT_EQ(run("display (1 plus 2) times 3"), "9\n");
    EXPECT_EQ(run("display 10 divided by 4"), "2.5\n");
    EXPECT_EQ(run("the a is 7\nthe b is 3\ndisplay a minus b plus b"), "7\n");
    EXPECT_EQ(run("display 2 minus 5"), "-3\n");
    EXPECT_EQ(run("display 100000000000000000000"), "100000000000000000000\n");
}

TEST(Interpreter, PlusConcatenatesWhenEitherSideIsText) {
    EXPECT_EQ(run("display \"n=\" plus 5"), "n=5\n");
    EXPECT_EQ(run("display 5 plus \" apples\""), "5 apples\n");
    EXPECT_EQ(run("display \"list: \" plus [1, 2]"), "list: [1, 2]\n");
    EXPECT_EQ(run_error<TypeMismatchError>("display [1] plus 2").first, ErrorKind::TypeMismatch);
    EXPECT_EQ(run_error<TypeMismatchError>("display \"a\" minus 1").first, ErrorKind::TypeMismatch);
}

TEST(Interpreter, NoNaNOrInfinityIsEverProduced) {
    auto e = run_error<InvalidArgumentError>("display 1\ndisplay 1 divided by 0");
    EXPECT_EQ(e.first, ErrorKind::InvalidArgument);
    EXPECT_EQ(e.second, 2);

    EXPECT_EQ(run_error<InvalidArgumentError>("display 0 divided by 0").first, ErrorKind::InvalidArgument);
    EXPECT_EQ(run_error<InvalidArgumentError>("the x is 10\nrepeat 400 loops the x is x times 10").second, 2);
}

TEST(Interpreter, IfOtherwise) {
    const std::string prog = "if x is greater than 3 then display \"big\" otherwise display \"small\"";
    EXPECT_EQ(run("the x is 5\n" + prog), "big\n");
    EXPECT_EQ(run("the x is 2\n" + prog), "small\n");
    EXPECT_EQ(run("the x is 2\nif x is equal to 3 then display 1"), "");
    EXPECT_EQ(run("if \"a\" is equal to \"a\" then display \"same\""), "same\n");
}

TEST(Interpreter, ConditionsCombine) {
    EXPECT_EQ(run("if 1 is equal to 1 and 2 is less than 1 then display 1 otherwise display 0"), "0\n");
    // and binds tighter: T or (F and F)
    EXPECT_EQ(run("if 1 is equal to 1 or 1 is equal to 2 and 1 is equal to 2 then display \"yes\""), "yes\n");
    // right side never evaluated
    EXPECT_EQ(run("if 1 is equal to 2 and missing is equal to 1 then display 1 otherwise display 2"), "2\n");
    EXPECT_EQ(run("if 1 is equal to 1 or missing is equal to 1 then display 1"), "1\n");
}

TEST(Interpreter, ComparisonsNeedMatchingKinds) {
    EXPECT_EQ(run_error<TypeMismatchError>("if \"a\" is equal to 1 then display 1").first, ErrorKind::TypeMismatch);
    EXPECT_EQ(run_error<TypeMismatchError>("if \"a\" is greater than \"b\" then display 1").first,
              ErrorKind::TypeMismatch);
}

TEST(Interpreter, ConditionInValuePositionIsOneOrZero) {
    std::ostringstream out;
    std::istringstream in;
    Interpreter interp(out, in);

    auto one = make_expr(ast::Literal{Value{1.0}}, 1);
    auto two = make_expr(ast::Literal{Value{2.0}}, 1);
    auto less = make_expr(ast::Binary{BinOp::IsLess, one, two}, 1);
    auto greater = make_expr(ast::Binary{BinOp::IsGreater, one, two}, 1);

    EXPECT_DOUBLE_EQ(std::get<double>(interp.evaluate(*less)), 1.0);
    EXPECT_DOUBLE_EQ(std::get<double>(interp.evaluate(*greater)), 0.0);
    EXPECT_TRUE(interp.test(*less));
    EXPECT_THROW(interp.test(*one), TypeMismatchError);
}

TEST(Interpreter, Repeat) {
    EXPECT_EQ(run("repeat 0 loops display \"x\""), "");
    EXPECT_EQ(run("repeat 3 loops display \"x\""), "x\nx\nx\n");
    EXPECT_EQ(run("repeat 2.7 loops: [ display \"x\" ]"), "x\nx\n");
    EXPECT_EQ(run_error<InvalidArgumentError>("repeat 0 minus 1 loops display 1").first,
              ErrorKind::InvalidArgument);
    EXPECT_EQ(run_error<TypeMismatchError>("repeat \"3\" loops display 1").first, ErrorKind::TypeMismatch);
    EXPECT_EQ(run_error<InvalidArgumentError>("display 1\nrepeat 100000000000000000000 loops display 1").second, 2);
}

TEST(Interpreter, While) {
    EXPECT_EQ(run("the i is 0\nwhile i is less than 3 do [ display i the i is i plus 1 ]"), "0\n1\n2\n");
    EXPECT_EQ(run("while 1 is equal to 2 do display 1"), "");
}

TEST(Interpreter, WhileLimitStopsRunawayLoop) {
    Config cfg;
    cfg.while_limit = 5;
    EXPECT_EQ(run("the i is 0\nwhile 1 is equal to 1 do the i is i plus 1\ndisplay i", "", cfg), "5\n");
}

TEST(Interpreter, ForEachIteratesSnapshot) {
    EXPECT_EQ(run("for each item in [1, 2, 3] : [ display item ]"), "1\n2\n3\n");
    EXPECT_EQ(run("the xs is [1, 2, 3]\n"
                  "for each x in xs [ append x to xs ]\n"
                  "display count of xs\n"
                  "display x"),
              "6\n3\n");
    EXPECT_EQ(run_error<TypeMismatchError>("for each c in \"abc\" display c").first, ErrorKind::TypeMismatch);
}

TEST(Interpreter, Sections) {
    EXPECT_EQ(run("section greet is [ display \"hi\" ]\ngreet\ngreet"), "hi\nhi\n");
    EXPECT_EQ(run("the n is 1\nsection bump is the n is n plus 1\nbump\nbump\ndisplay n"), "3\n");
    EXPECT_EQ(run("section s is display 1\nsection s is display 2\ns"), "2\n");
    EXPECT_EQ(run("the n is 3\n"
                  "section down is [\n"
                  "  display n\n"
                  "  the n is n minus 1\n"
                  "  if n is greater than 0 then down\n"
                  "]\n"
                  "down"),
              "3\n2\n1\n");

    auto e = run_error<UndefinedSectionError>("greet\nsection greet is display 1");
    EXPECT_EQ(e.first, ErrorKind::UndefinedSection);
    EXPECT_EQ(e.second, 1);
}

TEST(Interpreter, RecursionLimit) {
    Config cfg;
    cfg.max_call_depth = 50;
    auto e = run_error<RecursionLimitError>("section spin is spin\nspin", cfg);
    EXPECT_EQ(e.first, ErrorKind::RecursionLimit);
    EXPECT_EQ(e.second, 1);
}

TEST(Interpreter, ListAppendRemove) {
    EXPECT_EQ(run("the xs is [1, 2, 3]\nappend 4 to xs\ndisplay xs"), "[1, 2, 3, 4]\n");
    EXPECT_EQ(run("the xs is [1, 2, 3]\nremove 2 from xs\ndisplay xs"), "[1, 3]\n");
    EXPECT_EQ(run("the xs is [1, 2, 1]\nremove 1 from xs\ndisplay xs"), "[2, 1]\n");
    EXPECT_EQ(run("the xs is [[1], [2]]\nremove [2] from xs\ndisplay xs"), "[[1]]\n");
    EXPECT_EQ(run_error<InvalidArgumentError>("the xs is [1]\nremove 5 from xs").second, 2);
    EXPECT_EQ(run_error<TypeMismatchError>("the n is 1\nappend 2 to n").first, ErrorKind::TypeMismatch);
}

TEST(Interpreter, ListsAreSharedByReference) {
    EXPECT_EQ(run("the a is [1]\nthe b is a\nappend 2 to b\ndisplay a"), "[1, 2]\n");
    EXPECT_EQ(run("the a is [1]\nappend a to a\ndisplay a"), "[1, [1]]\n");
}

TEST(Interpreter, ListNestingIsBounded) {
    EXPECT_EQ(run("the a is [1]\nrepeat 200 loops the a is [a]\ndisplay count of a"), "1\n");
    auto e = run_error<InvalidArgumentError>("the a is [1]\nrepeat 300 loops the a is [a]");
    EXPECT_EQ(e.second, 2);
}

TEST(Interpreter, Indexing) {
    const std::string xs = "the xs is [10, 20, 30]\n";
    EXPECT_EQ(run(xs + "display xs at 2"), "20\n");
    EXPECT_EQ(run(xs + "display xs at 1 plus 1"), "11\n");
    EXPECT_EQ(run("the m is [[1, 2], [3, 4]]\ndisplay m at 2 at 1"), "3\n");
    EXPECT_EQ(run(xs + "display count of xs\ndisplay length of \"hello\"\ndisplay length of 12.5"), "3\n5\n4\n");

    EXPECT_EQ(run_error<InvalidIndexError>(xs + "display xs at 0").second, 2);
    EXPECT_EQ(run_error<InvalidIndexError>(xs + "display xs at 4").first, ErrorKind::InvalidIndex);
    EXPECT_EQ(run_error<InvalidIndexError>(xs + "display xs at 1.5").first, ErrorKind::InvalidIndex);
    EXPECT_EQ(run_error<InvalidIndexError>("the e is []\ndisplay e at 1").first, ErrorKind::InvalidIndex);
    EXPECT_EQ(run_error<TypeMismatchError>("display 5 at 1").first, ErrorKind::TypeMismatch);
}

TEST(Interpreter, UndefinedVariableStopsTheRun) {
    std::ostringstream out;
    std::istringstream in;
    Interpreter interp(out, in);
    try {
        interp.run_source("display 1\ndisplay nope\ndisplay 3");
        FAIL() << "expected UndefinedVariableError";
    } catch (const UndefinedVariableError& e) {
        EXPECT_EQ(e.line(), 2);
    }
    EXPECT_EQ(out.str(), "1\n");
}

TEST(Interpreter, SyntaxErrorRunsNothing) {
    std::ostringstream out;
    std::istringstream in;
    Interpreter interp(out, in);
    EXPECT_THROW(interp.run_source("display 1\nthe x"), SyntaxError);
    EXPECT_EQ(out.str(), "");
}

TEST(Interpreter, ErrorsReportInnermostLine) {
    auto e = run_error<InvalidArgumentError>("repeat 1 loops [\n  display 1\n  display 1 divided by 0\n]");
    EXPECT_EQ(e.second, 3);
}

TEST(Interpreter, Ask) {
    EXPECT_EQ(run("ask \"Name? \" remember as who\ndisplay \"Hi \" plus who", "Ada\n"), "Name? Hi Ada\n");
    EXPECT_EQ(run("ask \"\" remember as who\ndisplay who", "Bob\r\n"), "Bob\n");
    EXPECT_EQ(run("ask \"n\" remember as n\ndisplay n plus 1", "42\n"), "n421\n");
    EXPECT_EQ(run("ask \"? \" remember as a\ndisplay length of a", ""), "? 0\n");
    EXPECT_EQ(run_error<TypeMismatchError>("ask 5 remember as x").first, ErrorKind::TypeMismatch);
}

TEST(Interpreter, EnvironmentPersistsAcrossRuns) {
    std::ostringstream out;
    std::istringstream in;
    Interpreter interp(out, in);
    interp.run_source("the total is 4");
    interp.run_source("the total is total times 2");
    EXPECT_DOUBLE_EQ(std::get<double>(interp.environment().get("total")), 8.0);
}

} // namespace
