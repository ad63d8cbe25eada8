#include "catch2/catch.hpp"

#include <cstring>
#include <qgen/util/Diagnostic.hpp>
#include <qgen/util/Position.hpp>
#include <sstream>


using namespace qg;


TEST_CASE("Position", "[core][util][Position]")
{
    Position unknown("orders.model");
    CHECK(strcmp(unknown.name, "orders.model") == 0);
    CHECK(unknown.line == 0);
    CHECK(unknown.column == 0);

    Position pos("orders.model", 7, 12);
    CHECK(to_string(pos) == "orders.model:7:12");

    CHECK(pos == Position("orders.model", 7, 12));
    CHECK(pos != Position("orders.model", 7, 13));
    CHECK(pos != Position("items.model", 7, 12));
}

TEST_CASE("Diagnostic", "[core][util][Diagnostic]")
{
    std::ostringstream out, err;
    Diagnostic diag(false, out, err);
    Position pos("orders.model", 3, 1);

    diag.n(pos) << "a note\n";
    diag.w(pos) << "a warning\n";
    diag.e(pos) << "an error\n";
    diag.err() << "another error\n";

    CHECK(out.str() == "orders.model:3:1: note: a note\n");
    CHECK(err.str() ==
"orders.model:3:1: warning: a warning\n"
"orders.model:3:1: error: an error\n"
"error: another error\n");
    CHECK(diag.num_warnings() == 1);
    CHECK(diag.num_errors() == 2);

    diag.clear();
    CHECK(diag.num_warnings() == 0);
    CHECK(diag.num_errors() == 0);

    SECTION("colors")
    {
        std::ostringstream colored_out, colored_err;
        Diagnostic colored(true, colored_out, colored_err);
        colored.e(pos) << "an error\n";
        CHECK(colored_err.str().find(Diagnostic::ERROR) != std::string::npos);
        CHECK(colored_err.str().find(Diagnostic::RESET) != std::string::npos);
    }
}
