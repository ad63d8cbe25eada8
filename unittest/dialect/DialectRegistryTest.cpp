#include "catch2/catch.hpp"

#include <iterator>
#include <qgen/dialect/DialectRegistry.hpp>
#include <qgen/qgen.hpp>
#include <qgen/util/exception.hpp>
#include <string>


using namespace qg;


TEST_CASE("DialectRegistry built-in dialects", "[core][dialect][DialectRegistry]")
{
    auto &R = DialectRegistry::Get();
    REQUIRE(&R == &DialectRegistry::Get());

    CHECK(R.has("ansi"));
    CHECK(R.has("hive"));
    CHECK(R.has("mssql"));
    CHECK_FALSE(R.has("oracle"));

    CHECK(R.get("hive").name() == "hive");
    CHECK_FALSE(R.get("hive").supports_outer_join());
    CHECK_FALSE(R.get_description("hive").empty());
    CHECK(R.get_default_name() == "ansi");
    CHECK(&R.get_default() == &R.get("ansi"));

    SECTION("dialects are listed by name")
    {
        std::string prev;
        for (auto &dialect : R) {
            CHECK(prev < dialect.first);
            CHECK(dialect.second->name() == dialect.first);
            prev = dialect.first;
        }
        CHECK(std::size_t(std::distance(R.begin(), R.end())) == R.size());
    }
}

TEST_CASE("DialectRegistry lookup of unknown dialect", "[core][dialect][DialectRegistry]")
{
    auto &R = DialectRegistry::Get();
    REQUIRE_THROWS_AS(R.get("no-such-dialect"), invalid_argument);
    REQUIRE_THROWS_AS(R.get_description("no-such-dialect"), invalid_argument);
    REQUIRE_THROWS_AS(R.set_default("no-such-dialect"), invalid_argument);
    CHECK(R.get_default_name() == "ansi");
}

TEST_CASE("DialectRegistry registration", "[core][dialect][DialectRegistry]")
{
    auto &R = DialectRegistry::Get();

    if (not R.has("test-nolimit")) {
        DialectPolicy::Capabilities caps;
        caps.limit_style = DialectPolicy::LS_None;
        auto &policy = R.add(DialectPolicy("test-nolimit", caps), "a dialect without row limits");
        CHECK(&policy == &R.get("test-nolimit"));
    }
    CHECK(R.get_description("test-nolimit") == "a dialect without row limits");
    CHECK(R.get("test-nolimit").limit_style() == DialectPolicy::LS_None);

    SECTION("a name can only be registered once")
    {
        REQUIRE_THROWS_AS(R.add(DialectPolicy::Hive()), invalid_argument);
    }

    SECTION("changing the default")
    {
        R.set_default("test-nolimit");
        CHECK(R.get_default_name() == "test-nolimit");
        R.set_default("ansi");
        CHECK(R.get_default_name() == "ansi");
    }
}

TEST_CASE("render by dialect name", "[core][dialect][DialectRegistry]")
{
    QueryModel model;
    model.add_table(TableRef("t"));
    model.add_selection("t.a", "x");
    model.limit(3);

    CHECK(render(model, "hive") == render(model, DialectPolicy::Hive()));
    CHECK(render(model, "mssql") ==
"SELECT TOP 3\n"
"          t.a AS x\n"
"FROM\n"
"          t\n");
    REQUIRE_THROWS_AS(render(model, "no-such-dialect"), invalid_argument);
}
