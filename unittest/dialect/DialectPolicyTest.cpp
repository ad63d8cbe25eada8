#include "catch2/catch.hpp"

#include <qgen/dialect/DialectPolicy.hpp>
#include <qgen/util/exception.hpp>


using namespace qg;


TEST_CASE("DialectPolicy::equality_only", "[core][dialect][DialectPolicy]")
{
    SECTION("equalities are eligible")
    {
        CHECK(DialectPolicy::equality_only("a.id = b.id"));
        CHECK(DialectPolicy::equality_only("a.id = b.id AND a.k = b.k"));
        CHECK(DialectPolicy::equality_only("a.name = 'null'"));
    }

    SECTION("non-equalities are not eligible")
    {
        CHECK_FALSE(DialectPolicy::equality_only("a.id != b.id"));
        CHECK_FALSE(DialectPolicy::equality_only("a.x > b.x"));
        CHECK_FALSE(DialectPolicy::equality_only("a.x < b.x"));
        CHECK_FALSE(DialectPolicy::equality_only("a.x >= b.x"));
        CHECK_FALSE(DialectPolicy::equality_only("a.x <> b.x"));
        CHECK_FALSE(DialectPolicy::equality_only("a.id = b.id AND b.x IS NULL"));
        CHECK_FALSE(DialectPolicy::equality_only("a.id = b.id AND b.x IS NOT NULL"));
    }

    SECTION("keywords are matched regardless of case")
    {
        CHECK_FALSE(DialectPolicy::equality_only("b.x is null"));
        CHECK_FALSE(DialectPolicy::equality_only("b.x Is Not Null"));
    }
}

TEST_CASE("DialectPolicy factories", "[core][dialect][DialectPolicy]")
{
    SECTION("hive")
    {
        auto hive = DialectPolicy::Hive();
        CHECK(hive.name() == "hive");
        CHECK_FALSE(hive.supports_outer_join());
        CHECK_FALSE(hive.supports_aliased_selection());
        CHECK_FALSE(hive.supports_multi_table_comma_from());
        CHECK(hive.limit_style() == DialectPolicy::LS_Limit);
        CHECK(hive.predicate_eligible_for_on("a.id = b.id"));
        CHECK_FALSE(hive.predicate_eligible_for_on("a.x > b.x"));
    }

    SECTION("ansi")
    {
        auto ansi = DialectPolicy::ANSI();
        CHECK(ansi.name() == "ansi");
        CHECK(ansi.supports_outer_join());
        CHECK(ansi.supports_aliased_selection());
        CHECK(ansi.supports_multi_table_comma_from());
        CHECK(ansi.limit_style() == DialectPolicy::LS_FetchFirst);
        CHECK(ansi.predicate_eligible_for_on("a.x > b.x"));
    }

    SECTION("mssql")
    {
        auto mssql = DialectPolicy::MSSQL();
        CHECK(mssql.name() == "mssql");
        CHECK(mssql.supports_outer_join());
        CHECK(mssql.limit_style() == DialectPolicy::LS_Top);
    }
}

TEST_CASE("DialectPolicy c'tor", "[core][dialect][DialectPolicy]")
{
    DialectPolicy::Capabilities caps;
    caps.outer_join = false;
    caps.limit_style = DialectPolicy::LS_None;

    SECTION("custom classifier")
    {
        DialectPolicy policy("custom", caps, [](std::string_view p) { return p.size() < 10; });
        CHECK(policy.name() == "custom");
        CHECK_FALSE(policy.supports_outer_join());
        CHECK(policy.supports_aliased_selection());
        CHECK(policy.capabilities().limit_style == DialectPolicy::LS_None);
        CHECK(policy.predicate_eligible_for_on("a = b"));
        CHECK_FALSE(policy.predicate_eligible_for_on("a.long_name = b.long_name"));
    }

    SECTION("default classifier accepts everything")
    {
        DialectPolicy policy("custom", caps);
        CHECK(policy.predicate_eligible_for_on("a.x IS NULL"));
    }

    SECTION("invalid arguments")
    {
        REQUIRE_THROWS_AS(DialectPolicy("", caps), invalid_argument);
        REQUIRE_THROWS_AS(DialectPolicy("custom", caps, DialectPolicy::classifier_type()), invalid_argument);
    }
}
