#include "catch2/catch.hpp"

#include <algorithm>
#include <qgen/dialect/DialectPolicy.hpp>
#include <qgen/IR/JoinResolver.hpp>
#include <qgen/util/exception.hpp>
#include <set>
#include <string>
#include <vector>


using namespace qg;


namespace {

JoinEdge edge(const char *left, const char *right, std::string key = std::string(), JoinType type = J_Inner)
{
    return JoinEdge(TableRef(left), TableRef(right), std::string(left) + ".id = " + right + ".id", std::move(key),
                    type);
}

/** Returns the reference texts of the tables of `plan` in join order. */
std::vector<std::string> order(const JoinPlan &plan)
{
    std::vector<std::string> refs;
    for (auto &step : plan.steps)
        refs.push_back(step.table.reference());
    return refs;
}

}


TEST_CASE("join_order_less", "[core][IR][JoinResolver]")
{
    auto keyed1 = edge("A", "B", "1");
    auto keyed2 = edge("A", "C", "2");
    auto unkeyed = edge("A", "D");

    CHECK(join_order_less(keyed1, keyed2));
    CHECK_FALSE(join_order_less(keyed2, keyed1));
    CHECK(join_order_less(keyed2, unkeyed));
    CHECK_FALSE(join_order_less(unkeyed, keyed1));
    CHECK_FALSE(join_order_less(unkeyed, edge("B", "C")));
    CHECK_FALSE(join_order_less(keyed1, keyed1));

    SECTION("keys compare lexicographically")
    {
        CHECK(join_order_less(edge("A", "B", "10"), edge("A", "C", "9")));
    }
}

TEST_CASE("resolve_joins orders by order key", "[core][IR][JoinResolver]")
{
    const auto policy = DialectPolicy::ANSI();
    std::vector<JoinEdge> edges{ edge("A", "B", "2"), edge("A", "C"), edge("A", "D", "1") };

    auto plan = resolve_joins(edges, policy);

    REQUIRE(plan.anchor() == TableRef("A"));
    REQUIRE(order(plan) == std::vector<std::string>{ "A", "D", "B", "C" });
    REQUIRE_FALSE(plan.steps.front().on);
    REQUIRE(*plan.steps[1].on == "A.id = D.id");
    REQUIRE(*plan.steps[2].on == "A.id = B.id");
    REQUIRE(*plan.steps[3].on == "A.id = C.id");
    REQUIRE(plan.deferred.empty());
}

TEST_CASE("resolve_joins without order keys keeps the input order", "[core][IR][JoinResolver]")
{
    const auto policy = DialectPolicy::ANSI();
    std::vector<JoinEdge> edges{ edge("C", "D"), edge("B", "C"), edge("A", "B") };

    auto plan = resolve_joins(edges, policy);

    /* The anchor is the left table of the first edge; later edges are flipped to attach their new table. */
    REQUIRE(order(plan) == std::vector<std::string>{ "C", "D", "B", "A" });
    REQUIRE(*plan.steps[2].on == "B.id = C.id");
}

TEST_CASE("resolve_joins prefers the most recently attached table", "[core][IR][JoinResolver]")
{
    const auto policy = DialectPolicy::ANSI();
    std::vector<JoinEdge> edges{ edge("A", "B"), edge("D", "E"), edge("B", "D"), edge("B", "C") };

    auto plan = resolve_joins(edges, policy);

    /* After attaching D, the search restarts and picks up D-E before B-C. */
    REQUIRE(order(plan) == std::vector<std::string>{ "A", "B", "D", "E", "C" });
}

TEST_CASE("resolve_joins resolves a tree in any edge order", "[core][IR][JoinResolver]")
{
    const auto policy = DialectPolicy::ANSI();
    const std::vector<JoinEdge> tree{ edge("A", "B"), edge("A", "C"), edge("C", "D"), edge("C", "E") };

    std::vector<std::size_t> permutation{ 0, 1, 2, 3 };
    do {
        std::vector<JoinEdge> edges;
        for (auto idx : permutation)
            edges.push_back(tree[idx]);

        auto plan = resolve_joins(edges, policy);

        REQUIRE(plan.steps.size() == 5);
        auto tables = order(plan);
        std::set<std::string> distinct(tables.begin(), tables.end());
        REQUIRE(distinct == std::set<std::string>{ "A", "B", "C", "D", "E" });
        for (auto &name : { "A", "B", "C", "D", "E" })
            REQUIRE(plan.uses(TableRef(name)));
        REQUIRE_FALSE(plan.uses(TableRef("F")));
    } while (std::next_permutation(permutation.begin(), permutation.end()));
}

TEST_CASE("resolve_joins resolves a long chain given back to front", "[core][IR][JoinResolver]")
{
    const auto policy = DialectPolicy::ANSI();
    constexpr std::size_t N = 2000;

    std::vector<std::string> names;
    for (std::size_t i = 0; i <= N; ++i)
        names.push_back("T" + std::to_string(i));

    /* Only the first edge is connected to the anchor; every other table attaches after a scan of all edges before. */
    std::vector<JoinEdge> edges;
    edges.push_back(edge(names[0].c_str(), names[1].c_str()));
    for (std::size_t i = N; i > 1; --i)
        edges.push_back(edge(names[i - 1].c_str(), names[i].c_str()));

    auto plan = resolve_joins(edges, policy);

    REQUIRE(plan.steps.size() == N + 1);
    REQUIRE(plan.deferred.empty());
    REQUIRE(order(plan) == names);
    for (std::size_t i = 1; i <= N; ++i) {
        REQUIRE(plan.steps[i].type == J_Inner);
        REQUIRE(*plan.steps[i].on == names[i - 1] + ".id = " + names[i] + ".id");
    }
}

TEST_CASE("resolve_joins detects duplicate join paths", "[core][IR][JoinResolver]")
{
    const auto policy = DialectPolicy::ANSI();

    SECTION("two edges between the same tables")
    {
        std::vector<JoinEdge> edges{ edge("A", "B"), edge("B", "A") };
        REQUIRE_THROWS_AS(resolve_joins(edges, policy), duplicate_join_path);
    }

    SECTION("cycle")
    {
        std::vector<JoinEdge> edges{ edge("A", "B"), edge("B", "C"), edge("C", "A") };
        try {
            resolve_joins(edges, policy);
            FAIL("expected duplicate_join_path");
        } catch (const duplicate_join_path &e) {
            CHECK(e.table_a() == "C");
            CHECK(e.table_b() == "A");
            CHECK(std::string(e.what()).find("'C' and 'A'") != std::string::npos);
        }
    }
}

TEST_CASE("resolve_joins detects unreachable tables", "[core][IR][JoinResolver]")
{
    const auto policy = DialectPolicy::ANSI();
    std::vector<JoinEdge> edges{ edge("A", "B"), edge("C", "D"), edge("D", "E") };

    try {
        resolve_joins(edges, policy);
        FAIL("expected unreachable_join_path");
    } catch (const unreachable_join_path &e) {
        CHECK(e.table_a() == "C");
        CHECK(e.table_b() == "D");
    }
}

TEST_CASE("resolve_joins places each predicate exactly once", "[core][IR][JoinResolver]")
{
    const auto policy = DialectPolicy::Hive();
    std::vector<JoinEdge> edges{
        JoinEdge(TableRef("A"), TableRef("B"), "A.id = B.id"),
        JoinEdge(TableRef("A"), TableRef("C"), "A.d >= C.d"),
        JoinEdge(TableRef("B"), TableRef("D"), "B.id = D.id AND D.flag is not null"),
        JoinEdge(TableRef("E"), TableRef("D"), "E.id = D.id"),
    };

    auto plan = resolve_joins(edges, policy);

    REQUIRE(order(plan) == std::vector<std::string>{ "A", "B", "C", "D", "E" });
    REQUIRE(*plan.steps[1].on == "A.id = B.id");
    REQUIRE_FALSE(plan.steps[2].on);
    REQUIRE_FALSE(plan.steps[3].on);
    REQUIRE(*plan.steps[4].on == "E.id = D.id");
    REQUIRE(plan.deferred == std::vector<std::string>{ "A.d >= C.d", "B.id = D.id AND D.flag is not null" });

    std::multiset<std::string> placed(plan.deferred.begin(), plan.deferred.end());
    for (auto &step : plan.steps) {
        if (step.on)
            placed.insert(*step.on);
    }
    std::multiset<std::string> expected;
    for (auto &e : edges)
        expected.insert(e.predicate);
    REQUIRE(placed == expected);
}

TEST_CASE("resolve_joins with outer joins", "[core][IR][JoinResolver]")
{
    std::vector<JoinEdge> edges{ edge("A", "B"), edge("C", "B", "", J_LeftOuter) };

    SECTION("the join type is flipped with the edge")
    {
        auto plan = resolve_joins(edges, DialectPolicy::ANSI());
        REQUIRE(order(plan) == std::vector<std::string>{ "A", "B", "C" });
        REQUIRE(plan.steps[1].type == J_Inner);
        REQUIRE(plan.steps[2].type == J_RightOuter);
        REQUIRE(*plan.steps[2].on == "C.id = B.id");
    }

    SECTION("the join type is kept if the edge is not flipped")
    {
        edges[1] = edge("B", "C", "", J_LeftOuter);
        auto plan = resolve_joins(edges, DialectPolicy::ANSI());
        REQUIRE(plan.steps[2].type == J_LeftOuter);
    }

    SECTION("the dialect does not support outer joins")
    {
        try {
            resolve_joins(edges, DialectPolicy::Hive());
            FAIL("expected unsupported_construct");
        } catch (const unsupported_construct &e) {
            CHECK(e.feature() == "outer-join");
        }
    }

    SECTION("the condition cannot be placed in the ON clause")
    {
        const DialectPolicy policy("strict", DialectPolicy::Capabilities(), DialectPolicy::equality_only);
        edges[1] = JoinEdge(TableRef("C"), TableRef("B"), "C.x < B.x", "", J_LeftOuter);
        try {
            resolve_joins(edges, policy);
            FAIL("expected unsupported_construct");
        } catch (const unsupported_construct &e) {
            CHECK(e.feature() == "outer-join-condition");
        }
    }
}

TEST_CASE("resolve_joins rejects an empty set of joins", "[core][IR][JoinResolver]")
{
    REQUIRE_THROWS_AS(resolve_joins({}, DialectPolicy::ANSI()), invalid_argument);
}
