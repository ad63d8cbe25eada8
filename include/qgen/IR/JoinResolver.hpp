#pragma once

#include <iostream>
#include <optional>
#include <qgen/dialect/DialectPolicy.hpp>
#include <qgen/IR/QueryModel.hpp>
#include <qgen/qgen-config.hpp>
#include <string>
#include <vector>


namespace qg {

/** One table of the join chain.  The first step of a `JoinPlan` is the anchor and never has a condition.  Any other
 * step has a condition iff its join predicate may be placed in the ON clause. */
struct JoinStep
{
    TableRef table;
    std::optional<std::string> on; ///< the ON condition of this join, if any
    JoinType type = J_Inner; ///< the type of the join, oriented such that the joined table is on the right

    JoinStep(TableRef table, std::optional<std::string> on = std::nullopt, JoinType type = J_Inner)
        : table(std::move(table))
        , on(std::move(on))
        , type(type)
    { }
};

/** The result of join resolution: the order in which tables are joined, and the join predicates that must be moved
 * to the WHERE clause.  A `JoinPlan` only lives for the duration of a render. */
struct QG_EXPORT JoinPlan
{
    std::vector<JoinStep> steps; ///< the join chain, anchor first
    std::vector<std::string> deferred; ///< join predicates to conjoin in WHERE, in attachment order

    /** Returns the table the join chain is grown from. */
    const TableRef & anchor() const { QG_insist(not steps.empty()); return steps.front().table; }
    /** Returns `true` iff `table` is part of the join chain. */
    bool uses(const TableRef &table) const;

QG_LCOV_EXCL_START
    void dump(std::ostream &out) const;
    void dump() const;
QG_LCOV_EXCL_STOP
};

/** Orders join edges by their order key: edges with a key precede edges without a key, keys compare
 * lexicographically, and edges without a key are equivalent.  Used with a *stable* sort, so that equivalent edges
 * keep their relative order. */
QG_EXPORT bool join_order_less(const JoinEdge &lhs, const JoinEdge &rhs);

/** Assembles `edges` into a single join chain.
 *
 * The edges are sorted with `join_order_less`.  The left table of the first edge becomes the anchor.  Then, the first
 * edge in sort order that connects the chain with a new table is attached, and the search starts over from the first
 * remaining edge.  Hence, the most recently attached table is preferred over resuming the interrupted search.  Edges
 * are flipped as needed so that the new table is on the right.
 *
 * Predicates accepted by `policy.predicate_eligible_for_on()` become ON conditions, all others are deferred to WHERE.
 *
 * Throws `invalid_argument` if `edges` is empty, `unsupported_construct` if an outer join is requested but not
 * supported or its predicate cannot be placed in the ON clause, `duplicate_join_path` if an edge connects two tables
 * that are already part of the chain, and `unreachable_join_path` if some edges cannot be connected to the anchor.
 */
QG_EXPORT JoinPlan resolve_joins(const std::vector<JoinEdge> &edges, const DialectPolicy &policy);

}
