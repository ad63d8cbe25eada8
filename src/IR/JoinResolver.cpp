#include <qgen/IR/JoinResolver.hpp>

#include <algorithm>
#include <numeric>
#include <qgen/util/exception.hpp>
#include <string>
#include <unordered_map>
#include <utility>


using namespace qg;


/*======================================================================================================================
 * JoinPlan
 *====================================================================================================================*/

bool JoinPlan::uses(const TableRef &table) const
{
    return std::any_of(steps.begin(), steps.end(), [&table](const JoinStep &step) { return step.table == table; });
}

QG_LCOV_EXCL_START
void JoinPlan::dump(std::ostream &out) const
{
    out << "JoinPlan";
    for (auto it = steps.begin(); it != steps.end(); ++it) {
        if (it == steps.begin()) {
            out << "\n  anchor " << it->table;
            continue;
        }
        out << "\n  " << keyword(it->type) << ' ' << it->table;
        if (it->on)
            out << " ON ( " << *it->on << " )";
        else
            out << " (condition deferred)";
    }
    for (auto &pred : deferred)
        out << "\n  deferred ( " << pred << " )";
    out << std::endl;
}

void JoinPlan::dump() const { dump(std::cerr); }
QG_LCOV_EXCL_STOP


/*======================================================================================================================
 * Join resolution
 *====================================================================================================================*/

bool qg::join_order_less(const JoinEdge &lhs, const JoinEdge &rhs)
{
    if (lhs.order_key.empty()) return false; // an edge without key never precedes another edge
    if (rhs.order_key.empty()) return true;
    return lhs.order_key < rhs.order_key;
}

namespace {

/** Appends the table `table` to the join chain of `plan`, joined by `edge` with the given (oriented) `type`. */
void attach(JoinPlan &plan, const JoinEdge &edge, const TableRef &table, JoinType type, const DialectPolicy &policy)
{
    if (policy.predicate_eligible_for_on(edge.predicate)) {
        plan.steps.emplace_back(table, edge.predicate, type);
        return;
    }

    /* Evaluating the condition of an outer join after the join yields a different result. */
    if (edge.is_outer())
        throw unsupported_construct("outer-join-condition", "the condition of the join between '" +
                                    edge.left.reference() + "' and '" + edge.right.reference() +
                                    "' cannot be placed in the ON clause");

    plan.steps.emplace_back(table, std::nullopt, type);
    plan.deferred.push_back(edge.predicate);
}

}

JoinPlan qg::resolve_joins(const std::vector<JoinEdge> &edges, const DialectPolicy &policy)
{
    if (edges.empty())
        throw invalid_argument("cannot resolve an empty set of joins");

    if (not policy.supports_outer_join()) {
        for (auto &edge : edges) {
            if (edge.is_outer())
                throw unsupported_construct("outer-join", "requested between '" + edge.left.reference() + "' and '" +
                                            edge.right.reference() + "'");
        }
    }

    /*----- Sort the edges by order key.  The edges are referenced by their index in `edges`. ------------------------*/
    std::vector<std::size_t> remaining(edges.size());
    std::iota(remaining.begin(), remaining.end(), std::size_t(0));
    std::stable_sort(remaining.begin(), remaining.end(), [&edges](std::size_t lhs, std::size_t rhs) {
        return join_order_less(edges[lhs], edges[rhs]);
    });

    /*----- Number the distinct tables once, such that the scans below compare numbers instead of reference texts. --*/
    std::unordered_map<std::string, std::size_t> ids;
    std::vector<std::pair<std::size_t, std::size_t>> endpoints; ///< table ids of the left and right side of each edge
    endpoints.reserve(edges.size());
    for (auto &edge : edges) {
        const auto left = ids.emplace(edge.left.reference(), ids.size()).first->second;
        const auto right = ids.emplace(edge.right.reference(), ids.size()).first->second;
        endpoints.emplace_back(left, right);
    }
    std::vector<bool> used(ids.size(), false); ///< whether a table is in the chain, by id

    /*----- Start the chain with the left table of the first edge. ---------------------------------------------------*/
    JoinPlan plan;
    plan.steps.emplace_back(edges[remaining.front()].left);
    used[endpoints[remaining.front()].first] = true;

    /*----- Grow the chain.  After each attachment, the search restarts at the first remaining edge. -----------------*/
    for (bool attached = true; attached and not remaining.empty(); ) {
        attached = false;
        for (auto it = remaining.begin(); it != remaining.end(); ++it) {
            const JoinEdge &edge = edges[*it];
            const auto [left_id, right_id] = endpoints[*it];
            const bool left_used = used[left_id];
            const bool right_used = used[right_id];

            if (left_used and right_used)
                throw duplicate_join_path(edge.left.reference(), edge.right.reference());
            if (not left_used and not right_used)
                continue; // not connected to the chain yet, try again in a later pass

            /* Orient the edge such that the table already in the chain is on the left. */
            const TableRef &table = left_used ? edge.right : edge.left;
            const JoinType type = left_used ? edge.type : flip(edge.type);

            remaining.erase(it);
            used[left_used ? right_id : left_id] = true;
            attach(plan, edge, table, type, policy);
            attached = true;
            break;
        }
    }

    if (not remaining.empty()) {
        const JoinEdge &edge = edges[remaining.front()];
        throw unreachable_join_path(edge.left.reference(), edge.right.reference());
    }

    QG_insist(plan.steps.size() == edges.size() + 1, "every edge attaches exactly one table");
    return plan;
}
