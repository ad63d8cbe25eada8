#include <qgen/IR/QueryModel.hpp>

#include <algorithm>
#include <initializer_list>
#include <qgen/util/exception.hpp>
#include <unordered_set>


using namespace qg;


bool QueryModel::has_outer_join() const
{
    return std::any_of(joins_.begin(), joins_.end(), [](const JoinEdge &join) { return join.is_outer(); });
}

void QueryModel::validate() const
{
    if (tables_.empty())
        throw malformed_model("the query references no table");

    /*----- Table references and aliases must be unique. -------------------------------------------------------------*/
    std::unordered_set<std::string> references;
    std::unordered_set<std::string> aliases;
    for (auto &table : tables_) {
        if (not references.emplace(table.reference()).second)
            throw malformed_model("table '" + table.reference() + "' is referenced more than once");
        if (table.alias() and not aliases.emplace(*table.alias()).second)
            throw malformed_model("alias '" + *table.alias() + "' is used for more than one table");
    }

    /*----- Every join must connect two distinct tables of the model. ------------------------------------------------*/
    for (auto &join : joins_) {
        for (auto *endpoint : { &join.left, &join.right }) {
            if (not references.contains(endpoint->reference()))
                throw malformed_model("join endpoint '" + endpoint->reference() + "' is not a table of the query");
        }
        if (join.left == join.right)
            throw malformed_model("table '" + join.left.reference() + "' is joined with itself");
        if (join.predicate.empty())
            throw malformed_model("join between '" + join.left.reference() + "' and '" + join.right.reference() +
                                  "' has no condition");
    }

    /*----- At most one join per pair of tables. ---------------------------------------------------------------------*/
    for (auto it = joins_.begin(); it != joins_.end(); ++it) {
        for (auto other = std::next(it); other != joins_.end(); ++other) {
            if (it->connects_same_tables(*other))
                throw duplicate_join_path(it->left.reference(), it->right.reference());
        }
    }
}
