#pragma once

#include <cstdint>
#include <iostream>
#include <optional>
#include <qgen/qgen-config.hpp>
#include <qgen/util/exception.hpp>
#include <qgen/util/macro.hpp>
#include <string>
#include <utility>
#include <vector>


namespace qg {

/** A table referenced by a query, optionally renamed by an alias. */
struct QG_EXPORT TableRef
{
    private:
    std::string name_; ///< the name of the table in the target database
    std::optional<std::string> alias_; ///< the alias of the table within the query, if any

    public:
    TableRef(std::string name) : name_(std::move(name)) {
        if (name_.empty())
            throw invalid_argument("a table reference must name a table");
    }

    TableRef(std::string name, std::optional<std::string> alias) : TableRef(std::move(name)) {
        /* An empty alias is treated like no alias at all. */
        if (alias and not alias->empty())
            alias_ = std::move(alias);
    }

    const std::string & name() const { return name_; }
    const std::optional<std::string> & alias() const { return alias_; }
    bool has_alias() const { return alias_.has_value(); }

    /** Returns the text that refers to this table in a FROM clause, i.e. `name` or `name alias`.  Two references to
     * the same table with the same alias denote the same table of a query. */
    std::string reference() const { return alias_ ? name_ + ' ' + *alias_ : name_; }

    bool operator==(const TableRef &other) const { return name_ == other.name_ and alias_ == other.alias_; }
    bool operator!=(const TableRef &other) const { return not operator==(other); }

QG_LCOV_EXCL_START
    friend std::ostream & operator<<(std::ostream &out, const TableRef &ref) { return out << ref.reference(); }
QG_LCOV_EXCL_STOP
};

/** An expression in the SELECT clause. */
struct Selection
{
    std::string expression;
    std::optional<std::string> alias;

    Selection(std::string expression, std::optional<std::string> alias = std::nullopt)
        : expression(std::move(expression))
        , alias(std::move(alias))
    { }
};

enum JoinType
{
    J_Inner,
    J_LeftOuter,
    J_RightOuter,
    J_FullOuter,
};

/** Returns the join type that is obtained by swapping both sides of a join of type `type`. */
inline JoinType flip(JoinType type)
{
    switch (type) {
        case J_LeftOuter:  return J_RightOuter;
        case J_RightOuter: return J_LeftOuter;
        default:           return type;
    }
}

/** Returns the SQL keyword(s) introducing a join of type `type`. */
inline const char * keyword(JoinType type)
{
    switch (type) {
        case J_Inner:      return "JOIN";
        case J_LeftOuter:  return "LEFT OUTER JOIN";
        case J_RightOuter: return "RIGHT OUTER JOIN";
        case J_FullOuter:  return "FULL OUTER JOIN";
    }
    QG_unreachable("invalid join type");
}

/** A binary join between two tables.  Although stored with an orientation, a `JoinEdge` is undirected: the join
 * resolver may swap `left` and `right` when attaching the edge to the join chain. */
struct QG_EXPORT JoinEdge
{
    TableRef left;
    TableRef right;
    std::string predicate; ///< the join condition
    std::string order_key; ///< priority hint for the join order; empty if there is none
    JoinType type = J_Inner;

    JoinEdge(TableRef left, TableRef right, std::string predicate, std::string order_key = std::string(),
             JoinType type = J_Inner)
        : left(std::move(left))
        , right(std::move(right))
        , predicate(std::move(predicate))
        , order_key(std::move(order_key))
        , type(type)
    { }

    bool is_outer() const { return type != J_Inner; }
    /** Returns `true` iff this edge connects the same two tables as `other`, in either orientation. */
    bool connects_same_tables(const JoinEdge &other) const {
        return (left == other.left and right == other.right) or (left == other.right and right == other.left);
    }
};

/** An expression in the ORDER BY clause together with its sort direction. */
struct OrderItem
{
    std::string expression;
    bool ascending = true;

    OrderItem(std::string expression, bool ascending = true) : expression(std::move(expression)), ascending(ascending)
    { }
};

/** The dialect-neutral description of one query.  The model is plain data: it is built by the caller and read, never
 * modified, by the generator.  `validate()` checks the structural invariants the generator relies on. */
struct QG_EXPORT QueryModel
{
    using selection_list = std::vector<Selection>;
    using table_list = std::vector<TableRef>;
    using join_list = std::vector<JoinEdge>;
    using predicate_list = std::vector<std::string>;
    using expression_list = std::vector<std::string>;
    using order_list = std::vector<OrderItem>;

    private:
    bool distinct_ = false; ///< whether duplicate rows are eliminated
    selection_list selections_; ///< the projections in SELECT order
    table_list tables_; ///< all tables of the query, in insertion order
    join_list joins_; ///< the join edges between the tables
    predicate_list where_; ///< conjunctive predicates outside of the join graph
    expression_list group_by_; ///< grouping expressions
    predicate_list having_; ///< conjunctive predicates on the groups
    order_list order_by_; ///< sort order of the result
    std::optional<uint64_t> limit_; ///< the maximum number of rows, if any

    public:
    QueryModel() = default;

    /*===== Accessors ================================================================================================*/
    bool distinct() const { return distinct_; }
    const selection_list & selections() const { return selections_; }
    const table_list & tables() const { return tables_; }
    const join_list & joins() const { return joins_; }
    const predicate_list & where() const { return where_; }
    const expression_list & group_by() const { return group_by_; }
    const predicate_list & having() const { return having_; }
    const order_list & order_by() const { return order_by_; }
    const std::optional<uint64_t> & limit() const { return limit_; }

    /** Returns `true` iff any join edge requests an outer join. */
    bool has_outer_join() const;

    /*===== Mutators =================================================================================================*/
    void distinct(bool distinct) { distinct_ = distinct; }
    void add_selection(Selection selection) { selections_.push_back(std::move(selection)); }
    void add_selection(std::string expression, std::optional<std::string> alias = std::nullopt) {
        selections_.emplace_back(std::move(expression), std::move(alias));
    }
    /** Adds `table` to the model and returns a reference to the stored `TableRef`. */
    const TableRef & add_table(TableRef table) { return tables_.emplace_back(std::move(table)); }
    void add_join(JoinEdge join) { joins_.push_back(std::move(join)); }
    void add_where(std::string predicate) { where_.push_back(std::move(predicate)); }
    void add_group_by(std::string expression) { group_by_.push_back(std::move(expression)); }
    void add_having(std::string predicate) { having_.push_back(std::move(predicate)); }
    void add_order_by(OrderItem item) { order_by_.push_back(std::move(item)); }
    void limit(uint64_t limit) { limit_ = limit; }
    void clear_limit() { limit_.reset(); }

    /** Checks the structural invariants of the model.  Throws `malformed_model` if the model references no table, if
     * two tables share a reference or an alias, if a join endpoint is not a table of the model, if a join connects a
     * table with itself, or if a join has no condition.  Throws `duplicate_join_path` if two joins connect the same
     * pair of tables. */
    void validate() const;
};

}
