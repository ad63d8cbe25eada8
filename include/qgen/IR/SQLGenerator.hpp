#pragma once

#include <iostream>
#include <qgen/dialect/DialectPolicy.hpp>
#include <qgen/IR/QueryModel.hpp>
#include <qgen/qgen-config.hpp>
#include <string>
#include <vector>


namespace qg {

/** Translates a `QueryModel` into SQL text of the dialect described by a `DialectPolicy`.  The text is line-oriented:
 * every table, join, predicate, and list item is on a line of its own.  Note that no semicolon is appended.
 *
 * A generator holds no state besides a reference to its policy, thus one generator can serve concurrent renders.
 */
struct QG_EXPORT SQLGenerator
{
    private:
    const DialectPolicy &policy_; ///< the dialect to generate

    public:
    explicit SQLGenerator(const DialectPolicy &policy) : policy_(policy) { }
    /* The generator refers to its policy, which must outlive it. */
    SQLGenerator(DialectPolicy &&policy) = delete;

    const DialectPolicy & policy() const { return policy_; }

    /** Translates `model` into SQL.  Throws a `generation_error` if the model is malformed or requires a construct the
     * dialect does not support.  On failure, no text is produced. */
    std::string render(const QueryModel &model) const;

    /** Translates `model` into SQL and writes it to `out`.  Nothing is written if translation fails. */
    void operator()(std::ostream &out, const QueryModel &model) const { out << render(model); }

    private:
    void generate_select(std::ostream &out, const QueryModel &model) const;
    /** Generates the FROM clause and returns the join predicates that must be placed in the WHERE clause. */
    std::vector<std::string> generate_from(std::ostream &out, const QueryModel &model) const;
    void generate_tables(std::ostream &out, const QueryModel &model) const;
    std::vector<std::string> generate_joins(std::ostream &out, const QueryModel &model) const;
    /** Generates a conjunction of `predicates`, introduced by `clause`, e.g. `WHERE`. */
    void generate_conjunction(std::ostream &out, const char *clause, const std::vector<std::string> &predicates) const;
    void generate_group_by(std::ostream &out, const QueryModel &model) const;
    void generate_order_by(std::ostream &out, const QueryModel &model) const;
    void generate_limit(std::ostream &out, const QueryModel &model) const;
};

}
