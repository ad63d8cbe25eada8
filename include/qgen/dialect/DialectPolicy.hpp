#pragma once

#include <functional>
#include <qgen/qgen-config.hpp>
#include <string>
#include <string_view>


namespace qg {

/** Describes what the grammar of one target database allows.  The generator consults the policy at each clause
 * instead of being specialized per dialect: a new target is a new `DialectPolicy` value, not a new type.
 *
 * A policy is immutable after construction and can be shared by concurrent renders, provided its predicate classifier
 * is free of side effects.
 */
struct QG_EXPORT DialectPolicy
{
    /** How the dialect restricts the number of result rows. */
    enum LimitStyle
    {
        LS_None,        ///< no row limit can be expressed
        LS_Limit,       ///< `... LIMIT n`
        LS_Top,         ///< `SELECT TOP n ...`
        LS_FetchFirst,  ///< `... FETCH FIRST n ROWS ONLY`
    };

    /** Decides whether a join predicate may be placed in the ON condition of a join. */
    using classifier_type = std::function<bool(std::string_view)>;

    /** The capabilities of a dialect.  By default, everything is supported and rows are limited by `LIMIT`. */
    struct Capabilities
    {
        ///> whether `LEFT`, `RIGHT`, and `FULL OUTER JOIN` are available
        bool outer_join = true;
        ///> whether selections may be renamed with `AS`
        bool aliased_selection = true;
        ///> whether the FROM clause may list several tables separated by commas
        bool multi_table_comma_from = true;
        ///> how the number of rows is limited
        LimitStyle limit_style = LS_Limit;
    };

    private:
    std::string name_;
    Capabilities capabilities_;
    classifier_type eligible_for_on_;

    public:
    DialectPolicy(std::string name, Capabilities capabilities, classifier_type eligible_for_on = any_predicate);

    const std::string & name() const { return name_; }
    const Capabilities & capabilities() const { return capabilities_; }

    bool supports_outer_join() const { return capabilities_.outer_join; }
    bool supports_aliased_selection() const { return capabilities_.aliased_selection; }
    bool supports_multi_table_comma_from() const { return capabilities_.multi_table_comma_from; }
    LimitStyle limit_style() const { return capabilities_.limit_style; }

    /** Returns `true` iff `predicate` may be rendered as the ON condition of a join.  Otherwise, the predicate must be
     * moved to the WHERE clause. */
    bool predicate_eligible_for_on(std::string_view predicate) const { return eligible_for_on_(predicate); }

    /*===== Predicate classifiers ====================================================================================*/
    /** Accepts every predicate. */
    static bool any_predicate(std::string_view) { return true; }
    /** Accepts only predicates built from equalities, i.e. rejects predicates containing `!=`, `<`, `>`, `IS NULL`, or
     * `IS NOT NULL`.  Keywords are matched regardless of case. */
    static bool equality_only(std::string_view predicate);

    /*===== Factory methods ==========================================================================================*/
    /** Standard SQL: all constructs are supported, rows are limited with `FETCH FIRST`. */
    static DialectPolicy ANSI();
    /** Apache Hive: no outer joins, no selection aliases, no comma-separated FROM lists, and only equalities in ON
     * conditions. */
    static DialectPolicy Hive();
    /** Microsoft SQL Server: like ANSI, but rows are limited with `SELECT TOP`. */
    static DialectPolicy MSSQL();
};

}
