#include <qgen/IR/SQLGenerator.hpp>

#include <qgen/IR/JoinResolver.hpp>
#include <qgen/util/exception.hpp>
#include <sstream>


using namespace qg;


namespace {

/* Every item of a clause goes on a line of its own, indented to align with the first item. */
constexpr const char *INDENT   = "          ";
constexpr const char *LIST_SEP = "         ,";
constexpr const char *AND      = "      AND ";

/** Writes `items` as a comma-separated list, one item per line, and lets `print` write each item. */
template<typename T, typename Print>
void print_list(std::ostream &out, const std::vector<T> &items, Print &&print)
{
    for (auto it = items.begin(); it != items.end(); ++it) {
        out << (it == items.begin() ? INDENT : LIST_SEP);
        print(*it);
        out << '\n';
    }
}

}

std::string SQLGenerator::render(const QueryModel &model) const
{
    /* An outer join request fails regardless of whatever else is wrong with the model. */
    if (model.has_outer_join() and not policy_.supports_outer_join())
        throw unsupported_construct("outer-join");

    model.validate();

    if (model.limit() and policy_.limit_style() == DialectPolicy::LS_None)
        throw unsupported_construct("limit");

    /* Translate into a private buffer, such that a failure leaves no partial text behind. */
    std::ostringstream sql;
    generate_select(sql, model);
    auto where = generate_from(sql, model);
    where.insert(where.end(), model.where().begin(), model.where().end());
    generate_conjunction(sql, "WHERE", where);
    generate_group_by(sql, model);
    generate_conjunction(sql, "HAVING", model.having());
    generate_order_by(sql, model);
    generate_limit(sql, model);
    return sql.str();
}

void SQLGenerator::generate_select(std::ostream &out, const QueryModel &model) const
{
    out << "SELECT";
    if (model.distinct())
        out << " DISTINCT";
    if (model.limit() and policy_.limit_style() == DialectPolicy::LS_Top)
        out << " TOP " << *model.limit();
    out << '\n';

    if (model.selections().empty()) {
        out << INDENT << "*\n";
        return;
    }

    print_list(out, model.selections(), [&](const Selection &sel) {
        out << sel.expression;
        /* Without support for aliases, the alias is dropped.  The model keeps it. */
        if (sel.alias and policy_.supports_aliased_selection())
            out << " AS " << *sel.alias;
    });
}

std::vector<std::string> SQLGenerator::generate_from(std::ostream &out, const QueryModel &model) const
{
    out << "FROM\n";
    if (model.joins().empty()) {
        generate_tables(out, model);
        return {};
    }
    return generate_joins(out, model);
}

void SQLGenerator::generate_tables(std::ostream &out, const QueryModel &model) const
{
    auto &tables = model.tables();
    QG_insist(not tables.empty(), "a validated model has a table");

    /* Each table is listed exactly once.  Without comma-separated FROM lists, each further table is attached by a
     * join without condition. */
    for (auto it = tables.begin(); it != tables.end(); ++it) {
        if (it == tables.begin())
            out << INDENT;
        else if (policy_.supports_multi_table_comma_from())
            out << LIST_SEP;
        else
            out << INDENT << keyword(J_Inner) << ' ';
        out << it->reference() << '\n';
    }
}

std::vector<std::string> SQLGenerator::generate_joins(std::ostream &out, const QueryModel &model) const
{
    JoinPlan plan = resolve_joins(model.joins(), policy_);

    /* A table that takes part in no join cannot be reached from the anchor. */
    for (auto &table : model.tables()) {
        if (not plan.uses(table))
            throw unreachable_join_path(plan.anchor().reference(), table.reference());
    }

    for (auto it = plan.steps.begin(); it != plan.steps.end(); ++it) {
        out << INDENT;
        if (it != plan.steps.begin())
            out << keyword(it->type) << ' ';
        out << it->table.reference();
        if (it->on)
            out << " ON ( " << *it->on << " )";
        out << '\n';
    }

    return std::move(plan.deferred);
}

void SQLGenerator::generate_conjunction(std::ostream &out, const char *clause,
                                        const std::vector<std::string> &predicates) const
{
    if (predicates.empty())
        return;

    out << clause << '\n';
    for (auto it = predicates.begin(); it != predicates.end(); ++it)
        out << (it == predicates.begin() ? INDENT : AND) << "( " << *it << " )\n";
}

void SQLGenerator::generate_group_by(std::ostream &out, const QueryModel &model) const
{
    if (model.group_by().empty())
        return;

    out << "GROUP BY\n";
    print_list(out, model.group_by(), [&out](const std::string &expr) { out << expr; });
}

void SQLGenerator::generate_order_by(std::ostream &out, const QueryModel &model) const
{
    if (model.order_by().empty())
        return;

    out << "ORDER BY\n";
    print_list(out, model.order_by(), [&out](const OrderItem &item) {
        out << item.expression << (item.ascending ? " ASC" : " DESC");
    });
}

void SQLGenerator::generate_limit(std::ostream &out, const QueryModel &model) const
{
    if (not model.limit())
        return;

    switch (policy_.limit_style()) {
        case DialectPolicy::LS_None:
            QG_unreachable("rejected before translation");

        case DialectPolicy::LS_Top:
            break; // already part of the SELECT clause

        case DialectPolicy::LS_Limit:
            out << "LIMIT " << *model.limit() << '\n';
            break;

        case DialectPolicy::LS_FetchFirst:
            out << "FETCH FIRST " << *model.limit() << " ROWS ONLY\n";
            break;
    }
}
