#include <qgen/dialect/DialectPolicy.hpp>

#include <qgen/util/exception.hpp>
#include <qgen/util/fn.hpp>
#include <utility>


using namespace qg;


namespace {

/** Operators and keywords that cannot appear in an equality-only join condition.  Note that `IS NOT NULL` is not a
 * substring of `IS NULL` and hence listed separately. */
constexpr const char *NON_EQUALITY_TOKENS[] = { "!=", ">", "<", "IS NULL", "IS NOT NULL" };

}


DialectPolicy::DialectPolicy(std::string name, Capabilities capabilities, classifier_type eligible_for_on)
    : name_(std::move(name))
    , capabilities_(capabilities)
    , eligible_for_on_(std::move(eligible_for_on))
{
    if (name_.empty())
        throw invalid_argument("a dialect must have a name");
    if (not eligible_for_on_)
        throw invalid_argument("a dialect requires a predicate classifier");
}

bool DialectPolicy::equality_only(std::string_view predicate)
{
    for (auto token : NON_EQUALITY_TOKENS) {
        if (contains_insensitive(predicate, token))
            return false;
    }
    return true;
}

DialectPolicy DialectPolicy::ANSI()
{
    Capabilities caps;
    caps.limit_style = LS_FetchFirst;
    return DialectPolicy("ansi", caps);
}

DialectPolicy DialectPolicy::Hive()
{
    Capabilities caps;
    caps.outer_join = false;
    caps.aliased_selection = false;
    caps.multi_table_comma_from = false;
    caps.limit_style = LS_Limit;
    return DialectPolicy("hive", caps, equality_only);
}

DialectPolicy DialectPolicy::MSSQL()
{
    Capabilities caps;
    caps.limit_style = LS_Top;
    return DialectPolicy("mssql", caps);
}
