#include <qgen/dialect/DialectRegistry.hpp>

#include <qgen/util/exception.hpp>
#include <utility>


using namespace qg;


DialectRegistry::DialectRegistry()
{
    add(DialectPolicy::ANSI(), "standard SQL with outer joins and FETCH FIRST");
    add(DialectPolicy::Hive(), "Apache Hive; equality-only ON conditions, no outer joins, no selection aliases");
    add(DialectPolicy::MSSQL(), "Microsoft SQL Server; rows limited with SELECT TOP");
    set_default("ansi");
}

DialectRegistry & DialectRegistry::Get()
{
    static DialectRegistry the_registry;
    return the_registry;
}

const DialectPolicy & DialectRegistry::add(DialectPolicy policy, std::string description)
{
    auto it = dialects_.find(policy.name());
    if (it != dialects_.end())
        throw invalid_argument("dialect '" + policy.name() + "' already exists");
    auto name = policy.name();
    it = dialects_.emplace_hint(it, std::move(name), DialectComponent(std::move(description), std::move(policy)));
    if (dialects_.size() == 1)
        default_ = it;
    return *it->second;
}

void DialectRegistry::set_default(std::string_view name)
{
    default_ = lookup(name);
}

DialectRegistry::map_t::const_iterator DialectRegistry::lookup(std::string_view name) const
{
    auto it = dialects_.find(name);
    if (it == dialects_.end())
        throw invalid_argument("dialect '" + std::string(name) + "' does not exist");
    return it;
}
