#pragma once

#include <map>
#include <qgen/dialect/DialectPolicy.hpp>
#include <qgen/qgen-config.hpp>
#include <string>
#include <string_view>
#include <utility>


namespace qg {

/** A registered dialect together with a textual description. */
struct DialectComponent
{
    private:
    std::string description_;
    DialectPolicy policy_;

    public:
    DialectComponent(std::string description, DialectPolicy policy)
        : description_(std::move(description))
        , policy_(std::move(policy))
    { }

    const std::string & description() const { return description_; }
    const DialectPolicy & operator*() const { return policy_; }
    const DialectPolicy * operator->() const { return &policy_; }
};

/** The registry of all dialects known by name.  There is always exactly one registry.  On construction, it contains the
 * dialects `ansi` (the default), `hive`, and `mssql`.
 *
 * The registry is meant to be populated during start-up.  Registered policies are never removed, hence references
 * returned by `get()` stay valid for the lifetime of the program.
 */
struct QG_EXPORT DialectRegistry
{
    private:
    using map_t = std::map<std::string, DialectComponent, std::less<>>;
    ///> all dialects, ordered by name
    map_t dialects_;
    ///> the default dialect
    map_t::const_iterator default_;

    DialectRegistry();

    public:
    DialectRegistry(const DialectRegistry&) = delete;
    DialectRegistry & operator=(const DialectRegistry&) = delete;

    /** Return a reference to the single `DialectRegistry` instance. */
    static DialectRegistry & Get();

    /** Registers `policy` under its name.  Throws `invalid_argument` if a dialect with that name already exists. */
    const DialectPolicy & add(DialectPolicy policy, std::string description = std::string());

    /** Makes the dialect `name` the default.  Throws `invalid_argument` if no such dialect exists. */
    void set_default(std::string_view name);

    /** Returns `true` iff a dialect `name` is registered. */
    bool has(std::string_view name) const { return dialects_.find(name) != dialects_.end(); }

    /** Returns the dialect `name`.  Throws `invalid_argument` if no such dialect exists. */
    const DialectPolicy & get(std::string_view name) const { return *lookup(name)->second; }
    /** Returns the description of dialect `name`.  Throws `invalid_argument` if no such dialect exists. */
    const std::string & get_description(std::string_view name) const { return lookup(name)->second.description(); }

    const DialectPolicy & get_default() const { return *default_->second; }
    const std::string & get_default_name() const { return default_->first; }

    std::size_t size() const { return dialects_.size(); }
    map_t::const_iterator begin() const { return dialects_.begin(); }
    map_t::const_iterator end() const { return dialects_.end(); }

    private:
    map_t::const_iterator lookup(std::string_view name) const;
};

}
