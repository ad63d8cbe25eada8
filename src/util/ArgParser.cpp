#include <qgen/util/ArgParser.hpp>

#include <cstdlib>
#include <iomanip>
#include <qgen/util/fn.hpp>
#include <stdexcept>
#include <string>


using namespace qg;


namespace {

/** Helper function to parse unsigned integral values. */
template<typename T>
requires std::unsigned_integral<T>
void help_parse(const char **&argv, const std::function<void(T)> &callback)
{
    if (not *++argv) {
        std::cerr << "missing argument" << std::endl;
        std::exit(EXIT_FAILURE);
    }

    if (**argv == '-') {
        std::cerr << "not a valid unsigned integer" << std::endl;
        std::exit(EXIT_FAILURE);
    }

    T i;
    try {
        if constexpr (std::same_as<T, unsigned long>)
            i = std::stoul(*argv);
        if constexpr (std::same_as<T, unsigned long long>)
            i = std::stoull(*argv);
    } catch (const std::invalid_argument&) {
        std::cerr << "not a valid integer" << std::endl;
        std::exit(EXIT_FAILURE);
    } catch (const std::out_of_range&) {
        std::cerr << "value out of range" << std::endl;
        std::exit(EXIT_FAILURE);
    }
    callback(i);
}

}

#define PARSE(TYPE) \
template<> void ArgParser::OptionImpl<TYPE>::parse(const char **&argv) const { help_parse<TYPE>(argv, callback); }

/*----- Boolean ------------------------------------------------------------------------------------------------------*/
template<> void ArgParser::OptionImpl<bool>::parse(const char **&) const { callback(true); }

/*----- Integral -----------------------------------------------------------------------------------------------------*/
PARSE(unsigned long);
PARSE(unsigned long long);

/*----- String -------------------------------------------------------------------------------------------------------*/
template<>
void ArgParser::OptionImpl<const char*>::parse(const char **&argv) const
{
    if (not *++argv) {
        std::cerr << "missing argument" << std::endl;
        std::exit(EXIT_FAILURE);
    }
    callback(*argv);
}

#undef PARSE

//----------------------------------------------------------------------------------------------------------------------

void ArgParser::print_args(std::ostream &out) const
{
    auto print = [this, &out](const char *Short, const char *Long, const char *Descr) {
        using std::setw, std::left, std::right;
        out << "    "
            << left << setw(short_len_) << Short << right
            << "  "
            << left << setw(long_len_) << Long << right
            << "    -    "
            << Descr
            << '\n';
    };

    out << "General:\n";
    for (auto &opt : general_options_)
        print(opt->short_name ? opt->short_name : "", opt->long_name ? opt->long_name : "", opt->description);
    for (auto &grp : grouped_options_) {
        out << grp.first << ":\n";
        for (auto &opt : grp.second)
            print(opt->short_name ? opt->short_name : "", opt->long_name ? opt->long_name : "", opt->description);
    }
}

void ArgParser::parse_args(int, const char **argv) {
    for (++argv; *argv; ++argv) {
        if (streq(*argv, "--"))
            goto positional;
        auto it = key_map_.find(*argv);
        if (it != key_map_.end()) {
            it->second.get().parse(argv); // option
        } else {
            if (strneq(*argv, "--", 2))
                std::cerr << "warning: ignore unknown option " << *argv << std::endl;
            else
                args_.emplace_back(*argv); // positional argument
        }
    }
    return;

    /* Read all following arguments as positional arguments. */
positional:
    for (++argv; *argv; ++argv)
        args_.emplace_back(*argv);
}
