#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <qgen/io/ModelReader.hpp>
#include <qgen/Options.hpp>
#include <qgen/qgen.hpp>
#include <qgen/util/ArgParser.hpp>
#include <qgen/util/Diagnostic.hpp>
#include <qgen/util/fn.hpp>
#include <string>


using namespace qg;


void usage(std::ostream &out, const char *name)
{
    out << "Translates query models into the SQL of a target dialect.\n"
        << "USAGE:\n\t" << name << " [<FILE>...]"
        << std::endl;
}

/** Reads one query model from `in` and prints its translation into the dialect `policy` to `std::cout`. */
void process_stream(std::istream &in, const char *filename, const DialectPolicy &policy, Diagnostic &diag)
{
    const unsigned num_errors_before = diag.num_errors();

    ModelReader reader(diag);
    QueryModel model = reader(in, filename);
    if (diag.num_errors() != num_errors_before)
        return; // do not translate a model with rejected records

    if (Options::Get().limit)
        model.limit(*Options::Get().limit);

    try {
        const std::string sql = SQLGenerator(policy).render(model);
        if (Options::Get().plan and not model.joins().empty())
            resolve_joins(model.joins(), policy).dump(std::cout);
        std::cout << sql;
        std::cout.flush();
    } catch (const generation_error &e) {
        diag.err() << filename << ": " << e.what() << std::endl;
    }
}

int main(int argc, const char **argv)
{
    auto &R = DialectRegistry::Get();

    bool show_any_help = false;

    /*----- Parse command line arguments. ----------------------------------------------------------------------------*/
    ArgParser AP;
#define ADD(TYPE, VAR, INIT, SHORT, LONG, DESCR, CALLBACK)\
    VAR = INIT;\
    {\
        AP.add<TYPE>(SHORT, LONG, DESCR, CALLBACK);\
    }
    /*----- Help message ---------------------------------------------------------------------------------------------*/
    ADD(bool, Options::Get().show_help, false,              /* Type, Var, Init  */
        "-h", "--help",                                     /* Short, Long      */
        "prints this help message",                         /* Description      */
        [&](bool) {                                         /* Callback         */
            show_any_help = true;
            Options::Get().show_help = true;
        });
    ADD(bool, Options::Get().list_dialects, false,          /* Type, Var, Init  */
        nullptr, "--list-dialects",                         /* Short, Long      */
        "list all available dialects",                      /* Description      */
        [&](bool) {                                         /* Callback         */
            Options::Get().list_dialects = true;
            show_any_help = true;
        });
    /*----- Output configuration -------------------------------------------------------------------------------------*/
    ADD(bool, Options::Get().has_color, false,              /* Type, Var, Init  */
        nullptr, "--color",                                 /* Short, Long      */
        "use colors",                                       /* Description      */
        [&](bool) { Options::Get().has_color = true; });    /* Callback         */
    ADD(bool, Options::Get().quiet, false,                  /* Type, Var, Init  */
        "-q", "--quiet",                                    /* Short, Long      */
        "work in quiet mode",                               /* Description      */
        [&](bool) { Options::Get().quiet = true; });        /* Callback         */
    ADD(bool, Options::Get().plan, false,                   /* Type, Var, Init  */
        nullptr, "--plan",                                  /* Short, Long      */
        "print the resolved join plan",                     /* Description      */
        [&](bool) { Options::Get().plan = true; });         /* Callback         */
    /*----- Generation -----------------------------------------------------------------------------------------------*/
    ADD(const char*, Options::Get().dialect, nullptr,                           /* Type, Var, Init  */
        "-d", "--dialect",                                                      /* Short, Long      */
        "the dialect to generate",                                              /* Description      */
        [&](const char *str) { Options::Get().dialect = str; });                /* Callback         */
    ADD(uint64_t, Options::Get().limit, std::nullopt,                           /* Type, Var, Init  */
        nullptr, "--limit",                                                     /* Short, Long      */
        "limit the number of rows of every query",                              /* Description      */
        [&](uint64_t n) { Options::Get().limit = n; });                         /* Callback         */
#undef ADD
    AP.parse_args(argc, argv);

    if (Options::Get().show_help) {
        usage(std::cout, argv[0]);
        std::cout << "WHERE\n" << AP;
    }

    if (Options::Get().list_dialects) {
        std::cout << "List of available dialects:";
        std::size_t max_len = 0;
        for (auto &dialect : R) max_len = std::max(max_len, dialect.first.length());
        for (auto &dialect : R) {
            std::cout << "\n    " << std::setw(max_len) << std::left << dialect.first;
            if (not dialect.second.description().empty())
                std::cout << "    -    " << dialect.second.description();
            if (dialect.first == R.get_default_name())
                std::cout << " (default)";
        }
        std::cout << std::endl;
    }

    if (show_any_help)
        std::exit(EXIT_SUCCESS);

    /* Create the diagnostics object. */
    Diagnostic diag(Options::Get().has_color, std::cout, std::cerr);

    /*----- Select the dialect. --------------------------------------------------------------------------------------*/
    const DialectPolicy *policy = nullptr;
    try {
        policy = Options::Get().dialect ? &R.get(Options::Get().dialect) : &R.get_default();
    } catch (const invalid_argument &e) {
        diag.err() << e.what() << ".  Use --list-dialects to see all dialects." << std::endl;
        std::exit(EXIT_FAILURE);
    }

    if (not Options::Get().quiet)
        std::cerr << "generating SQL for dialect " << policy->name() << std::endl;

    auto args = AP.args();
    if (args.empty())
        args.push_back("-"); // read from stdin

    /* Process all the inputs. */
    for (auto filename : args) {
        /*----- Open the input stream. -------------------------------------------------------------------------------*/
        if (streq("-", filename)) {
            process_stream(std::cin, "-", *policy, diag);
        } else {
            std::ifstream in(filename);
            if (not in) {
                const auto errsv = errno;
                diag.err() << "Could not open file '" << filename << '\'';
                if (errsv)
                    std::cerr << ": " << strerror(errsv);
                std::cerr << ".  Aborting." << std::endl;
                break;
            }
            process_stream(in, filename, *policy, diag);
        }
    }

    std::exit(diag.num_errors() ? EXIT_FAILURE : EXIT_SUCCESS);
}
