#pragma once

#include <cstdint>
#include <optional>
#include <qgen/qgen-config.hpp>


namespace qg {

/** Singleton class representing options provided as command line argument to the binaries.  Implements Scott Meyer's
 * singleton pattern.  */
struct QG_EXPORT Options
{
    /*----- Help -----------------------------------------------------------------------------------------------------*/
    bool show_help;
    bool list_dialects;

    /*----- Output configuration -------------------------------------------------------------------------------------*/
    bool has_color;
    bool quiet;
    /** If `true`, print the resolved join plan before the SQL text. */
    bool plan;

    /*----- Generation -----------------------------------------------------------------------------------------------*/
    /** The name of the dialect to generate; `nullptr` selects the default dialect. */
    const char *dialect;
    /** If set, overrides the row limit of every model. */
    std::optional<uint64_t> limit;

    private:
    Options() = default;
    public:
    Options(const Options&) = delete;
    Options & operator=(const Options&) = delete;

    /** Return a reference to the single `Options` instance. */
    static Options & Get();
};

}
