#pragma once

#include <exception>
#include <string>
#include <utility>


namespace qg {

struct exception : std::exception
{
    private:
    const std::string message_;

    public:
    explicit exception(std::string message) : message_(std::move(message)) { }

    const char * what() const noexcept override { return message_.c_str(); }
};

/**
 * Base class for exceptions signaling an error in the logic.  Try to use a more precise subclass of `logic_error`
 * whenever you can.
 */
struct logic_error : exception
{
    explicit logic_error(std::string message) : exception(std::move(message)) { }
};

/** Signals that an argument to a function of method was invalid. */
struct invalid_argument : logic_error
{
    explicit invalid_argument(std::string message) : logic_error(std::move(message)) { }
};

/** Signals that an index-based or key-based access was out of range. */
struct out_of_range : logic_error
{
    explicit out_of_range(std::string message) : logic_error(std::move(message)) { }
};


/*======================================================================================================================
 * Generation errors
 *
 * Every failure of a render call derives from `generation_error`.  There are two families: the target dialect cannot
 * express what the model asks for (`unsupported_construct`), or the model itself is broken (`model_error`).  The
 * former is fixed by picking another dialect, the latter only by fixing the model.
 *====================================================================================================================*/

struct generation_error : exception
{
    explicit generation_error(std::string message) : exception(std::move(message)) { }
};

/** The dialect lacks a capability the model requires, e.g. outer joins. */
struct unsupported_construct : generation_error
{
    private:
    std::string feature_;

    public:
    explicit unsupported_construct(std::string feature)
        : generation_error("construct '" + feature + "' is not supported by the dialect")
        , feature_(std::move(feature))
    { }

    unsupported_construct(std::string feature, const std::string &detail)
        : generation_error("construct '" + feature + "' is not supported by the dialect: " + detail)
        , feature_(std::move(feature))
    { }

    /** Returns the name of the unsupported feature, e.g. `"outer-join"`. */
    const std::string & feature() const { return feature_; }
};

/** The model violates a structural invariant. */
struct model_error : generation_error
{
    explicit model_error(std::string message) : generation_error(std::move(message)) { }
};

/** Base class of the errors that name the two tables of the offending join. */
struct join_path_error : model_error
{
    private:
    std::string table_a_;
    std::string table_b_;

    public:
    join_path_error(std::string message, std::string table_a, std::string table_b)
        : model_error(std::move(message))
        , table_a_(std::move(table_a))
        , table_b_(std::move(table_b))
    { }

    const std::string & table_a() const { return table_a_; }
    const std::string & table_b() const { return table_b_; }
};

/** Two join edges connect the same pair of tables. */
struct duplicate_join_path : join_path_error
{
    duplicate_join_path(std::string table_a, std::string table_b)
        : join_path_error("additional join condition found between '" + table_a + "' and '" + table_b + "'",
                          table_a, table_b)
    { }
};

/** The join graph is not connected to the anchor table. */
struct unreachable_join_path : join_path_error
{
    unreachable_join_path(std::string table_a, std::string table_b)
        : join_path_error("no join path found between '" + table_a + "' and '" + table_b + "'", table_a, table_b)
    { }
};

/** Any other violated model invariant, e.g. an alias used twice. */
struct malformed_model : model_error
{
    explicit malformed_model(std::string message) : model_error("malformed query model: " + std::move(message)) { }
};

}
