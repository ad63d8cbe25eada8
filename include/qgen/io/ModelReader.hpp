#pragma once

#include <iostream>
#include <qgen/IR/QueryModel.hpp>
#include <qgen/qgen-config.hpp>
#include <qgen/util/Diagnostic.hpp>
#include <string>
#include <vector>


namespace qg {

/** Reads a `QueryModel` from a line-oriented text format.  Every non-empty line that does not start with the comment
 * character is one record.  The first field of a record names its kind, the remaining fields are its arguments:
 *
 *  | Record                                                           | Effect                            |
 *  |------------------------------------------------------------------|-----------------------------------|
 *  | `distinct`                                                       | eliminate duplicate rows          |
 *  | `select | expr [| alias]`                                        | add a selection                   |
 *  | `table | name [| alias]`                                         | add a table                       |
 *  | `join | left | l_alias | right | r_alias | pred [| key [| type]]` | add a join                        |
 *  | `where | pred`                                                   | add a WHERE predicate             |
 *  | `group | expr`                                                   | add a GROUP BY expression         |
 *  | `having | pred`                                                  | add a HAVING predicate            |
 *  | `order | expr [| asc or desc]`                                   | add an ORDER BY item              |
 *  | `limit | n`                                                      | limit the number of rows          |
 *
 * The join type is one of `inner` (the default), `left`, `right`, and `full`.  Fields are trimmed.  A field may be
 * enclosed in quotes, in which case it may contain the delimiter, and the escape character takes the next character
 * literally.  Malformed records are reported to the `Diagnostic` and skipped.
 */
struct QG_EXPORT ModelReader
{
    /** Configuration parameters of the format.
     *
     * By default, the `Config` uses the following settings:
     *
     *  | Type      | Symbol             |
     *  |-----------|--------------------|
     *  | delimiter | `|` (pipe)         |
     *  | quote     | `"` (double quote) |
     *  | escape    | `\\` (backslash)   |
     *  | comment   | `#` (hash)         |
     */
    struct Config
    {
        ///> the delimiter separating fields
        char delimiter = '|';
        ///> the quotation mark for fields
        char quote = '"';
        ///> the character to escape special characters within quoted fields
        char escape = '\\';
        ///> the character that starts a comment line
        char comment = '#';
    };

    private:
    /** A field of a record, together with the column it starts at. */
    struct Field
    {
        std::string text;
        unsigned column;
    };

    Config cfg_;
    Diagnostic &diag_;
    const char *name_ = "-"; ///< name of the input currently read

    public:
    explicit ModelReader(Diagnostic &diag);
    ModelReader(Diagnostic &diag, Config cfg);

    const Config & config() const { return cfg_; }

    /** Reads a model from `in`.  `name` identifies the input in diagnostics.  Returns the model built from all
     * well-formed records; check `Diagnostic::num_errors()` to learn whether any record was rejected. */
    QueryModel operator()(std::istream &in, const char *name = "-");

    private:
    /** Splits `line` into fields.  Returns `false` and reports an error if the line is malformed. */
    bool split(const std::string &line, unsigned lineno, std::vector<Field> &fields);
    /** Adds the record given by `fields` to `model`. */
    void apply(QueryModel &model, const std::vector<Field> &fields, unsigned lineno);
    /** Checks that the record has between `min` and `max` fields, kind included.  Reports an error otherwise. */
    bool check_arity(const std::vector<Field> &fields, unsigned lineno, std::size_t min, std::size_t max);
    /** Checks that `field` is not empty.  Reports an error naming `what` otherwise. */
    bool require(const Field &field, unsigned lineno, const char *what);

    Position pos(unsigned lineno, unsigned column) const { return Position(name_, lineno, column); }
};

}
