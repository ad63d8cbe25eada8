#pragma once

#include <cstddef>
#include <iostream>
#include <qgen/util/fn.hpp>
#include <qgen/util/macro.hpp>
#include <sstream>
#include <string>


namespace qg {

/** A location in a named input, e.g. a model file. */
struct Position
{
    const char *name;
    unsigned line;
    unsigned column;

    explicit Position(const char *name)
        : name(name)
        , line(0)
        , column(0)
    { }

    explicit Position(const char *name, const std::size_t line, const std::size_t column)
        : name(name)
        , line(line)
        , column(column)
    { }

    bool operator==(Position other) const {
        return streq(this->name, other.name) and this->line == other.line and this->column == other.column;
    }
    bool operator!=(Position other) const { return not operator==(other); }

QG_LCOV_EXCL_START
    friend std::string to_string(const Position &pos) {
        std::ostringstream os;
        os << pos;
        return os.str();
    }

    friend std::ostream & operator<<(std::ostream &os, const Position &pos) {
        return os << pos.name << ":" << pos.line << ":" << pos.column;
    }
QG_LCOV_EXCL_STOP
};

}
