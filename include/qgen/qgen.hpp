#pragma once

#include <qgen/dialect/DialectPolicy.hpp>
#include <qgen/dialect/DialectRegistry.hpp>
#include <qgen/IR/JoinResolver.hpp>
#include <qgen/IR/QueryModel.hpp>
#include <qgen/IR/SQLGenerator.hpp>
#include <qgen/qgen-config.hpp>
#include <qgen/util/exception.hpp>
#include <string>
#include <string_view>


namespace qg {

/** Translates `model` into SQL of the dialect `policy`.  Throws a `generation_error` on failure. */
inline std::string render(const QueryModel &model, const DialectPolicy &policy)
{
    return SQLGenerator(policy).render(model);
}

/** Translates `model` into SQL of the registered dialect `dialect`.  Throws `invalid_argument` if no such dialect is
 * registered, and a `generation_error` if translation fails. */
QG_EXPORT std::string render(const QueryModel &model, std::string_view dialect);

}
