#include <qgen/qgen.hpp>


using namespace qg;


std::string qg::render(const QueryModel &model, std::string_view dialect)
{
    auto &policy = DialectRegistry::Get().get(dialect);
    return SQLGenerator(policy).render(model);
}
