#include <qgen/Options.hpp>


using namespace qg;


Options & Options::Get()
{
    static Options the_options;
    return the_options;
}
