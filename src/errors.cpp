#include <secret_santa/errors.hpp>

namespace secret_santa
{

char const* to_string(constraint_source source)
{
    switch (source)
    {
    case constraint_source::none:
        return "none";
    case constraint_source::self:
        return "self";
    case constraint_source::blacklist:
        return "blacklist";
    case constraint_source::household:
        return "blacklist_sets";
    case constraint_source::history:
        return "history";
    case constraint_source::whitelist:
        return "whitelist";
    case constraint_source::no_two_cycles:
        return "no two-cycles";
    }
    return "none";
}

}
