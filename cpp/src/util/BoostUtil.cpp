// boost::json is used header-only. This must appear in exactly one translation unit.
#include <boost/json/src.hpp>
