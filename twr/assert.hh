#define BOOST_ENABLE_ASSERT_HANDLER
#include <boost/assert.hpp>
#include "twr/error.h"
#ifdef assert
#undef assert
#endif
#ifdef NDEBUG
#define assert(expr)          (0?(void(expr)):(void(0)))
#else
#define assert(expr)  BOOST_ASSERT(expr)
#endif

#ifndef TWR_ASSERT_H
#define TWR_ASSERT_H
namespace boost
{
    inline void assertion_failed(char const * expr, char const * function, char const * file, long line)
    {
	throw ::twr::TWRError()<<"Assertion ("<<expr<<") failed in '"<<function<<"' at "<<file<<":"<<line;
    }

    // BOOST_ASSERT_MSG in boost headers
    inline void assertion_failed_msg(char const * expr, char const * msg, char const * function, char const * file, long line)
    {
	throw ::twr::TWRError()<<"Assertion ("<<expr<<") failed in '"<<function<<"' at "<<file<<":"<<line<<":\n   "<<msg;
    }
}
#endif
