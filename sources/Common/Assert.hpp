/**************************************************************************
 *   Created: May 19, 2012 11:48:58 AM
 *    Author: Eugene V. Palchukovsky
 *    E-mail: eugene@palchukovsky.com
 * -------------------------------------------------------------------
 *   Project: Ecosystem Connector
 *       URL: http://robotdk.com
 * Copyright: Eugene V. Palchukovsky
 **************************************************************************/

// No include guard: the macros are restored after other headers undefine
// them.

#include <boost/assert.hpp>
#include <boost/current_function.hpp>

#undef Assert
#undef AssertEq
#undef AssertLe
#undef AssertFailNoException

#define Assert(expr) BOOST_ASSERT(expr)
#define AssertEq(expr1, expr2) \
  BOOST_ASSERT_MSG((expr1) == (expr2), #expr1 " is not equal to " #expr2)
#define AssertLe(expr1, expr2)                                               \
  BOOST_ASSERT_MSG((expr1) <= (expr2), #expr1 " is not less than or equal to " \
                                              #expr2)

namespace ecosys {
namespace Debug {
//! Reports exception which has been caught where it must not appear.
/** Has to be called from a catch-block.
  */
void ReportUnexpectedException(const char *function,
                               const char *file,
                               long line) noexcept;
}  // namespace Debug
}  // namespace ecosys

#define AssertFailNoException()                   \
  ::ecosys::Debug::ReportUnexpectedException(     \
      BOOST_CURRENT_FUNCTION, __FILE__, __LINE__)
