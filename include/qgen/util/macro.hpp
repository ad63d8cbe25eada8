/*--- macro.hpp --------------------------------------------------------------------------------------------------------
 *
 * Checks of internal invariants and markers for coverage tools.  The checks are active in debug builds only; a failed
 * check reports its source location on `std::cerr` and aborts.  User errors are never reported through these macros,
 * they throw a `qg::exception` instead.
 *
 *--------------------------------------------------------------------------------------------------------------------*/

#pragma once

#include <cstdlib>
#include <iostream>


namespace qg {

/*===== Coverage exclusion ===========================================================================================*/
#define QG_LCOV_EXCL_START /* Start exclusion block */
#define QG_LCOV_EXCL_STOP  /* Stop exclusion block */

#ifndef NDEBUG
/** Reports a failed check at `filename:line` and aborts.  `what` describes the failure, `msg` optionally explains. */
[[noreturn]] inline void _fail(const char *filename, const unsigned line, const char *what, const char *msg = nullptr)
{
    std::cout.flush();
    std::cerr << filename << ':' << line << ": " << what;
    if (msg)
        std::cerr << "  " << msg << '.';
    std::cerr << std::endl;
    std::abort();
}
#endif

/*======================================================================================================================
 * QG_insist(COND [, MSG])
 *
 * Checks `COND` and fails if it evaluates to `false`, optionally explaining the condition with `MSG`.  In release
 * build, `COND` is not evaluated.
 *====================================================================================================================*/

#ifndef NDEBUG
#define QG_INSIST2_(COND, MSG) \
    ((COND) ? (void) 0 : ::qg::_fail(__FILE__, __LINE__, "Condition '" #COND "' failed.", (MSG)))
#else
#define QG_INSIST2_(COND, MSG) while (0) { ((void) (COND), (void) (MSG)); }
#endif
#define QG_INSIST1_(COND) QG_INSIST2_(COND, nullptr)

#define QG_SELECT_INSIST_(_1, _2, NAME, ...) NAME
#define QG_insist(...) QG_SELECT_INSIST_(__VA_ARGS__, QG_INSIST2_, QG_INSIST1_, XXX)(__VA_ARGS__)

/*======================================================================================================================
 * QG_unreachable(MSG)
 *
 * Marks code that control flow never reaches, e.g. after a `switch` over all enumerators.  Fails with `MSG` when
 * reached in debug build; in release build, lets the compiler assume it is never reached.
 *====================================================================================================================*/

#ifndef NDEBUG
#define QG_unreachable(MSG) ::qg::_fail(__FILE__, __LINE__, (MSG))
#else
#define QG_unreachable(MSG) __builtin_unreachable()
#endif

}
