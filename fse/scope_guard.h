// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SCOPE_GUARD_H_4419823740918237461
#define SCOPE_GUARD_H_4419823740918237461

#include <exception>
#include <utility>


namespace fse
{
/*  run clean up code when the enclosing scope is left:

        FSE_ON_SCOPE_EXIT(::SSL_free(ssl));      always
        FSE_ON_SCOPE_FAIL(conn->abort());        only while an exception propagates      */

enum class ScopeGuardRunMode
{
    onExit,
    onFail
};


template <ScopeGuardRunMode runMode, class F>
class ScopeGuard
{
public:
    explicit ScopeGuard(F&& fun) : fun_(std::move(fun)) {}

    ~ScopeGuard() noexcept(runMode == ScopeGuardRunMode::onFail)
    {
        const bool unwinding = std::uncaught_exceptions() > exceptionCount_;

        if constexpr (runMode == ScopeGuardRunMode::onFail)
        {
            if (unwinding)
                fun_();
        }
        else if (unwinding)
            [&]() noexcept { fun_(); }(); //second exception in flight: terminate right here
        else
            fun_(); //throw X
    }

private:
    ScopeGuard           (const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

    F fun_;
    const int exceptionCount_ = std::uncaught_exceptions();
};


template <ScopeGuardRunMode runMode, class F> inline
ScopeGuard<runMode, F> makeGuard(F&& fun) { return ScopeGuard<runMode, F>(std::move(fun)); } //guaranteed copy elision
}

#define FSE_CONCAT_SUB(X, Y) X ## Y
#define FSE_CONCAT(X, Y) FSE_CONCAT_SUB(X, Y)

#define FSE_CHECK_CASE_FOR_CONSTANT(X) case X: return #X

#define FSE_ON_SCOPE_EXIT(X) [[maybe_unused]] auto FSE_CONCAT(scopeGuard, __LINE__) = fse::makeGuard<fse::ScopeGuardRunMode::onExit>([&]{ X; });
#define FSE_ON_SCOPE_FAIL(X) [[maybe_unused]] auto FSE_CONCAT(scopeGuard, __LINE__) = fse::makeGuard<fse::ScopeGuardRunMode::onFail>([&]{ X; });

#endif //SCOPE_GUARD_H_4419823740918237461
