// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SYS_ERROR_H_1098472309487120934
#define SYS_ERROR_H_1098472309487120934

#include <cerrno>
#include "scope_guard.h"
#include "string_tools.h"
#include "extra_log.h"


namespace fse
{
using ErrorCode = int; //errno

ErrorCode getLastError();

std::string formatSystemError(const std::string& functionName, const std::string& errorCode, const std::string& errorMsg);
std::string formatSystemError(const std::string& functionName, ErrorCode ec);


//root of all exceptions thrown by fse and the FTPS engine: carries a technical, untranslated message
class SysError
{
public:
    explicit SysError(const std::string& msg) : msg_(msg) {}
    const std::string& toString() const { return msg_; }

private:
    std::string msg_;
};

#define DEFINE_NEW_SYS_ERROR(X) struct X : public fse::SysError { explicit X(const std::string& msg) : SysError(msg) {} };



//macro: errno must be captured before evaluating anything else
#define THROW_LAST_SYS_ERROR(functionName)                           \
    do { const fse::ErrorCode ecInternal = fse::getLastError(); throw fse::SysError(fse::formatSystemError(functionName, ecInternal)); } while (false)


//sanity check on values returned by system and OpenSSL calls: throws instead of crashing
#define ASSERT_SYSERROR(expr) ASSERT_SYSERROR_IMPL(expr, #expr) //throw SysError



//######################## implementation ########################
inline
ErrorCode getLastError()
{
    return errno;
}


std::string getSystemErrorDescription(ErrorCode ec); //strerror text; errno is preserved


namespace impl
{
inline bool validateBool(bool  b) { return b; }
inline bool validateBool(void* b) { return b; }
bool validateBool(int) = delete; //catch unintended bool conversions
}
#define ASSERT_SYSERROR_IMPL(expr, exprStr) \
    { if (!fse::impl::validateBool(expr))        \
            throw fse::SysError("Assertion failed: \"" exprStr "\""); }
}

#endif //SYS_ERROR_H_1098472309487120934
