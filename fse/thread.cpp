// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "thread.h"
#include <sys/prctl.h>

using namespace fse;


void fse::setCurrentThreadName(const std::string& threadName)
{
    //Linux limits thread names to 16 chars including null-termination: truncated silently
    ::prctl(PR_SET_NAME, threadName.c_str(), 0, 0, 0);
}
