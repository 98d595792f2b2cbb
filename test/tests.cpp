// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <fse/extra_log.h>
#include "util/test_log.h"

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

using namespace ftps;


int main(int argc, char* argv[])
{
    using namespace Catch::clara;

    Catch::Session session;

    auto cli = session.cli()
               | Opt(test::showFtpsLog())
               ["--show-ftps-log"]
               ("Show FTPS session log");

    session.cli(cli);

    if (const int rc = session.applyCommandLine(argc, argv);
        rc != 0)
        return rc;

    try
    {
        ftpsInit(); //throw SysError
    }
    catch (const fse::SysError& e)
    {
        std::cerr << e.toString() << '\n';
        return 1;
    }

    //errors from nothrow clean up (e.g. a failed close_notify) during global shutdown
    fse::initExtraLog([](const fse::ErrorLog& log)
    {
        for (const fse::LogEntry& entry : log)
            std::cerr << fse::formatMessage(entry);
    });

    const int rc = session.run();

    for (const fse::LogEntry& entry : fse::fetchExtraLog())
        std::cerr << fse::formatMessage(entry);
    return rc;
}
