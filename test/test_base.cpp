// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <fse/sys_error.h>
#include <fse/thread.h>
#include <catch2/catch.hpp>

using namespace fse;


namespace ftps::test
{
TEST_CASE("interruptible thread stops a sleeping worker", "[unit]")
{
    std::atomic<bool> stopped = false;
    const auto startTime = std::chrono::steady_clock::now();
    {
        InterruptibleThread worker([&]
        {
            FSE_ON_SCOPE_FAIL(stopped = true);
            interruptibleSleep(std::chrono::seconds(30)); //throw ThreadStopRequest
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    } //destructor: stop + join

    CHECK(stopped);
    CHECK(std::chrono::steady_clock::now() - startTime < std::chrono::seconds(5));
}


TEST_CASE("stop request seen at the next interruption point", "[unit]")
{
    std::atomic<bool> workerRunning = false;
    std::atomic<int> iterations = 0;

    InterruptibleThread worker([&]
    {
        for (;;)
        {
            workerRunning = true;
            interruptionPoint(); //throw ThreadStopRequest
            ++iterations;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    });
    while (!workerRunning)
        std::this_thread::sleep_for(std::chrono::milliseconds(1));

    worker.requestStop();
    worker.join();
    CHECK_FALSE(worker.joinable());

    //outside an InterruptibleThread there is nothing to stop
    CHECK_NOTHROW(interruptionPoint());
}


TEST_CASE("scope guards", "[unit]")
{
    std::vector<std::string> trace;

    SECTION("success")
    {
        {
            FSE_ON_SCOPE_EXIT(trace.push_back("exit"));
            FSE_ON_SCOPE_FAIL(trace.push_back("fail"));
        }
        CHECK(trace == std::vector<std::string>{"exit"});
    }

    SECTION("exception")
    {
        try
        {
            FSE_ON_SCOPE_EXIT(trace.push_back("exit"));
            FSE_ON_SCOPE_FAIL(trace.push_back("fail"));
            throw SysError("transfer failed");
        }
        catch (const SysError& e) { CHECK(e.toString() == "transfer failed"); }

        //reverse order of declaration
        CHECK(trace == (std::vector<std::string>{"fail", "exit"}));
    }
}


TEST_CASE("system error formatting", "[unit]")
{
    CHECK(formatSystemError("recv", ETIMEDOUT).starts_with("ETIMEDOUT: "));
    CHECK(formatSystemError("recv", ETIMEDOUT).ends_with(" [recv]"));
    CHECK(formatSystemError("getaddrinfo", "", "Empty server info.") == "Empty server info. [getaddrinfo]");
    CHECK(formatSystemError("", " EAI_AGAIN ", " Try again. ") == "EAI_AGAIN: Try again.");
    CHECK(formatSystemError("select", "", "") == "[select]");

    //unnamed codes by number
    CHECK(formatSystemError("", 12345).starts_with("Error code 12345"));

    errno = EPIPE;
    try
    {
        THROW_LAST_SYS_ERROR("send");
    }
    catch (const SysError& e) { CHECK(e.toString().starts_with("EPIPE: ")); }
}


TEST_CASE("log entry formatting", "[unit]")
{
    ErrorLog log;
    logMsg(log, "Data transfer failed.\n\n\nConnection reset by peer.\n", MSG_TYPE_ERROR);
    logMsg(log, "Keep-alive failed", MSG_TYPE_WARNING);
    logMsg(log, "Connected", MSG_TYPE_INFO);

    const ErrorLogStats stats = getStats(log);
    CHECK(stats.error   == 1);
    CHECK(stats.warning == 1);
    CHECK(stats.info    == 1);

    //continuation lines aligned below the first one, empty lines dropped
    const std::string msg = formatMessage(log[0]);
    const size_t prefixLen = msg.find("Data transfer failed.");
    REQUIRE(prefixLen != std::string::npos);
    CHECK(msg.find("]  Error:  ") != std::string::npos);
    CHECK(msg.substr(prefixLen) == "Data transfer failed.\n" + std::string(prefixLen, ' ') + "Connection reset by peer.\n");

    CHECK(formatMessage(log[1]).find("]  Warning:  Keep-alive failed\n") != std::string::npos);
}
}
