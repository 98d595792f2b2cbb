// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "ftps/timestamp_query.h"
#include <catch2/catch.hpp>

namespace ftps::test
{
using namespace std::chrono;


TEST_CASE("parseMdtmReply", "[unit]")
{
    const FtpTimestamp ts = parseMdtmReply({213, {"213 20170113063314"}});

    CHECK(ts.calendar.year   == 2017);
    CHECK(ts.calendar.month  == 1);
    CHECK(ts.calendar.day    == 13);
    CHECK(ts.calendar.hour   == 6);
    CHECK(ts.calendar.minute == 33);
    CHECK(ts.calendar.second == 14);
    CHECK(ts.millisecond == 0);
    CHECK(ts.modTime == 1484289194);
    CHECK(ts.instant == system_clock::from_time_t(1484289194));
}

TEST_CASE("parseMdtmReply with milliseconds", "[unit]")
{
    const FtpTimestamp ts = parseMdtmReply({213, {"213 20170113063314.123"}});
    CHECK(ts.millisecond == 123);
    CHECK(ts.modTime == 1484289194);
    CHECK(ts.instant == system_clock::from_time_t(1484289194) + milliseconds(123));

    //fewer digits: fraction of a second
    CHECK(parseMdtmReply({213, {"213 20170113063314.5"}}).millisecond == 500);
    //more digits: truncated
    CHECK(parseMdtmReply({213, {"213 20170113063314.123456"}}).millisecond == 123);
}

TEST_CASE("parseMdtmReply errors", "[unit]")
{
    CHECK_THROWS_AS(parseMdtmReply({213, {"213 2017011306331"}}),  ProtocolError);
    CHECK_THROWS_AS(parseMdtmReply({213, {"213 20171313063314"}}), ProtocolError);
    CHECK_THROWS_AS(parseMdtmReply({213, {"213 20170113063314."}}), ProtocolError);
    CHECK_THROWS_AS(parseMdtmReply({213, {"213 20170113063314.12a"}}), ProtocolError);
    CHECK_THROWS_AS(parseMdtmReply({213, {"213 yesterday"}}), ProtocolError);
    CHECK_THROWS_AS(parseMdtmReply({200, {"200 20170113063314"}}), ProtocolError);

    try
    {
        parseMdtmReply({250, {"250 Whatever"}});
        FAIL("no exception");
    }
    catch (const ProtocolError& e)
    {
        CHECK(e.ftpReplyCode == 250);
    }
}

TEST_CASE("timestamp representations agree", "[unit]")
{
    const FtpTimestamp ts = parseMdtmReply({213, {"213 20200229235959.999"}});
    const FtpFile file = makeFileRecord("/folder/leap.txt", ts);

    CHECK(file.name == "leap.txt");
    CHECK(file.type == FtpItemType::file);
    CHECK(file.modTime == ts.instant);
    CHECK(system_clock::to_time_t(floor<seconds>(ts.instant)) == ts.modTime);
    CHECK(fse::getUtcTime(ts.modTime) == ts.calendar);

    //same reply => value-equal results
    CHECK(parseMdtmReply({213, {"213 20200229235959.999"}}) == ts);
}

TEST_CASE("makeFtpTimestamp", "[unit]")
{
    const system_clock::time_point instant = system_clock::from_time_t(1484289194) + milliseconds(42);
    const FtpTimestamp ts = makeFtpTimestamp(instant);

    CHECK(ts.instant == instant);
    CHECK(ts.millisecond == 42);
    CHECK(ts.modTime == 1484289194);
    CHECK(ts == parseMdtmReply({213, {"213 20170113063314.042"}}));
}
}
