// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "ftps/ftp_reply.h"
#include <catch2/catch.hpp>

namespace ftps::test
{
TEST_CASE("classifyReply", "[unit]")
{
    CHECK(classifyReply(150) == ReplyClass::positivePreliminary);
    CHECK(classifyReply(226) == ReplyClass::positiveCompletion);
    CHECK(classifyReply(331) == ReplyClass::positiveIntermediate);
    CHECK(classifyReply(425) == ReplyClass::transientNegative);
    CHECK(classifyReply(550) == ReplyClass::permanentNegative);

    CHECK_THROWS_AS(classifyReply(0),   ProtocolError);
    CHECK_THROWS_AS(classifyReply(99),  ProtocolError);
    CHECK_THROWS_AS(classifyReply(600), ProtocolError);
}

TEST_CASE("isSuccess", "[unit]")
{
    CHECK_FALSE(isSuccess(150));
    CHECK(isSuccess(200));
    CHECK(isSuccess(234));
    CHECK(isSuccess(331));
    CHECK_FALSE(isSuccess(421));
    CHECK_FALSE(isSuccess(530));

    try
    {
        isSuccess(700);
        FAIL("no exception");
    }
    catch (const ProtocolError& e)
    {
        CHECK(e.ftpReplyCode == 700);
    }
}

TEST_CASE("single line reply", "[unit]")
{
    FtpReplyParser parser;
    const std::optional<FtpReply> reply = parser.pushLine("220 Service ready");
    REQUIRE(reply);
    CHECK(reply->code == 220);
    CHECK(reply->getText() == "220 Service ready");
    CHECK(parser.isIdle());

    //bare status code
    const std::optional<FtpReply> bare = parser.pushLine("200");
    REQUIRE(bare);
    CHECK(bare->code == 200);
}

TEST_CASE("multi-line reply", "[unit]")
{
    FtpReplyParser parser;
    CHECK_FALSE(parser.pushLine("123-First line"));
    CHECK_FALSE(parser.isIdle());
    CHECK_FALSE(parser.pushLine("Second line"));
    CHECK_FALSE(parser.pushLine(" 234 A line beginning with numbers"));
    CHECK_FALSE(parser.pushLine("456 different code does not terminate"));
    CHECK_FALSE(parser.pushLine("123-same code with dash does not terminate"));

    const std::optional<FtpReply> reply = parser.pushLine("123 The last line");
    REQUIRE(reply);
    CHECK(reply->code == 123);
    CHECK(reply->lines.size() == 6);
    CHECK(reply->lines[2] == " 234 A line beginning with numbers");
    CHECK(reply->lines.back() == "123 The last line");
    CHECK(parser.isIdle());

    //parser is reusable
    const std::optional<FtpReply> next = parser.pushLine("221 Goodbye");
    REQUIRE(next);
    CHECK(next->code == 221);
}

TEST_CASE("malformed status line", "[unit]")
{
    FtpReplyParser parser;
    CHECK_THROWS_AS(parser.pushLine("hello world"), ProtocolError);
    CHECK_THROWS_AS(parser.pushLine("22 short"), ProtocolError);
    CHECK_THROWS_AS(parser.pushLine("220Xnot a separator"), ProtocolError);
    CHECK_THROWS_AS(parser.pushLine("099 out of range"), ProtocolError);
    CHECK_THROWS_AS(parser.pushLine("600 out of range"), ProtocolError);
}

TEST_CASE("splitFtpResponse", "[unit]")
{
    const std::string buf = "line1\r\nline2\n\r\nline3";
    const std::vector<std::string_view> lines = splitFtpResponse(buf);
    REQUIRE(lines.size() == 3);
    CHECK(lines[0] == "line1");
    CHECK(lines[1] == "line2");
    CHECK(lines[2] == "line3");

    const std::string emptyBuf;
    CHECK(splitFtpResponse(emptyBuf).empty());
}

TEST_CASE("formatFtpStatus", "[unit]")
{
    CHECK(formatFtpStatus(550) == "FTP status 550: File unavailable, e.g. file not found, no access.");
    CHECK(formatFtpStatus(299) == "FTP status 299.");

    const FtpReply reply{426, {"426 Connection closed; transfer aborted."}};
    CHECK(formatFtpReply(reply) == "FTP status 426: Connection closed; transfer aborted. (426 Connection closed; transfer aborted.)");
}

TEST_CASE("FtpLineParser", "[unit]")
{
    const std::string_view line = "drwx 42 name";
    FtpLineParser parser(line);

    CHECK(parser.readRange(4, [](char c) { return c == 'd' || c == 'r' || c == 'w' || c == 'x'; }) == "drwx");
    CHECK(parser.readRange([](char c) { return c == ' '; }) == " ");
    CHECK(parser.peekNextChar() == '4');
    CHECK(parser.readRange([](char c) { return fse::isDigit(c); }) == "42");

    CHECK_THROWS_AS(parser.readRange([](char c) { return fse::isDigit(c); }), fse::SysError); //empty range
    CHECK_THROWS_AS(parser.readRange(10, [](char) { return true; }), fse::SysError); //past end of line
}
}
