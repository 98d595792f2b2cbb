// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FTP_REPLY_H_1902837465019283746
#define FTP_REPLY_H_1902837465019283746

#include <algorithm>
#include <optional>
#include <vector>
#include "ftps_error.h"


namespace ftps
{
//FTP commands:      https://en.wikipedia.org/wiki/List_of_FTP_commands
//FTP reply codes:   https://tools.ietf.org/html/rfc959#section-4.2

enum class ReplyClass
{
    positivePreliminary,  //1yz
    positiveCompletion,   //2yz
    positiveIntermediate, //3yz
    transientNegative,    //4yz
    permanentNegative,    //5yz
};

ReplyClass classifyReply(int replyCode); //throw ProtocolError

//flow control: only 2yz and 3yz count as success
bool isSuccess(int replyCode); //throw ProtocolError


struct FtpReply
{
    int code = 0;
    std::vector<std::string> lines; //raw lines without CRLF, including the status prefix

    std::string getText() const; //all lines joined by '\n'
};

//"FTP status 550: File unavailable, e.g. file not found, no access."
std::string formatFtpStatus(int replyCode);

//"FTP status 550: File unavailable... (550 /missing: No such file or directory)"
std::string formatFtpReply(const FtpReply& reply);


//assemble (possibly multi-line) replies from a stream of lines:
//  123-First line
//  Second line
//   234 A line beginning with numbers
//  123 The last line
class FtpReplyParser
{
public:
    //returns reply once the terminating line is seen
    std::optional<FtpReply> pushLine(const std::string& line); //throw ProtocolError

    bool isIdle() const { return lines_.empty(); }

private:
    int code_ = 0;
    std::vector<std::string> lines_;
};


//split raw FTP buffer (listing, FEAT) into non-empty lines; tolerates CRLF, LF
std::vector<std::string_view> splitFtpResponse(const std::string& buf);
std::vector<std::string_view> splitFtpResponse(std::string&&) = delete;


class FtpLineParser
{
public:
    explicit FtpLineParser(const std::string_view& line) : it_(line.begin()), itEnd_(line.end()) {}
    /**/     FtpLineParser(std::string_view&&) = delete;

    template <class Function>
    std::string_view readRange(size_t count, Function acceptChar) //throw SysError
    {
        if (static_cast<ptrdiff_t>(count) > itEnd_ - it_)
            throw fse::SysError("Unexpected end of line.");

        const auto rngEnd = it_ + count;

        if (!std::all_of(it_, rngEnd, acceptChar))
            throw fse::SysError("Expected char type not found.");

        return fse::makeStringView(std::exchange(it_, rngEnd), rngEnd);
    }

    template <class Function> //expects non-empty range!
    std::string_view readRange(Function acceptChar) //throw SysError
    {
        auto rngEnd = std::find_if_not(it_, itEnd_, acceptChar);
        if (rngEnd == it_)
            throw fse::SysError("Expected char range not found.");

        return fse::makeStringView(std::exchange(it_, rngEnd), rngEnd);
    }

    char peekNextChar() const { return it_ == itEnd_ ? '\0' : *it_; }

private:
    std::string_view::const_iterator it_;
    const std::string_view::const_iterator itEnd_;
};
}

#endif //FTP_REPLY_H_1902837465019283746
