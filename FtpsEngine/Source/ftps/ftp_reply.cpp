// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "ftp_reply.h"

using namespace fse;
using namespace ftps;


namespace
{
//"ddd " or "ddd-" => reply code; std::nullopt if not a status line
std::optional<int> parseStatusPrefix(std::string_view line, char& separator)
{
    if (line.size() < 3 || !isDigit(line[0]) || !isDigit(line[1]) || !isDigit(line[2]))
        return std::nullopt;

    separator = line.size() > 3 ? line[3] : ' '; //"200" without text: seen in the wild
    if (separator != ' ' && separator != '-')
        return std::nullopt;

    return stringTo<int>(line.substr(0, 3));
}
}


ReplyClass ftps::classifyReply(int replyCode) //throw ProtocolError
{
    switch (replyCode / 100)
    {
        //*INDENT-OFF*
        case 1: return ReplyClass::positivePreliminary;
        case 2: return ReplyClass::positiveCompletion;
        case 3: return ReplyClass::positiveIntermediate;
        case 4: return ReplyClass::transientNegative;
        case 5: return ReplyClass::permanentNegative;
        //*INDENT-ON*
    }
    throw ProtocolError("Invalid FTP reply code: " + numberTo<std::string>(replyCode), replyCode);
}


bool ftps::isSuccess(int replyCode) //throw ProtocolError
{
    const ReplyClass rc = classifyReply(replyCode); //throw ProtocolError
    return rc == ReplyClass::positiveCompletion ||
           rc == ReplyClass::positiveIntermediate;
}


std::string FtpReply::getText() const
{
    std::string text;
    for (const std::string& line : lines)
    {
        if (!text.empty())
            text += '\n';
        text += line;
    }
    return text;
}


std::string ftps::formatFtpStatus(int sc)
{
    const char* statusText = [&] //https://en.wikipedia.org/wiki/List_of_FTP_server_return_codes
    {
        switch (sc)
        {
            //*INDENT-OFF*
            case 400: return "The command was not accepted but the error condition is temporary.";
            case 421: return "Service not available, closing control connection.";
            case 425: return "Cannot open data connection.";
            case 426: return "Connection closed; transfer aborted.";
            case 430: return "Invalid username or password.";
            case 431: return "Need some unavailable resource to process security.";
            case 434: return "Requested host unavailable.";
            case 450: return "Requested file action not taken.";
            case 451: return "Local error in processing.";
            case 452: return "Insufficient storage space in system. File unavailable, e.g. file busy.";

            case 500: return "Syntax error, command unrecognized or command line too long.";
            case 501: return "Syntax error in parameters or arguments.";
            case 502: return "Command not implemented.";
            case 503: return "Bad sequence of commands.";
            case 504: return "Command not implemented for that parameter.";
            case 521: return "Data connection cannot be opened with this PROT setting.";
            case 522: return "Server does not support the requested network protocol.";
            case 530: return "User not logged in.";
            case 532: return "Need account for storing files.";
            case 533: return "Command protection level denied for policy reasons.";
            case 534: return "Could not connect to server; issue regarding SSL.";
            case 535: return "Failed security check.";
            case 536: return "Requested PROT level not supported by mechanism.";
            case 537: return "Command protection level not supported by security mechanism.";
            case 550: return "File unavailable, e.g. file not found, no access.";
            case 551: return "Requested action aborted. Page type unknown.";
            case 552: return "Requested file action aborted. Exceeded storage allocation.";
            case 553: return "File name not allowed.";

            default:  return "";
            //*INDENT-ON*
        }
    }();

    if (*statusText == '\0')
        return "FTP status " + numberTo<std::string>(sc) + '.';
    else
        return "FTP status " + numberTo<std::string>(sc) + ": " + statusText;
}


std::string ftps::formatFtpReply(const FtpReply& reply)
{
    return formatFtpStatus(reply.code) + " (" + reply.getText() + ')';
}


std::optional<FtpReply> FtpReplyParser::pushLine(const std::string& line) //throw ProtocolError
{
    char separator = ' ';
    const std::optional<int> code = parseStatusPrefix(line, separator);

    if (lines_.empty())
    {
        if (!code)
            throw ProtocolError("Unexpected FTP response. (" + line + ')', 0);

        if (*code < 100 || *code > 599)
            throw ProtocolError("Invalid FTP reply code. (" + line + ')', *code);

        if (separator == ' ')
            return FtpReply{*code, {line}};

        code_ = *code;
        lines_.push_back(line);
        return std::nullopt;
    }

    lines_.push_back(line);

    //multi-line: terminated by the *same* code followed by a space (RFC 959, 4.2)
    if (code && *code == code_ && separator == ' ')
    {
        FtpReply reply{code_, std::exchange(lines_, {})};
        code_ = 0;
        return reply;
    }
    return std::nullopt;
}


std::vector<std::string_view> ftps::splitFtpResponse(const std::string& buf)
{
    std::vector<std::string_view> lines;

    split2(buf, [](char c) { return isLineBreak(c) || c == '\0'; },
    [&lines](const std::string_view block)
    {
        if (!block.empty()) //consider Windows' <CR><LF>
            lines.push_back(block);
    });

    return lines;
}
