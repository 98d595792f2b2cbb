// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "ftps_config.h"
#include <fse/base64.h>

using namespace fse;
using namespace ftps;


namespace
{
constexpr std::string_view ftpsPrefix = "ftps:";


int parsePositiveOption(std::string_view optPhrase) //throw SysError
{
    const std::string_view value = afterFirst(optPhrase, '=', IfNotFoundReturn::none);
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](char c) { return isDigit(c); }))
        throw SysError("Invalid numeric value for option \"" + std::string(optPhrase) + "\".");
    return stringTo<int>(value);
}


std::string normalizeServerPath(std::string_view path)
{
    std::string output = "/";
    split(path, '/', [&](std::string_view item)
    {
        if (!item.empty())
        {
            if (!endsWith(output, '/'))
                output += '/';
            output += item;
        }
    });
    return output;
}
}


uint16_t ftps::getEffectivePort(const FtpsLogin& login)
{
    if (login.portCfg > 0)
        return static_cast<uint16_t>(login.portCfg);

    return static_cast<uint16_t>(login.tlsMode == TlsMode::implicitTls ? DEFAULT_PORT_FTPS_IMPLICIT : DEFAULT_PORT_FTPS_EXPLICIT);
}


const char* ftps::getProtectionLevelToken(ProtectionLevel level)
{
    switch (level)
    {
        case ProtectionLevel::clear:
            return "C";
        case ProtectionLevel::priv:
            return "P";
    }
    assert(false);
    return "P";
}


ProtectionLevel ftps::parseProtectionLevel(const std::string& token) //throw SysError
{
    //RFC 2228: "S" (safe) and "E" (confidential) are not defined for TLS (RFC 4217, 9)
    if (equalAsciiNoCase(token, "C"))
        return ProtectionLevel::clear;
    if (equalAsciiNoCase(token, "P"))
        return ProtectionLevel::priv;

    throw SysError("Unsupported data channel protection level \"" + token + "\".");
}


std::string ftps::encodeFtpUsername(std::string name)
{
    replace(name, "%", "%25"); //first!
    replace(name, "@", "%40");
    replace(name, ":", "%3A");
    return name;
}


std::string ftps::decodeFtpUsername(std::string name)
{
    replace(name, "%40", "@");
    replace(name, "%3A", ":");
    replace(name, "%3a", ":");
    replace(name, "%25", "%"); //last!
    return name;
}


FtpsPathPhrase ftps::parseFtpsPathPhrase(const std::string& phraseIn) //throw SysError
{
    std::string_view pathPhrase = trimCpy(std::string_view(phraseIn));

    if (!startsWithAsciiNoCase(pathPhrase, ftpsPrefix))
        throw SysError("Path phrase does not start with \"ftps://\". (" + phraseIn + ')');

    pathPhrase.remove_prefix(ftpsPrefix.size());
    pathPhrase = trimCpy(pathPhrase, TrimSide::left, [](char c) { return c == '/' || c == '\\'; });

    //'@' and ':' may be part of the password, but not of the server name
    const std::string_view beforeOptions = beforeFirst(pathPhrase, '|', IfNotFoundReturn::all);
    const std::string_view options       =  afterFirst(pathPhrase, '|', IfNotFoundReturn::none);

    const std::string_view credentials = beforeLast(beforeOptions, '@', IfNotFoundReturn::none);
    const std::string_view fullPath    =  afterLast(beforeOptions, '@', IfNotFoundReturn::all);

    FtpsPathPhrase output;
    FtpsLogin& login = output.login;
    login.username = decodeFtpUsername(std::string(beforeFirst(credentials, ':', IfNotFoundReturn::all))); //support standard FTP syntax, even though
    login.password =                   std::string( afterFirst(credentials, ':', IfNotFoundReturn::none)); //formatFtpsPathPhrase() uses "pass64" instead

    auto it = std::find_if(fullPath.begin(), fullPath.end(), [](char c) { return c == '/' || c == '\\'; });
    const std::string_view serverPort = makeStringView(fullPath.begin(), it);
    output.serverPath = normalizeServerPath(makeStringView(it, fullPath.end()));

    if (startsWith(serverPort, '[')) //IPv6 literal: [::1]:990
    {
        login.server = std::string(beforeFirst(afterFirst(serverPort, '[', IfNotFoundReturn::none), ']', IfNotFoundReturn::none));
        login.portCfg = stringTo<int>(afterFirst(afterLast(serverPort, ']', IfNotFoundReturn::none), ':', IfNotFoundReturn::none));
    }
    else
    {
        login.server = std::string(beforeLast(serverPort, ':', IfNotFoundReturn::all));
        login.portCfg = stringTo<int>(afterLast(serverPort, ':', IfNotFoundReturn::none)); //0 if empty
    }

    if (login.server.empty())
        throw SysError("Server name must not be empty. (" + phraseIn + ')');

    split(options, '|', [&](std::string_view optPhrase)
    {
        optPhrase = trimCpy(optPhrase);
        if (optPhrase.empty())
            return;

        if (optPhrase == "implicit")
            login.tlsMode = TlsMode::implicitTls;
        else if (startsWith(optPhrase, "timeout="))
            login.timeoutSec = parsePositiveOption(optPhrase); //throw SysError
        else if (startsWith(optPhrase, "keepalive="))
            login.keepAliveSec = parsePositiveOption(optPhrase); //throw SysError
        else if (startsWith(optPhrase, "keepalive-reply="))
            login.keepAliveReplyMs = parsePositiveOption(optPhrase); //throw SysError
        else if (startsWith(optPhrase, "data-timeout="))
            login.dataTimeoutSec = parsePositiveOption(optPhrase); //throw SysError
        else if (optPhrase == "endpoint-check")
            login.endpointCheck = true;
        else if (optPhrase == "active")
            login.dataMode = DataConnectionMode::active;
        else if (optPhrase == "keepalive-strict")
            login.keepAlivePolicy = KeepAlivePolicy::failAfterTransfer;
        else if (startsWith(optPhrase, "ca="))
            login.caFile = std::string(afterFirst(optPhrase, '=', IfNotFoundReturn::none));
        else if (startsWith(optPhrase, "pass64="))
        {
            const std::optional<std::string> password = stringDecodeBase64(afterFirst(optPhrase, '=', IfNotFoundReturn::none));
            if (!password)
                throw SysError("Invalid base64 value for option \"pass64\".");
            login.password = *password;
        }
        else
            throw SysError("Unknown path phrase option \"" + std::string(optPhrase) + "\".");
    });
    return output;
}


std::string ftps::formatFtpsPathPhrase(const FtpsPathPhrase& phrase) //noexcept
{
    const FtpsLogin& login = phrase.login;
    const FtpsLogin defaultLogin;

    std::string username;
    if (!login.username.empty())
        username = encodeFtpUsername(login.username) + '@';

    std::string server = login.server;
    if (contains(server, ':')) //IPv6 literal
        server = '[' + server + ']';

    std::string port;
    if (login.portCfg > 0)
        port = ':' + numberTo<std::string>(login.portCfg);

    std::string relPath = normalizeServerPath(phrase.serverPath);
    if (relPath == "/")
        relPath.clear();

    std::string options;
    if (login.tlsMode == TlsMode::implicitTls)
        options += "|implicit";

    if (login.timeoutSec != defaultLogin.timeoutSec)
        options += "|timeout=" + numberTo<std::string>(login.timeoutSec);

    if (login.keepAliveSec != defaultLogin.keepAliveSec)
        options += "|keepalive=" + numberTo<std::string>(login.keepAliveSec);

    if (login.keepAliveReplyMs != defaultLogin.keepAliveReplyMs)
        options += "|keepalive-reply=" + numberTo<std::string>(login.keepAliveReplyMs);

    if (login.dataTimeoutSec != defaultLogin.dataTimeoutSec)
        options += "|data-timeout=" + numberTo<std::string>(login.dataTimeoutSec);

    if (login.endpointCheck)
        options += "|endpoint-check";

    if (login.dataMode == DataConnectionMode::active)
        options += "|active";

    if (login.keepAlivePolicy == KeepAlivePolicy::failAfterTransfer)
        options += "|keepalive-strict";

    if (!login.caFile.empty())
        options += "|ca=" + login.caFile;

    if (!login.password.empty()) //password always last => visually truncated by folder input field
        options += "|pass64=" + stringEncodeBase64(login.password);

    return std::string(ftpsPrefix) + "//" + username + server + port + relPath + options;
}
