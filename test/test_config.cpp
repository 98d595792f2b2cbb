// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "ftps/ftps_config.h"
#include <fse/base64.h>
#include <catch2/catch.hpp>

namespace ftps::test
{
TEST_CASE("path phrase minimal", "[unit]")
{
    const FtpsPathPhrase phrase = parseFtpsPathPhrase("ftps://example.com");
    CHECK(phrase.login.server == "example.com");
    CHECK(phrase.login.portCfg == 0);
    CHECK(phrase.login.username.empty());
    CHECK(phrase.login.password.empty());
    CHECK(phrase.login.tlsMode == TlsMode::explicitTls);
    CHECK(phrase.serverPath == "/");

    CHECK(getEffectivePort(phrase.login) == 21);
}

TEST_CASE("path phrase with all options", "[unit]")
{
    const FtpsPathPhrase phrase = parseFtpsPathPhrase("ftps://user%40corp:ignored@[::1]:2121/data//incoming/"
                                                      "|implicit|timeout=20|keepalive=15|keepalive-reply=500|data-timeout=30"
                                                      "|endpoint-check|active|keepalive-strict|ca=/etc/ssl/ca.pem|pass64=" + fse::stringEncodeBase64("p@ss:word"));
    const FtpsLogin& login = phrase.login;
    CHECK(login.server == "::1");
    CHECK(login.portCfg == 2121);
    CHECK(login.username == "user@corp");
    CHECK(login.password == "p@ss:word"); //pass64 wins
    CHECK(login.tlsMode == TlsMode::implicitTls);
    CHECK(login.timeoutSec == 20);
    CHECK(login.keepAliveSec == 15);
    CHECK(login.keepAliveReplyMs == 500);
    CHECK(login.dataTimeoutSec == 30);
    CHECK(login.endpointCheck);
    CHECK(login.dataMode == DataConnectionMode::active);
    CHECK(login.keepAlivePolicy == KeepAlivePolicy::failAfterTransfer);
    CHECK(login.caFile == "/etc/ssl/ca.pem");
    CHECK(phrase.serverPath == "/data/incoming");

    CHECK(getEffectivePort(login) == 2121);
}

TEST_CASE("path phrase default ports", "[unit]")
{
    FtpsLogin login;
    login.tlsMode = TlsMode::explicitTls;
    CHECK(getEffectivePort(login) == DEFAULT_PORT_FTPS_EXPLICIT);
    login.tlsMode = TlsMode::implicitTls;
    CHECK(getEffectivePort(login) == DEFAULT_PORT_FTPS_IMPLICIT);
}

TEST_CASE("path phrase errors", "[unit]")
{
    CHECK_THROWS_AS(parseFtpsPathPhrase("ftp://example.com"), fse::SysError);
    CHECK_THROWS_AS(parseFtpsPathPhrase("ftps://"), fse::SysError);
    CHECK_THROWS_AS(parseFtpsPathPhrase("ftps://user@:21/path"), fse::SysError);
    CHECK_THROWS_AS(parseFtpsPathPhrase("ftps://example.com|unknown-option"), fse::SysError);
    CHECK_THROWS_AS(parseFtpsPathPhrase("ftps://example.com|timeout=ten"), fse::SysError);
    CHECK_THROWS_AS(parseFtpsPathPhrase("ftps://example.com|keepalive="), fse::SysError);
    CHECK_THROWS_AS(parseFtpsPathPhrase("ftps://example.com|pass64=%%%"), fse::SysError);
}

TEST_CASE("path phrase formatting", "[unit]")
{
    FtpsPathPhrase phrase;
    phrase.login.server = "ftp.example.com";
    phrase.login.username = "john:doe";
    phrase.login.password = "secret";
    phrase.login.keepAliveSec = 10;
    phrase.login.endpointCheck = true;
    phrase.serverPath = "/folder/sub";

    const std::string formatted = formatFtpsPathPhrase(phrase);
    CHECK(formatted == "ftps://john%3Adoe@ftp.example.com/folder/sub|keepalive=10|endpoint-check|pass64=" + fse::stringEncodeBase64("secret"));

    const FtpsPathPhrase parsed = parseFtpsPathPhrase(formatted);
    CHECK(parsed.login == phrase.login);
    CHECK(parsed.serverPath == phrase.serverPath);
}

TEST_CASE("username encoding", "[unit]")
{
    CHECK(encodeFtpUsername("a@b:c%d") == "a%40b%3Ac%25d");
    CHECK(decodeFtpUsername("a%40b%3Ac%25d") == "a@b:c%d");
    CHECK(decodeFtpUsername("%2540") == "%40");
}

TEST_CASE("protection level tokens", "[unit]")
{
    CHECK(std::string(getProtectionLevelToken(ProtectionLevel::clear)) == "C");
    CHECK(std::string(getProtectionLevelToken(ProtectionLevel::priv)) == "P");
    CHECK(parseProtectionLevel("p") == ProtectionLevel::priv);
    CHECK(parseProtectionLevel("C") == ProtectionLevel::clear);
    CHECK_THROWS_AS(parseProtectionLevel("S"), fse::SysError);
    CHECK_THROWS_AS(parseProtectionLevel("E"), fse::SysError);
    CHECK_THROWS_AS(parseProtectionLevel(""), fse::SysError);
}

TEST_CASE("base64", "[unit]")
{
    CHECK(fse::stringEncodeBase64("") == "");
    CHECK(fse::stringEncodeBase64("f") == "Zg==");
    CHECK(fse::stringEncodeBase64("foobar") == "Zm9vYmFy");

    CHECK(fse::stringDecodeBase64("Zm9vYg==") == "foob");
    CHECK_FALSE(fse::stringDecodeBase64("Zm9vY"));
    CHECK_FALSE(fse::stringDecodeBase64("Zm9v!g=="));
}
}
