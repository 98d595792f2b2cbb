// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "ftps/ftp_listing.h"
#include <catch2/catch.hpp>

namespace ftps::test
{
using std::chrono::system_clock;

namespace
{
const time_t utcTimeNow = 1623758400; //2021-06-15 12:00:00 UTC

system_clock::time_point toTimePoint(time_t utc) { return system_clock::from_time_t(utc); }
}


TEST_CASE("MLSD listing", "[unit]")
{
    const std::string buf =
        "type=cdir;sizd=4096;modify=20170116230740;UNIX.mode=0755;unique=902g36e1c55; .\r\n"
        "type=pdir;sizd=4096;modify=20170116230740;UNIX.mode=0755;unique=902g36e1c55; ..\r\n"
        "type=file;size=4;modify=20170113063314;UNIX.mode=0600;unique=902g36e1c5d; readme.txt\r\n"
        "type=dir;sizd=4096;modify=20170117144634;unique=902g36e418a; folder\r\n"
        "type=OS.unix=slink:/target;modify=20170117144634; link\r\n"
        "Type=File;Size=10;Modify=20170113063314.250; name with  blanks.txt\r\n";

    const std::vector<FtpFile> items = parseMlsdListing(buf);
    REQUIRE(items.size() == 4);

    CHECK(items[0].type == FtpItemType::file);
    CHECK(items[0].name == "readme.txt");
    CHECK(items[0].size == 4);
    CHECK(items[0].modTime == toTimePoint(1484289194));
    CHECK(items[0].uniqueId == "902g36e1c5d");

    CHECK(items[1].type == FtpItemType::folder);
    CHECK(items[1].name == "folder");
    CHECK(items[1].size == 0);
    CHECK(items[1].modTime == toTimePoint(1484664394));

    CHECK(items[2].type == FtpItemType::symlink);
    CHECK(items[2].name == "link");

    CHECK(items[3].name == "name with  blanks.txt");
    CHECK(items[3].size == 10);
    CHECK(items[3].modTime == toTimePoint(1484289194) + std::chrono::milliseconds(250));
}

TEST_CASE("MLST line", "[unit]")
{
    //MLST replies prefix the facts with a single blank
    const FtpFile item = parseMlstLine(" type=file;size=1084;modify=20170113063314; /folder/file.txt");
    CHECK(item.name == "/folder/file.txt");
    CHECK(item.size == 1084);
}

TEST_CASE("MLSD errors", "[unit]")
{
    CHECK_THROWS_AS(parseMlsdListing("type=file;modify=20170113063314; nosize\r\n"), fse::SysError);
    CHECK_THROWS_AS(parseMlsdListing("type=file;size=-1;modify=20170113063314; negative\r\n"), fse::SysError);
    CHECK_THROWS_AS(parseMlsdListing("type=file;size=4;modify=20170113063314;\r\n"), fse::SysError);
    CHECK_THROWS_AS(parseMlsdListing("type=file;size=4;modify=2017; badtime\r\n"), fse::SysError);

    try
    {
        parseMlstLine("type=file;size=4;modify=99999999999999; item");
        FAIL("no exception");
    }
    catch (const fse::SysError& e)
    {
        CHECK(fse::contains(e.toString(), "Unexpected FTP response. (type=file;size=4;modify=99999999999999; item)"));
    }
}

TEST_CASE("Unix listing", "[unit]")
{
    const std::string buf =
        "total 4953\r\n"
        "drwxr-xr-x 1 root root    4096 Jan 10 11:58 version\r\n"
        "-rwxr-xr-x 1 root root    1084 Sep  2 01:17 Unit Test.vcxproj.user\r\n"
        "-rwxr-xr-x 1 1000  300    2217 Feb 28  2016 win32.manifest\r\n"
        "lrwxr-xr-x 1 root root      18 Apr 26 15:17 Projects -> /mnt/hgfs/Projects\r\n"
        "drwxr-xr-x 1 root root    4096 Jan 10 11:58 .\r\n";

    const std::vector<FtpFile> items = parseUnixListing(buf, utcTimeNow);
    REQUIRE(items.size() == 4);

    CHECK(items[0].type == FtpItemType::folder);
    CHECK(items[0].name == "version");
    CHECK(items[0].modTime == toTimePoint(1610279880)); //2021-01-10 11:58

    CHECK(items[1].type == FtpItemType::file);
    CHECK(items[1].name == "Unit Test.vcxproj.user");
    CHECK(items[1].size == 1084);
    CHECK(items[1].modTime == toTimePoint(1599009420)); //"in the future" => 2020-09-02 01:17

    CHECK(items[2].name == "win32.manifest");
    CHECK(items[2].size == 2217);
    CHECK(items[2].modTime == toTimePoint(1456617600)); //2016-02-28

    CHECK(items[3].type == FtpItemType::symlink);
    CHECK(items[3].name == "Projects");
    CHECK(items[3].modTime == toTimePoint(1619450220)); //2021-04-26 15:17
}

TEST_CASE("Unix listing without owner or group", "[unit]")
{
    const std::vector<FtpFile> noGroup = parseUnixListing("dr-xr-xr-x   2 root                  512 Apr  8  1994 etc\r\n", utcTimeNow);
    REQUIRE(noGroup.size() == 1);
    CHECK(noGroup[0].type == FtpItemType::folder);
    CHECK(noGroup[0].name == "etc");
    CHECK(noGroup[0].modTime == toTimePoint(765763200));

    const std::vector<FtpFile> noOwner = parseUnixListing("drwxrwxrwx 1              0 Jan  1 00:00 dirname/\r\n", utcTimeNow);
    REQUIRE(noOwner.size() == 1);
    CHECK(noOwner[0].name == "dirname"); //trailing slash removed
    CHECK(noOwner[0].modTime == toTimePoint(1609459200));
}

TEST_CASE("Unix listing errors", "[unit]")
{
    CHECK_THROWS_AS(parseUnixListing("-rwxr-xr-x 1 root root 1084 Foo  2 01:17 bad month\r\n", utcTimeNow), fse::SysError);
    CHECK_THROWS_AS(parseUnixListing("-rwxr-xr-x 1 root root 1084 Sep 42 01:17 bad day\r\n", utcTimeNow), fse::SysError);
    CHECK_THROWS_AS(parseUnixListing("-rwxr-xr-x 1 root root 1084 Sep  2 25:17 bad hour\r\n", utcTimeNow), fse::SysError);
    CHECK_THROWS_AS(parseUnixListing("xrwxr-xr-x 1 root root 1084 Sep  2 01:17 bad type\r\n", utcTimeNow), fse::SysError);
    CHECK_THROWS_AS(parseUnixListing("-rwxr-xr-x 1 root root 1084 Sep  2 01:17\r\n", utcTimeNow), fse::SysError);
}

TEST_CASE("Windows listing", "[unit]")
{
    const std::string buf =
        "10-27-15  03:46AM       <DIR>          pub\r\n"
        "04-08-14  03:09PM               11,399 readme.txt\r\n"
        "06-22-2017  04:25PM       <DIR>          test\r\n"
        "01-01-98  13:00       <DIR>          Storage Card\r\n";

    const std::vector<FtpFile> items = parseWindowsListing(buf, utcTimeNow);
    REQUIRE(items.size() == 4);

    CHECK(items[0].type == FtpItemType::folder);
    CHECK(items[0].name == "pub");
    CHECK(items[0].modTime == toTimePoint(1445917560));

    CHECK(items[1].type == FtpItemType::file);
    CHECK(items[1].size == 11399);
    CHECK(items[1].modTime == toTimePoint(1396969740)); //PM

    CHECK(items[2].modTime == toTimePoint(1498148700)); //four-digit year

    CHECK(items[3].name == "Storage Card");
    CHECK(items[3].modTime == toTimePoint(883659600)); //'98 is not in the future
}

TEST_CASE("LIST format detection", "[unit]")
{
    const std::vector<FtpFile> dos = parseListListing("06-22-2017  04:25PM              1875499 zstring.obj\r\n");
    REQUIRE(dos.size() == 1);
    CHECK(dos[0].size == 1875499);

    const std::vector<FtpFile> unix = parseListListing("-rw-r--r-- 1 ftp ftp 42 Feb 28  2016 answer.txt\r\n");
    REQUIRE(unix.size() == 1);
    CHECK(unix[0].name == "answer.txt");
    CHECK(unix[0].size == 42);

    CHECK(parseListListing("").empty());
}

TEST_CASE("NLST listing", "[unit]")
{
    const std::vector<std::string> names = parseNameListing("/folder/a.txt\r\nb.txt\r\n\r\n/folder/.\r\n");
    CHECK(names == std::vector<std::string>{"a.txt", "b.txt"});
}
}
