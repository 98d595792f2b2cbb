// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "ftp_listing.h"
#include <functional>
#include <fse/time.h>

using namespace fse;
using namespace ftps;


namespace
{
std::chrono::system_clock::time_point toTimePoint(time_t utc)
{
    return std::chrono::system_clock::from_time_t(utc);
}


FtpFile parseUnixLine(const std::string_view& rawLine, time_t utcTimeNow, int utcCurrentYear, int ownerGroupCount) //throw SysError
{
    /* Unix standard listing: "ls -l --all"

        total 4953                                                  <- optional first line
        drwxr-xr-x 1 root root    4096 Jan 10 11:58 version
        -rwxr-xr-x 1 root root    1084 Sep  2 01:17 Unit Test.vcxproj.user
        -rwxr-xr-x 1 1000  300    2217 Feb 28  2016 win32.manifest
        lrwxr-xr-x 1 root root      18 Apr 26 15:17 Projects -> /mnt/hgfs/Projects

    file type: -:file  l:symlink  d:directory  b:block device  p:named pipe  c:char device  s:socket

    Alternative formats
    -------------------
    No group: "ls -l --no-group"
        dr-xr-xr-x   2 root                  512 Apr  8  1994 etc

    No owner, no group, trailing slash (directories only): "ls -g --no-group --file-type"
        drwxrwxrwx 1              0 Jan  1 00:00 dirname/         */
    try
    {
        FtpLineParser parser(rawLine);

        const std::string_view typeTag = parser.readRange(1, [](char c) //throw SysError
        {
            return c == '-' || c == 'b' || c == 'c' || c == 'd' || c == 'l' || c == 'p' || c == 's';
        });
        //------------------------------------------------------------------------------------
        //permissions
        parser.readRange(9, [](char c) //throw SysError
        {
            return c == '-' || c == 'r' || c == 'w' || c == 'x' || c == 's' || c == 'S' || c == 't' || c == 'T';
        });
        parser.readRange(&isWhiteSpace); //throw SysError
        //------------------------------------------------------------------------------------
        //hard-link count (no separators)
        parser.readRange(&isDigit);      //throw SysError
        parser.readRange(&isWhiteSpace); //throw SysError
        //------------------------------------------------------------------------------------
        //both owner + group, owner only, or none at all
        for (int i = 0; i < ownerGroupCount; ++i)
        {
            parser.readRange(std::not_fn(isWhiteSpace)); //throw SysError
            parser.readRange(&isWhiteSpace);             //throw SysError
        }
        //------------------------------------------------------------------------------------
        //file size (no separators)
        const uint64_t fileSize = stringTo<uint64_t>(parser.readRange(&isDigit)); //throw SysError
        parser.readRange(&isWhiteSpace);                                          //throw SysError
        //------------------------------------------------------------------------------------
        const std::string_view monthStr = parser.readRange(std::not_fn(isWhiteSpace)); //throw SysError
        parser.readRange(&isWhiteSpace);                                               //throw SysError

        const char* months[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
        auto itMonth = std::find_if(std::begin(months), std::end(months), [&](const char* name) { return equalAsciiNoCase(name, monthStr); });
        if (itMonth == std::end(months))
            throw SysError("Failed to parse month name.");
        //------------------------------------------------------------------------------------
        const int day = stringTo<int>(parser.readRange(&isDigit)); //throw SysError
        parser.readRange(&isWhiteSpace);                           //throw SysError
        if (day < 1 || day > 31)
            throw SysError("Failed to parse day of month.");
        //------------------------------------------------------------------------------------
        const std::string_view timeOrYear = parser.readRange([](char c) { return c == ':' || isDigit(c); }); //throw SysError
        parser.readRange(&isWhiteSpace);                                                                     //throw SysError

        TimeComp timeComp;
        timeComp.month = 1 + static_cast<int>(itMonth - std::begin(months));
        timeComp.day = day;

        if (contains(timeOrYear, ':'))
        {
            const int hour   = stringTo<int>(beforeFirst(timeOrYear, ':', IfNotFoundReturn::none));
            const int minute = stringTo<int>(afterFirst (timeOrYear, ':', IfNotFoundReturn::none));
            if (hour < 0 || hour > 23 || minute < 0 || minute > 59)
                throw SysError("Failed to parse modification time.");

            timeComp.hour   = hour;
            timeComp.minute = minute;
            timeComp.year = utcCurrentYear; //tentatively

            const auto [serverLocalTime, timeValid] = utcToTimeT(timeComp);
            if (!timeValid)
                throw SysError("Modification time is invalid.");

            if (serverLocalTime > utcTimeNow + 24 * 3600) //time-zones range from UTC-12:00 to UTC+14:00, consider DST; FileZilla uses 1 day tolerance
                --timeComp.year; //"more likely" this time is from last year
        }
        else if (timeOrYear.size() == 4)
        {
            timeComp.year = stringTo<int>(timeOrYear);

            if (timeComp.year < 1600 || timeComp.year >= 3000)
                throw SysError("Failed to parse modification time.");
        }
        else
            throw SysError("Failed to parse modification time.");

        //let's pretend the time listing is UTC (same behavior as FileZilla): MDTM gives the exact time if needed
        const auto [modTime, timeValid] = utcToTimeT(timeComp);
        if (!timeValid)
            throw SysError("Modification time is invalid.");
        //------------------------------------------------------------------------------------
        const std::string_view trail = parser.readRange([](char) { return true; }); //throw SysError
        std::string_view itemName;
        if (typeTag == "l")
            itemName = beforeFirst(trail, " -> ", IfNotFoundReturn::none);
        else
            itemName = trail;
        if (itemName.empty())
            throw SysError("Item name not available.");

        if (itemName == "." || itemName == "..")
            return {FtpItemType::folder, std::string(itemName)};
        //------------------------------------------------------------------------------------
        FtpFile item;
        if (typeTag == "d")
            item.type = FtpItemType::folder;
        else if (typeTag == "l")
            item.type = FtpItemType::symlink;
        else
            item.size = fileSize;

        item.name = itemName;
        if (item.type == FtpItemType::folder && endsWith(item.name, '/'))
            item.name.pop_back();

        item.modTime = toTimePoint(modTime);
        return item;
    }
    catch (const SysError& e)
    {
        throw SysError("Unexpected FTP response. (" + std::string(rawLine) + ") [ownerGroupCount: " + numberTo<std::string>(ownerGroupCount) + "] " + e.toString());
    }
}
}


FtpFile ftps::parseMlstLine(std::string_view rawLine) //throw SysError
{
    /*  https://tools.ietf.org/html/rfc3659
        type=cdir;sizd=4096;modify=20170116230740;UNIX.mode=0755;UNIX.uid=874;UNIX.gid=869;unique=902g36e1c55; .
        type=pdir;sizd=4096;modify=20170116230740;UNIX.mode=0755;UNIX.uid=874;UNIX.gid=869;unique=902g36e1c55; ..
        type=file;size=4;modify=20170113063314;UNIX.mode=0600;UNIX.uid=874;UNIX.gid=869;unique=902g36e1c5d; readme.txt
        type=dir;sizd=4096;modify=20170117144634;UNIX.mode=0755;UNIX.uid=874;UNIX.gid=869;unique=902g36e418a; folder   */
    try
    {
        FtpFile item;

        auto itBegin = rawLine.begin();
        if (startsWith(rawLine, ' ')) //MLST (not MLSD) replies have a leading blank
            ++itBegin;
        auto itBlank = std::find(itBegin, rawLine.end(), ' ');
        if (itBlank == rawLine.end())
            throw SysError("Item name not available.");

        const std::string_view facts = makeStringView(itBegin, itBlank);
        item.name = makeStringView(itBlank + 1, rawLine.end());

        std::string_view typeFact;
        std::string_view fileSize;

        split(facts, ';', [&](const std::string_view fact)
        {
            if (!fact.empty())
            {
                if (startsWithAsciiNoCase(fact, "type=")) //must be case-insensitive!!!
                {
                    const std::string_view tmp = afterFirst(fact, '=', IfNotFoundReturn::none);
                    typeFact = beforeFirst(tmp, ':', IfNotFoundReturn::all);
                }
                else if (startsWithAsciiNoCase(fact, "size="))
                    fileSize = afterFirst(fact, '=', IfNotFoundReturn::none);
                else if (startsWithAsciiNoCase(fact, "modify="))
                {
                    std::string_view modifyFact = afterFirst(fact, '=', IfNotFoundReturn::none);
                    const std::string_view fraction = afterLast(modifyFact, '.', IfNotFoundReturn::none);
                    modifyFact = beforeLast(modifyFact, '.', IfNotFoundReturn::all);

                    const TimeComp tc = parseTime("%Y%m%d%H%M%S", modifyFact);
                    if (tc == TimeComp())
                        throw SysError("Modification time is invalid.");

                    const auto [modTime, timeValid] = utcToTimeT(tc);
                    if (!timeValid)
                        throw SysError("Modification time is invalid.");

                    item.modTime = toTimePoint(modTime);

                    if (!fraction.empty()) //"modify=20170113063314.123"
                    {
                        const std::string_view msStr = fraction.substr(0, 3);
                        int ms = stringTo<int>(msStr);
                        for (size_t i = msStr.size(); i < 3; ++i)
                            ms *= 10;
                        item.modTime += std::chrono::milliseconds(ms);
                    }
                }
                else if (startsWithAsciiNoCase(fact, "unique="))
                    /*  https://tools.ietf.org/html/rfc3659#section-7.5.2
                        "The mapping between files, and unique fact tokens should be maintained, [...] for
                         *at least* the lifetime of the control connection from user-PI to server-PI."     */
                    item.uniqueId = afterFirst(fact, '=', IfNotFoundReturn::none);
            }
        });

        if (equalAsciiNoCase(typeFact, "cdir"))
            return {FtpItemType::folder, "."};
        if (equalAsciiNoCase(typeFact, "pdir"))
            return {FtpItemType::folder, ".."};

        if (equalAsciiNoCase(typeFact, "dir"))
            item.type = FtpItemType::folder;
        else if (equalAsciiNoCase(typeFact, "OS.unix=slink") || //the OS.unix=slink:/target syntax is a hack and often skips
                 equalAsciiNoCase(typeFact, "OS.unix=symlink")) //the target path after the colon: http://www.proftpd.org/docs/modules/mod_facts.html
            item.type = FtpItemType::symlink;

        //evaluate parsing errors right now (+ report raw entry in error message!)
        if (item.name.empty())
            throw SysError("Item name not available.");

        if (item.type == FtpItemType::file)
        {
            if (fileSize.empty() || !std::all_of(fileSize.begin(), fileSize.end(), [](char c) { return isDigit(c); }))
                throw SysError("File size not available."); //crazy, but can be "-1"
            item.size = stringTo<uint64_t>(fileSize);
        }
        return item;
    }
    catch (const SysError& e)
    {
        throw SysError("Unexpected FTP response. (" + std::string(rawLine) + ") " + e.toString());
    }
}


std::vector<FtpFile> ftps::parseMlsdListing(const std::string& buf) //throw SysError
{
    std::vector<FtpFile> output;
    for (const std::string_view& line : splitFtpResponse(buf))
    {
        FtpFile item = parseMlstLine(line); //throw SysError
        if (item.name != "." &&
            item.name != "..")
            output.push_back(std::move(item));
    }
    return output;
}


std::vector<FtpFile> ftps::parseListListing(const std::string& buf) //throw SysError
{
    if (!buf.empty() && isDigit(buf[0])) //lame test to distinguish Unix/Dos formats
        return parseWindowsListing(buf, std::time(nullptr)); //throw SysError
    return parseUnixListing(buf, std::time(nullptr));        //
}


//"ls -l"
std::vector<FtpFile> ftps::parseUnixListing(const std::string& buf, time_t utcTimeNow) //throw SysError
{
    const std::vector<std::string_view> lines = splitFtpResponse(buf);
    auto it = lines.begin();

    if (it != lines.end() && startsWith(*it, "total "))
        ++it;

    const TimeComp tc = getUtcTime(utcTimeNow);
    if (tc == TimeComp())
        throw SysError("Failed to determine current time: " + numberTo<std::string>(utcTimeNow));

    const int utcCurrentYear = tc.year;

    std::optional<int> dirOwnerGroupCount;  //
    std::optional<int> fileOwnerGroupCount; //caveat: differentiate per item type: see alternative formats!
    std::optional<int> linkOwnerGroupCount; //

    std::vector<FtpFile> output;

    std::for_each(it, lines.end(), [&](const std::string_view line)
    {
        auto& ownerGroupCount = [&]() -> std::optional<int>&
        {
            switch (line[0]) //non-empty: see splitFtpResponse()
            {
                //*INDENT-OFF*
                case 'd': return  dirOwnerGroupCount;
                case 'l': return linkOwnerGroupCount;
                default : return fileOwnerGroupCount;
                //*INDENT-ON*
            }
        }();

        if (!ownerGroupCount)
            ownerGroupCount = [&]
        {
            std::optional<SysError> firstError;

            for (int i = 3; i-- > 0;)
                try
                {
                    parseUnixLine(line, utcTimeNow, utcCurrentYear, i /*ownerGroupCount*/); //throw SysError
                    return i;
                }
                catch (const SysError& e)
                {
                    if (!firstError)
                        firstError = e;
                }
            throw* firstError;
        }();

        FtpFile item = parseUnixLine(line, utcTimeNow, utcCurrentYear, *ownerGroupCount); //throw SysError
        if (item.name != "." &&
            item.name != "..")
            output.push_back(std::move(item));
    });

    return output;
}


//"dir"
std::vector<FtpFile> ftps::parseWindowsListing(const std::string& buf, time_t utcTimeNow) //throw SysError
{
    /*  IIS, US:
            10-27-15  03:46AM       <DIR>          pub
            04-08-14  03:09PM               11,399 readme.txt

        Datalogic Windows CE 5.0
            01-01-98  13:00       <DIR>          Storage Card

        IIS option "four-digit years"
            06-22-2017  04:25PM       <DIR>          test
            06-20-2017  12:50PM              1875499 zstring.obj         */
    const TimeComp tc = getUtcTime(utcTimeNow);
    if (tc == TimeComp())
        throw SysError("Failed to determine current time: " + numberTo<std::string>(utcTimeNow));
    const int utcCurrentYear = tc.year;

    std::vector<FtpFile> output;
    for (const std::string_view& line : splitFtpResponse(buf))
        try
        {
            FtpLineParser parser(line);

            const int month = stringTo<int>(parser.readRange(2, &isDigit));   //throw SysError
            parser.readRange(1, [](char c) { return c == '-' || c == '/'; }); //throw SysError
            const int day = stringTo<int>(parser.readRange(2, &isDigit));     //throw SysError
            parser.readRange(1, [](char c) { return c == '-' || c == '/'; }); //throw SysError
            const std::string_view yearString = parser.readRange(&isDigit);   //throw SysError
            parser.readRange(&isWhiteSpace);                                  //throw SysError

            if (month < 1 || month > 12 || day < 1 || day > 31)
                throw SysError("Failed to parse modification time.");

            int year = 0;
            if (yearString.size() == 2)
            {
                year = (utcCurrentYear / 100) * 100 + stringTo<int>(yearString);
                if (year > utcCurrentYear + 1 /*local time leeway*/)
                    year -= 100;
            }
            else if (yearString.size() == 4)
                year = stringTo<int>(yearString);
            else
                throw SysError("Failed to parse modification time.");
            //------------------------------------------------------------------------------------
            int hour = stringTo<int>(parser.readRange(2, &isDigit));         //throw SysError
            parser.readRange(1, [](char c) { return c == ':'; });            //throw SysError
            const int minute = stringTo<int>(parser.readRange(2, &isDigit)); //throw SysError
            if (!isWhiteSpace(parser.peekNextChar()))
            {
                const std::string_view period = parser.readRange(2, [](char c) { return c == 'A' || c == 'P' || c == 'M'; }); //throw SysError
                if (period == "PM")
                {
                    if (0 <= hour && hour < 12)
                        hour += 12;
                }
                else if (hour == 12)
                    hour = 0;
            }
            parser.readRange(&isWhiteSpace); //throw SysError

            if (hour < 0 || hour > 23 || minute < 0 || minute > 59)
                throw SysError("Failed to parse modification time.");
            //------------------------------------------------------------------------------------
            TimeComp timeComp;
            timeComp.year   = year;
            timeComp.month  = month;
            timeComp.day    = day;
            timeComp.hour   = hour;
            timeComp.minute = minute;
            //let's pretend the time listing is UTC (same behavior as FileZilla)
            const auto [modTime, timeValid] = utcToTimeT(timeComp);
            if (!timeValid)
                throw SysError("Modification time is invalid.");
            //------------------------------------------------------------------------------------
            const std::string_view dirTagOrSize = parser.readRange(std::not_fn(isWhiteSpace)); //throw SysError
            parser.readRange(&isWhiteSpace); //throw SysError

            const bool isDir = dirTagOrSize == "<DIR>";
            uint64_t fileSize = 0;
            if (!isDir)
            {
                std::string sizeStr(dirTagOrSize);
                replace(sizeStr, ",", "");
                replace(sizeStr, ".", "");
                if (sizeStr.empty() || !std::all_of(sizeStr.begin(), sizeStr.end(), [](char c) { return isDigit(c); }))
                    throw SysError("Failed to parse file size.");
                fileSize = stringTo<uint64_t>(sizeStr);
            }
            //------------------------------------------------------------------------------------
            const std::string_view itemName = parser.readRange([](char) { return true; }); //throw SysError
            if (itemName.empty())
                throw SysError("Folder contains an item without name.");

            if (itemName != "." &&
                itemName != "..")
            {
                FtpFile item;
                if (isDir)
                    item.type = FtpItemType::folder;
                item.name    = itemName;
                item.size    = fileSize;
                item.modTime = toTimePoint(modTime);

                output.push_back(std::move(item));
            }
        }
        catch (const SysError& e)
        {
            throw SysError("Unexpected FTP response. (" + std::string(line) + ") " + e.toString());
        }

    return output;
}


std::vector<std::string> ftps::parseNameListing(const std::string& buf)
{
    std::vector<std::string> output;
    for (const std::string_view& line : splitFtpResponse(buf))
    {
        //"NLST /folder" => "/folder/file.txt" on some servers
        const std::string_view name = afterLast(line, '/', IfNotFoundReturn::all);
        if (!name.empty() && name != "." && name != "..")
            output.emplace_back(name);
    }
    return output;
}
