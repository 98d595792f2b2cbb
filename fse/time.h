// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef TIME_H_2309875019283740198
#define TIME_H_2309875019283740198

#include <ctime>
#include <utility>
#include "string_tools.h"


namespace fse
{
struct TimeComp //replaces std::tm
{
    int year   = 0; // -
    int month  = 0; //1-12
    int day    = 0; //1-31
    int hour   = 0; //0-23
    int minute = 0; //0-59
    int second = 0; //0-60 (including leap second)

    bool operator==(const TimeComp&) const = default;
};

TimeComp getUtcTime(time_t utc); //convert time_t (UTC) to UTC time components, returns TimeComp() on error
std::pair<time_t, bool /*success*/> utcToTimeT(const TimeComp& tc); //convert UTC time components to time_t (UTC)

TimeComp getLocalTime(time_t utc); //convert time_t (UTC) to local time components, returns TimeComp() on error

//----------------------------------------------------------------------------------------------------------------------------------
/* format date and time; example:
            formatTime("%Y|%m|%d", tc);       -> "2011|10|29"
            formatTime(formatIsoDateTag, tc); -> "2011-10-29"      */
std::string formatTime(const char* format, const TimeComp& tc); //format as specified by "std::strftime", returns empty string on error

const char* const formatIsoDateTag     = "%Y-%m-%d";          //e.g. 2001-08-23
const char* const formatIsoTimeTag     = "%H:%M:%S";          //e.g. 14:55:02
const char* const formatIsoDateTimeTag = "%Y-%m-%d %H:%M:%S"; //e.g. 2001-08-23 14:55:02

//----------------------------------------------------------------------------------------------------------------------------------
//example: parseTime("%Y-%m-%d %H:%M:%S",  "2001-08-23 14:55:02");
//         parseTime("%Y%m%d%H%M%S",       "20010823145502"); <- MDTM, MLSD
TimeComp parseTime(std::string_view format, std::string_view str); //similar to ::strptime(), returns TimeComp() on error










//############################ implementation ##############################
namespace impl
{
inline
std::tm toClibTimeComponents(const TimeComp& tc)
{
    assert(1 <= tc.month  && tc.month  <= 12 &&
           1 <= tc.day    && tc.day    <= 31 &&
           0 <= tc.hour   && tc.hour   <= 23 &&
           0 <= tc.minute && tc.minute <= 59 &&
           0 <= tc.second && tc.second <= 61);

    std::tm ctc = {};
    ctc.tm_sec   = tc.second;      //0-60 (including leap second)
    ctc.tm_min   = tc.minute;      //0-59
    ctc.tm_hour  = tc.hour;        //0-23
    ctc.tm_mday  = tc.day;         //1-31
    ctc.tm_mon   = tc.month - 1;   //0-11
    ctc.tm_year  = tc.year - 1900; //years since 1900
    ctc.tm_isdst = -1;             //> 0 if DST is active, == 0 if DST is not active, < 0 if the information is not available
    return ctc;
}


inline
TimeComp toFseTimeComponents(const std::tm& ctc)
{
    return
    {
        .year   = ctc.tm_year + 1900,
        .month  = ctc.tm_mon + 1,
        .day    = ctc.tm_mday,
        .hour   = ctc.tm_hour,
        .minute = ctc.tm_min,
        .second = ctc.tm_sec,
    };
}


template <class T> inline
T intDivFloor(T numerator, T denominator)
{
    assert(denominator > 0);
    const T quotient = numerator / denominator;
    return quotient * denominator > numerator ? quotient - 1 : quotient;
}

constexpr auto daysPer400Years = 100 * (4 * 365 /*usual days per year*/ + 1 /*including leap day*/) - 3 /*no leap days for centuries, except if divisible by 400 */;
constexpr auto secsPer400Years = 3600LL * 24 * daysPer400Years;
}


inline
TimeComp getUtcTime(time_t utc)
{
    //map into working 400-year range [1970, 2370)
    //bonus: avoid asking for bugs for time_t(-1)
    const int cycles400 = static_cast<int>(impl::intDivFloor<long long>(utc, impl::secsPer400Years));
    utc -= impl::secsPer400Years * cycles400;

    std::tm ctc = {};
    if (::gmtime_r(&utc, &ctc) == nullptr)
        return TimeComp();

    ctc.tm_year += 400 * cycles400;

    return impl::toFseTimeComponents(ctc);
}


inline
TimeComp getLocalTime(time_t utc)
{
    const int cycles400 = static_cast<int>(impl::intDivFloor<long long>(utc, impl::secsPer400Years));
    utc -= impl::secsPer400Years * cycles400;

    std::tm ctc = {};
    if (::localtime_r(&utc, &ctc) == nullptr)
        return TimeComp();

    ctc.tm_year += 400 * cycles400;

    return impl::toFseTimeComponents(ctc);
}


inline
std::pair<time_t, bool /*success*/> utcToTimeT(const TimeComp& tc)
{
    if (tc == TimeComp())
        return {};

    std::tm ctc = impl::toClibTimeComponents(tc);
    ctc.tm_isdst = 0;

    /*  Linux, 64-bit: apparently NO limits
               32-bit: timegm() only works for years [1902, 2038]

        => map into working 400-year range [1970, 2370)
           bonus: disambiguate -1 error code from time_t(-1)          */
    const int cycles400 = impl::intDivFloor(ctc.tm_year + 1900 - 1970, 400);
    ctc.tm_year -= 400 * cycles400;

    const time_t utc = ::timegm(&ctc);
    if (utc == -1)
        return {};

    assert(utc >= 0);
    return {utc + impl::secsPer400Years * cycles400, true};
}


inline
std::string formatTime(const char* format, const TimeComp& tc)
{
    if (tc == TimeComp()) //failure code from getLocalTime()
        return std::string();

    std::tm ctc = impl::toClibTimeComponents(tc);
    std::mktime(&ctc); //std::strftime() needs all elements of "struct tm" filled, e.g. tm_wday, tm_yday

    std::string buf(256, '\0');
    const size_t charsWritten = std::strftime(buf.data(), buf.size(), format, &ctc);
    buf.resize(charsWritten);
    return buf;
}


inline
TimeComp parseTime(std::string_view format, std::string_view str)
{
    auto itStr = str.begin();

    auto extractNumber = [&](int& result, size_t digitCount)
    {
        if (static_cast<size_t>(str.end() - itStr) < digitCount)
            return false;

        if (!std::all_of(itStr, itStr + digitCount, isDigit))
            return false;

        result = stringTo<int>(makeStringView(itStr, itStr + digitCount));
        itStr += digitCount;
        return true;
    };

    TimeComp output;

    for (auto itFmt = format.begin(); itFmt != format.end(); ++itFmt)
    {
        const char fmt = *itFmt;

        if (fmt == '%')
        {
            ++itFmt;
            if (itFmt == format.end())
                return TimeComp();

            switch (*itFmt)
            {
                case 'Y':
                    if (!extractNumber(output.year, 4))
                        return TimeComp();
                    break;
                case 'm':
                    if (!extractNumber(output.month, 2))
                        return TimeComp();
                    break;
                case 'b': //abbreviated month name: Jan-Dec
                {
                    if (str.end() - itStr < 3)
                        return TimeComp();

                    const char* months[] = {"jan", "feb", "mar", "apr", "may", "jun", "jul", "aug", "sep", "oct", "nov", "dec"};
                    auto itMonth = std::find_if(std::begin(months), std::end(months), [&](const char* month)
                    {
                        return equalAsciiNoCase(makeStringView(itStr, itStr + 3), month);
                    });
                    if (itMonth == std::end(months))
                        return TimeComp();

                    output.month = 1 + static_cast<int>(itMonth - std::begin(months));
                    itStr += 3;
                }
                break;
                case 'd':
                    if (!extractNumber(output.day, 2))
                        return TimeComp();
                    break;
                case 'H':
                    if (!extractNumber(output.hour, 2))
                        return TimeComp();
                    break;
                case 'M':
                    if (!extractNumber(output.minute, 2))
                        return TimeComp();
                    break;
                case 'S':
                    if (!extractNumber(output.second, 2))
                        return TimeComp();
                    break;
                default:
                    return TimeComp();
            }
        }
        else if (isWhiteSpace(fmt)) //single whitespace in format => skip 0..n whitespace chars
        {
            while (itStr != str.end() && isWhiteSpace(*itStr))
                ++itStr;
        }
        else
        {
            if (itStr == str.end() || *itStr != fmt)
                return TimeComp();
            ++itStr;
        }
    }

    if (itStr != str.end())
        return TimeComp();

    //reject obviously invalid components: don't trust the remote side
    if (output.month < 1 || output.month > 12 ||
        output.day   < 1 || output.day   > 31 ||
        output.hour  > 23 || output.minute > 59 || output.second > 60)
        return TimeComp();

    return output;
}
}

#endif //TIME_H_2309875019283740198
