// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FTP_LISTING_H_8812093746510293847
#define FTP_LISTING_H_8812093746510293847

#include <chrono>
#include "ftp_reply.h"


namespace ftps
{
enum class FtpItemType
{
    file,
    folder,
    symlink,
};

struct FtpFile
{
    FtpItemType type = FtpItemType::file;
    std::string name;
    uint64_t size = 0;
    std::chrono::system_clock::time_point modTime; //UTC
    std::string uniqueId; //MLSD "unique" fact (optional)

    bool operator==(const FtpFile&) const = default;
};


//MLSD: https://tools.ietf.org/html/rfc3659#section-7
std::vector<FtpFile> parseMlsdListing(const std::string& buf); //throw SysError
FtpFile parseMlstLine(std::string_view rawLine); //throw SysError

//LIST: guess format: Unix "ls -l" or DOS/IIS "dir"
std::vector<FtpFile> parseListListing(const std::string& buf); //throw SysError
std::vector<FtpFile> parseUnixListing   (const std::string& buf, time_t utcTimeNow); //throw SysError
std::vector<FtpFile> parseWindowsListing(const std::string& buf, time_t utcTimeNow); //throw SysError

//NLST: one name per line; some servers prefix the queried path
std::vector<std::string> parseNameListing(const std::string& buf);
}

#endif //FTP_LISTING_H_8812093746510293847
