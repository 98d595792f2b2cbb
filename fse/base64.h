// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef BASE64_H_5510293847560192834
#define BASE64_H_5510293847560192834

#include <iterator>
#include <optional>
#include <string>
#include <string_view>


namespace fse
{
/*  https://en.wikipedia.org/wiki/Base64, RFC 4648 alphabet

    Usage:
        fse::stringEncodeBase64("Sample text") == "U2FtcGxlIHRleHQ="   */

std::string stringEncodeBase64(std::string_view str);

//unlike an email decoder: reject instead of skip foreign characters (path phrase passwords must not silently change)
std::optional<std::string> stringDecodeBase64(std::string_view str);










//------------------------- implementation -------------------------------
namespace impl
{
//64 chars for base64 encoding + padding char
constexpr char ENCODING_MIME[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/=";
constexpr unsigned char INDEX_PAD = 64; //index of "="

inline
int decodeMimeChar(char c) //-1 if not part of the alphabet
{
    if ('A' <= c && c <= 'Z') return c - 'A';
    if ('a' <= c && c <= 'z') return c - 'a' + 26;
    if ('0' <= c && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    if (c == '=') return INDEX_PAD;
    return -1;
}
}


inline
std::string stringEncodeBase64(std::string_view str)
{
    using namespace impl;
    static_assert(std::size(ENCODING_MIME) == 64 + 1 + 1);

    std::string output;
    output.reserve((str.size() + 2) / 3 * 4);

    for (auto it = str.begin(); it != str.end(); )
    {
        const unsigned char a = static_cast<unsigned char>(*it++);
        output += ENCODING_MIME[a >> 2];

        if (it == str.end())
        {
            output += ENCODING_MIME[((a & 0x3) << 4)];
            output += ENCODING_MIME[INDEX_PAD];
            output += ENCODING_MIME[INDEX_PAD];
            break;
        }
        const unsigned char b = static_cast<unsigned char>(*it++);
        output += ENCODING_MIME[((a & 0x3) << 4) | (b >> 4)];

        if (it == str.end())
        {
            output += ENCODING_MIME[((b & 0xf) << 2)];
            output += ENCODING_MIME[INDEX_PAD];
            break;
        }
        const unsigned char c = static_cast<unsigned char>(*it++);
        output += ENCODING_MIME[((b & 0xf) << 2) | (c >> 6)];
        output += ENCODING_MIME[c & 0x3f];
    }
    return output;
}


inline
std::optional<std::string> stringDecodeBase64(std::string_view str)
{
    using namespace impl;

    if (str.size() % 4 != 0)
        return std::nullopt;

    std::string output;
    output.reserve(str.size() / 4 * 3);

    for (size_t i = 0; i < str.size(); i += 4)
    {
        int index[4] = {};
        for (size_t k = 0; k < 4; ++k)
        {
            index[k] = decodeMimeChar(str[i + k]);
            if (index[k] < 0)
                return std::nullopt;
        }
        const bool lastBlock = i + 4 == str.size();

        if (index[0] == INDEX_PAD || index[1] == INDEX_PAD ||
            (index[2] == INDEX_PAD && index[3] != INDEX_PAD) ||
            (!lastBlock && index[3] == INDEX_PAD))
            return std::nullopt;

        output += static_cast<char>((index[0] << 2) | (index[1] >> 4));

        if (index[2] == INDEX_PAD) //padding
            break;
        output += static_cast<char>(((index[1] & 0xf) << 4) | (index[2] >> 2));

        if (index[3] == INDEX_PAD) //padding
            break;
        output += static_cast<char>(((index[2] & 0x3) << 6) | index[3]);
    }
    return output;
}
}

#endif //BASE64_H_5510293847560192834
