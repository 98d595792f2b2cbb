// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef STRING_TOOLS_H_3908127450981723
#define STRING_TOOLS_H_3908127450981723

#include <algorithm>
#include <cassert>
#include <charconv>
#include <memory> //std::to_address
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>


//string helpers for UTF-8 std::string and std::string_view
namespace fse
{
bool isWhiteSpace(char c);
bool isLineBreak (char c);
bool isDigit     (char c); //not exactly the same as "std::isdigit" -> we consider '0'-'9' only!
char asciiToLower(char c);
char asciiToUpper(char c);

bool contains(std::string_view str, std::string_view term);
bool contains(std::string_view str, char ch);

bool startsWith           (std::string_view str, std::string_view prefix);
bool startsWith           (std::string_view str, char prefix);
bool startsWithAsciiNoCase(std::string_view str, std::string_view prefix);

bool endsWith(std::string_view str, std::string_view postfix);
bool endsWith(std::string_view str, char postfix);

bool equalAsciiNoCase(std::string_view lhs, std::string_view rhs);

std::string getUpperCase(std::string_view str); //ASCII only

struct LessAsciiNoCase //STL container predicate for std::map
{
    using is_transparent = int;
    bool operator()(std::string_view lhs, std::string_view rhs) const;
};

enum class IfNotFoundReturn
{
    all,
    none
};
//S: std::string or std::string_view; T: char or string
template <class S, class T> S afterLast  (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S beforeLast (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S afterFirst (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S beforeFirst(const S& str, const T& term, IfNotFoundReturn infr);

enum class SplitOnEmpty
{
    allow,
    skip
};
template <class Function> void split(std::string_view str, char delimiter, Function onStringPart);
template <class Function1, class Function2> void split2(std::string_view str, Function1 isDelimiter, Function2 onStringPart);
[[nodiscard]] std::vector<std::string> splitCpy(std::string_view str, char delimiter, SplitOnEmpty soe);

enum class TrimSide
{
    both,
    left,
    right,
};
template <class S> [[nodiscard]] S trimCpy(const S& str, TrimSide side = TrimSide::both);
template <class S, class Function> [[nodiscard]] S trimCpy(const S& str, TrimSide side, Function trimThisChar);
void trim(std::string& str, TrimSide side = TrimSide::both);

[[nodiscard]] std::string replaceCpy(std::string str, std::string_view oldTerm, std::string_view newTerm);
void replace(std::string& str, std::string_view oldTerm, std::string_view newTerm);

template <class It> std::string_view makeStringView(It first, It last);

//conversion between numbers and strings
template <class S,   class Num> S   numberTo(const Num& number);
template <class Num, class S>   Num stringTo(const S&   str); //lenient: parse leading digits, 0 on error










//---------------------- implementation ----------------------
inline
bool isWhiteSpace(char c)
{
    assert(c != 0); //std C++ does not consider 0 as white space
    return c == ' ' || ('\t' <= c && c <= '\r');
}


inline bool isLineBreak(char c) { return c == '\r' || c == '\n'; }
inline bool isDigit    (char c) { return '0' <= c && c <= '9'; }


inline
char asciiToLower(char c)
{
    if ('A' <= c && c <= 'Z')
        return static_cast<char>(c - 'A' + 'a');
    return c;
}


inline
char asciiToUpper(char c)
{
    if ('a' <= c && c <= 'z')
        return static_cast<char>(c - 'a' + 'A');
    return c;
}


inline bool contains(std::string_view str, std::string_view term) { return str.find(term) != std::string_view::npos; }
inline bool contains(std::string_view str, char ch)               { return str.find(ch)   != std::string_view::npos; }

inline bool startsWith(std::string_view str, std::string_view prefix) { return str.substr(0, prefix.size()) == prefix; }
inline bool startsWith(std::string_view str, char prefix)             { return !str.empty() && str.front() == prefix; }

inline bool endsWith(std::string_view str, std::string_view postfix) { return str.size() >= postfix.size() && str.substr(str.size() - postfix.size()) == postfix; }
inline bool endsWith(std::string_view str, char postfix)             { return !str.empty() && str.back() == postfix; }


inline
bool equalAsciiNoCase(std::string_view lhs, std::string_view rhs)
{
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) { return asciiToLower(a) == asciiToLower(b); });
}


inline
bool startsWithAsciiNoCase(std::string_view str, std::string_view prefix)
{
    return str.size() >= prefix.size() && equalAsciiNoCase(str.substr(0, prefix.size()), prefix);
}


inline
std::string getUpperCase(std::string_view str)
{
    std::string output(str);
    std::transform(output.begin(), output.end(), output.begin(), asciiToUpper);
    return output;
}


inline
bool LessAsciiNoCase::operator()(std::string_view lhs, std::string_view rhs) const
{
    return std::lexicographical_compare(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
                                        [](char a, char b) { return asciiToLower(a) < asciiToLower(b); });
}


namespace impl
{
inline std::string_view termView(const char& ch)        { return {&ch, 1}; }
inline std::string_view termView(std::string_view term) { return term; }
}


template <class S, class T> inline
S afterLast(const S& str, const T& term, IfNotFoundReturn infr)
{
    const std::string_view termFmt = impl::termView(term);
    assert(!termFmt.empty());
    const size_t pos = str.rfind(termFmt);
    if (pos == S::npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return str.substr(pos + termFmt.size());
}


template <class S, class T> inline
S beforeLast(const S& str, const T& term, IfNotFoundReturn infr)
{
    const std::string_view termFmt = impl::termView(term);
    assert(!termFmt.empty());
    const size_t pos = str.rfind(termFmt);
    if (pos == S::npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return str.substr(0, pos);
}


template <class S, class T> inline
S afterFirst(const S& str, const T& term, IfNotFoundReturn infr)
{
    const std::string_view termFmt = impl::termView(term);
    assert(!termFmt.empty());
    const size_t pos = str.find(termFmt);
    if (pos == S::npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return str.substr(pos + termFmt.size());
}


template <class S, class T> inline
S beforeFirst(const S& str, const T& term, IfNotFoundReturn infr)
{
    const std::string_view termFmt = impl::termView(term);
    assert(!termFmt.empty());
    const size_t pos = str.find(termFmt);
    if (pos == S::npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return str.substr(0, pos);
}


template <class Function1, class Function2> inline
void split2(std::string_view str, Function1 isDelimiter, Function2 onStringPart)
{
    auto blockFirst = str.begin();
    for (;;)
    {
        auto blockLast = std::find_if(blockFirst, str.end(), isDelimiter);
        onStringPart(makeStringView(blockFirst, blockLast));

        if (blockLast == str.end())
            return;

        blockFirst = blockLast + 1;
    }
}


template <class Function> inline
void split(std::string_view str, char delimiter, Function onStringPart)
{
    split2(str, [delimiter](char c) { return c == delimiter; }, onStringPart);
}


inline
std::vector<std::string> splitCpy(std::string_view str, char delimiter, SplitOnEmpty soe)
{
    std::vector<std::string> output;
    split(str, delimiter, [&](std::string_view block)
    {
        if (!block.empty() || soe == SplitOnEmpty::allow)
            output.emplace_back(block);
    });
    return output;
}


template <class S, class Function> inline
S trimCpy(const S& str, TrimSide side, Function trimThisChar)
{
    auto itBegin = str.begin();
    auto itEnd   = str.end();

    if (side == TrimSide::right || side == TrimSide::both)
        while (itBegin != itEnd && trimThisChar(*(itEnd - 1)))
            --itEnd;

    if (side == TrimSide::left || side == TrimSide::both)
        while (itBegin != itEnd && trimThisChar(*itBegin))
            ++itBegin;

    return S(makeStringView(itBegin, itEnd));
}


template <class S> inline
S trimCpy(const S& str, TrimSide side)
{
    return trimCpy(str, side, [](char c) { return isWhiteSpace(c); });
}


inline
void trim(std::string& str, TrimSide side)
{
    str = trimCpy(str, side);
}


inline
void replace(std::string& str, std::string_view oldTerm, std::string_view newTerm)
{
    assert(!oldTerm.empty());
    if (oldTerm.empty())
        return;

    std::string output;
    size_t posLast = 0;
    for (size_t pos = str.find(oldTerm); pos != std::string::npos; pos = str.find(oldTerm, posLast))
    {
        output.append(str, posLast, pos - posLast);
        output += newTerm;
        posLast = pos + oldTerm.size();
    }
    if (posLast == 0)
        return;

    output.append(str, posLast);
    str = std::move(output);
}


inline
std::string replaceCpy(std::string str, std::string_view oldTerm, std::string_view newTerm)
{
    replace(str, oldTerm, newTerm);
    return str;
}


template <class It> inline
std::string_view makeStringView(It first, It last)
{
    return {std::to_address(first), static_cast<size_t>(last - first)};
}


template <class S, class Num> inline
S numberTo(const Num& number)
{
    static_assert(std::is_arithmetic_v<Num>);
    char buffer[64] = {};
    const auto [ptr, ec] = std::to_chars(std::begin(buffer), std::end(buffer), number);
    if (ec != std::errc())
        throw std::logic_error(std::string(__FILE__) + '[' + std::to_string(__LINE__) + "] Contract violation!");
    return S(buffer, ptr);
}


template <class Num, class S> inline
Num stringTo(const S& str)
{
    static_assert(std::is_integral_v<Num>);
    const std::string_view strView(str);

    auto it = std::find_if_not(strView.begin(), strView.end(), [](char c) { return c != 0 && isWhiteSpace(c); });
    bool negative = false;
    if (it != strView.end() && (*it == '-' || *it == '+'))
        negative = *it++ == '-';

    Num number = 0;
    const char* first = strView.data() + (it - strView.begin());
    if (std::from_chars(first, strView.data() + strView.size(), number).ec != std::errc())
        return 0;

    if constexpr (std::is_signed_v<Num>)
        return negative ? -number : number;
    else
        return negative ? 0 : number;
}
}

#endif //STRING_TOOLS_H_3908127450981723
