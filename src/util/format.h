// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef VERDANT_UTIL_FORMAT_H
#define VERDANT_UTIL_FORMAT_H

#include <stdexcept>
#include <string>

// Every translation unit reaches tinyformat through this header so that a
// bad format string raises instead of asserting.
#ifndef TINYFORMAT_ERROR
#define TINYFORMAT_ERROR(reason) throw std::runtime_error(reason)
#endif
#include <tinyformat.h>

/** Format arguments and return the string */
template <typename... Args>
std::string strprintf(const char* fmt, const Args&... args)
{
    return tfm::format(fmt, args...);
}

#endif // VERDANT_UTIL_FORMAT_H
