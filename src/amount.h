// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef VERDANT_AMOUNT_H
#define VERDANT_AMOUNT_H

#include <stdint.h>

/** Amount in the smallest token unit */
typedef int64_t CAmount;

/** Largest amount any balance, counter or supply may reach */
static const CAmount MAX_MONEY = INT64_MAX / 2;

inline bool MoneyRange(const CAmount& nValue) { return (nValue >= 0 && nValue <= MAX_MONEY); }

#endif // VERDANT_AMOUNT_H
