// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef VERDANT_SYNC_H
#define VERDANT_SYNC_H

#include <mutex>

/**
 * Recursive mutex guarding a component's state. A public entry point may
 * call another public entry point of the same component while holding it.
 */
class CCriticalSection : public std::recursive_mutex
{
};

typedef std::unique_lock<std::recursive_mutex> CCriticalBlock;

#define PASTE(x, y) x ## y
#define PASTE2(x, y) PASTE(x, y)

#define LOCK(cs) CCriticalBlock PASTE2(criticalblock, __COUNTER__)(cs)

#endif // VERDANT_SYNC_H
