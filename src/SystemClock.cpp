/**
 * @file SystemClock.cpp
 *
 * This module contains the implementation of the DurableStore::SystemClock
 * class.
 *
 * © 2020 by Richard Walters
 */

#include <chrono>
#include <DurableStore/SystemClock.hpp>

namespace DurableStore {

    double SystemClock::GetCurrentTime() {
        const auto sinceEpoch = std::chrono::steady_clock::now().time_since_epoch();
        return std::chrono::duration_cast< std::chrono::duration< double > >(sinceEpoch).count();
    }

}
