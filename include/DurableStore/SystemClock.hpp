#ifndef DURABLE_STORE_SYSTEM_CLOCK_HPP
#define DURABLE_STORE_SYSTEM_CLOCK_HPP

/**
 * @file SystemClock.hpp
 *
 * This module declares the DurableStore::SystemClock class.
 *
 * © 2020 by Richard Walters
 */

#include <Timekeeping/Scheduler.hpp>

namespace DurableStore {

    /**
     * This is the clock to give a Timekeeping::Scheduler so that save
     * requests are debounced in real time.
     */
    class SystemClock
        : public Timekeeping::Clock
    {
        // Timekeeping::Clock
    public:
        /**
         * This method returns the time elapsed on a monotonic clock,
         * in seconds.
         *
         * @return
         *     The current time is returned, in seconds.
         */
        virtual double GetCurrentTime() override;
    };

}

#endif /* DURABLE_STORE_SYSTEM_CLOCK_HPP */
