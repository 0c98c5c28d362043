#ifndef DURABLE_STORE_I_ERROR_REPORTER_HPP
#define DURABLE_STORE_I_ERROR_REPORTER_HPP

/**
 * @file IErrorReporter.hpp
 *
 * This module declares the DurableStore::IErrorReporter interface.
 *
 * © 2020 by Richard Walters
 */

#include <string>

namespace DurableStore {

    /**
     * This classifies the conditions the store can report.
     */
    enum class ErrorType {
        /**
         * No file existed for the value.  This is the normal condition
         * on first run, and is never reported as an error; it only appears
         * as the outcome of a read.
         */
        AbsentOnFirstRun,

        /**
         * The file exists but could not be decoded under the current type
         * name, schema version, or container format.  The file has been
         * moved into quarantine and the value is treated as absent.
         */
        SchemaIncompatible,

        /**
         * The file could not be opened, read, or parsed, or a backup could
         * not be made.  The file has been left where it is, since the cause
         * may go away on its own.
         */
        TransientIOFailure,

        /**
         * The store was used incorrectly by its owner, for example by
         * saving before initializing, or by binding two stores to the same
         * file.
         */
        ProgrammingMisuse,

        /**
         * A debounced write could not be committed to disk.
         */
        WriteFailure,
    };

    /**
     * This holds the details of one condition reported by the store.
     */
    struct StoreError {
        /**
         * This classifies the condition.
         */
        ErrorType type = ErrorType::TransientIOFailure;

        /**
         * This is the logical name of the value concerned.
         */
        std::string name;

        /**
         * This is the path of the file concerned.
         */
        std::string path;

        /**
         * This is a human-readable description of what happened.
         */
        std::string message;
    };

    /**
     * This is the interface the store uses to tell its host about read and
     * write problems.  The host decides how to surface them (log, user
     * interface, metric, etc.).
     *
     * @note
     *     Write failures are reported from the writer's worker thread.
     */
    class IErrorReporter {
    public:
        /**
         * Report a condition detected by the store.
         *
         * @param[in] error
         *     This holds the details of the condition.
         */
        virtual void ReportError(const StoreError& error) = 0;
    };

}

#endif /* DURABLE_STORE_I_ERROR_REPORTER_HPP */
