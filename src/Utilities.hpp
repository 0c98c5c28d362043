#ifndef DURABLE_STORE_UTILITIES_HPP
#define DURABLE_STORE_UTILITIES_HPP

/**
 * @file Utilities.hpp
 *
 * This module contains the declaration of free functions used by other parts
 * of the library implementation.
 *
 * © 2020 by Richard Walters
 */

#include <DurableStore/IDurableWriter.hpp>
#include <DurableStore/IErrorReporter.hpp>
#include <ostream>
#include <string>

namespace DurableStore {

    /**
     * This is a support function for Google Test to print out
     * values of the DurableStore::IDurableWriter::ReadOutcome type.
     *
     * @param[in] readOutcome
     *     This is the read outcome value to print.
     *
     * @param[in] os
     *     This points to the stream to which to print the
     *     read outcome value.
     */
    void PrintTo(
        const IDurableWriter::ReadOutcome& readOutcome,
        std::ostream* os
    );

    /**
     * This is a support function for Google Test to print out
     * values of the DurableStore::IDurableWriter::State type.
     *
     * @param[in] state
     *     This is the state value to print.
     *
     * @param[in] os
     *     This points to the stream to which to print the state value.
     */
    void PrintTo(
        const IDurableWriter::State& state,
        std::ostream* os
    );

    /**
     * This is a support function for Google Test to print out
     * values of the DurableStore::ErrorType type.
     *
     * @param[in] errorType
     *     This is the error type value to print.
     *
     * @param[in] os
     *     This points to the stream to which to print the
     *     error type value.
     */
    void PrintTo(
        const ErrorType& errorType,
        std::ostream* os
    );

    /**
     * Return a human-readable string representation of the given
     * read outcome.
     *
     * @param[in] readOutcome
     *     This is the read outcome to turn into a string.
     *
     * @return
     *     A human-readable string representation of the given
     *     read outcome is returned.
     */
    std::string ReadOutcomeToString(IDurableWriter::ReadOutcome readOutcome);

    std::string StateToString(IDurableWriter::State state);

    std::string ErrorTypeToString(ErrorType errorType);

}

#endif /* DURABLE_STORE_UTILITIES_HPP */
