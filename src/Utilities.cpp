/**
 * @file Utilities.cpp
 *
 * This module contains the implementation of free functions used by other
 * parts of the library implementation.
 *
 * © 2020 by Richard Walters
 */

#include "Utilities.hpp"

#include <DurableStore/IDurableWriter.hpp>
#include <DurableStore/IErrorReporter.hpp>
#include <ostream>
#include <string>

namespace DurableStore {

    void PrintTo(
        const IDurableWriter::ReadOutcome& readOutcome,
        std::ostream* os
    ) {
        *os << ReadOutcomeToString(readOutcome);
    }

    void PrintTo(
        const IDurableWriter::State& state,
        std::ostream* os
    ) {
        *os << StateToString(state);
    }

    void PrintTo(
        const ErrorType& errorType,
        std::ostream* os
    ) {
        *os << ErrorTypeToString(errorType);
    }

    std::string ReadOutcomeToString(IDurableWriter::ReadOutcome readOutcome) {
        switch (readOutcome) {
            case IDurableWriter::ReadOutcome::Loaded: return "Loaded";
            case IDurableWriter::ReadOutcome::AbsentOnFirstRun: return "AbsentOnFirstRun";
            case IDurableWriter::ReadOutcome::SchemaIncompatible: return "SchemaIncompatible";
            case IDurableWriter::ReadOutcome::TransientIOFailure: return "TransientIOFailure";
            default: return "???";
        }
    }

    std::string StateToString(IDurableWriter::State state) {
        switch (state) {
            case IDurableWriter::State::Unwritten: return "Unwritten";
            case IDurableWriter::State::Clean: return "Clean";
            case IDurableWriter::State::Dirty: return "Dirty";
            default: return "???";
        }
    }

    std::string ErrorTypeToString(ErrorType errorType) {
        switch (errorType) {
            case ErrorType::AbsentOnFirstRun: return "AbsentOnFirstRun";
            case ErrorType::SchemaIncompatible: return "SchemaIncompatible";
            case ErrorType::TransientIOFailure: return "TransientIOFailure";
            case ErrorType::ProgrammingMisuse: return "ProgrammingMisuse";
            case ErrorType::WriteFailure: return "WriteFailure";
            default: return "???";
        }
    }

}
