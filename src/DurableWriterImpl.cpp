/**
 * @file DurableWriterImpl.cpp
 *
 * This module contains the implementation of the
 * DurableStore::DurableWriter::Impl structure.
 *
 * © 2020 by Richard Walters
 */

#include "DurableWriterImpl.hpp"
#include "FileOperations.hpp"
#include "Record.hpp"
#include "Utilities.hpp"

#include <DurableStore/DurableWriter.hpp>
#include <DurableStore/IErrorReporter.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <SystemAbstractions/DiagnosticsSender.hpp>
#include <SystemAbstractions/File.hpp>
#include <time.h>
#include <vector>

namespace DurableStore {

    DurableWriter::Impl::Impl()
        : diagnosticsSender("DurableStore::DurableWriter")
    {
    }

    double DurableWriter::Impl::GetCurrentTime() {
        return scheduler->GetClock()->GetCurrentTime();
    }

    void DurableWriter::Impl::QueueError(
        std::vector< StoreError >& errors,
        ErrorType type,
        const std::string& path,
        const std::string& message
    ) {
        diagnosticsSender.SendDiagnosticInformationFormatted(
            (
                (type == ErrorType::SchemaIncompatible)
                ? SystemAbstractions::DiagnosticsSender::Levels::WARNING
                : SystemAbstractions::DiagnosticsSender::Levels::ERROR
            ),
            "%s (%s): %s",
            name.c_str(),
            ErrorTypeToString(type).c_str(),
            message.c_str()
        );
        StoreError error;
        error.type = type;
        error.name = name;
        error.path = path;
        error.message = message;
        errors.push_back(std::move(error));
    }

    void DurableWriter::Impl::AddToEventQueue(
        std::shared_ptr< IDurableWriter::Event >&& event
    ) {
        eventQueue.Add(std::move(event));
        workerWakeCondition.notify_one();
    }

    void DurableWriter::Impl::QueueEvent(IDurableWriter::Event::Type type) {
        auto event = std::make_shared< IDurableWriter::Event >(type);
        event->name = name;
        AddToEventQueue(std::move(event));
    }

    void DurableWriter::Impl::ProcessEventQueue(
        std::unique_lock< decltype(mutex) >& lock
    ) {
        auto eventSubscribersSample = eventSubscribers;
        lock.unlock();
        while (!eventQueue.IsEmpty()) {
            const auto event = eventQueue.Remove();
            for (auto eventSubscriber: eventSubscribersSample) {
                eventSubscriber.second(*event);
            }
        }
        lock.lock();
    }

    void DurableWriter::Impl::ResetFlushTimer() {
        CancelFlushTimer();
        const auto timeout = GetCurrentTime() + configuration.quietInterval;
        std::weak_ptr< Impl > weakImpl(shared_from_this());
        const auto thisGeneration = generation;
        flushTimeoutToken = scheduler->Schedule(
            [weakImpl, thisGeneration]{
                auto impl = weakImpl.lock();
                if (impl == nullptr) {
                    return;
                }
                std::lock_guard< decltype(impl->mutex) > lock(impl->mutex);
                if (
                    !impl->mobilized
                    || (impl->generation != thisGeneration)
                ) {
                    return;
                }
                impl->flushTimeoutToken = 0;
                impl->flushDue = true;
                impl->workerWakeCondition.notify_one();
            },
            timeout
        );
    }

    void DurableWriter::Impl::CancelFlushTimer() {
        ++generation;
        if (flushTimeoutToken != 0) {
            scheduler->Cancel(flushTimeoutToken);
            flushTimeoutToken = 0;
        }
    }

    auto DurableWriter::Impl::ReadPrimaryFile(
        const std::string& expectedTypeName,
        unsigned int expectedSchemaVersion,
        IDurableWriter::PayloadDecoder decoder,
        std::vector< StoreError >& errors
    ) -> IDurableWriter::ReadOutcome {
        state = IDurableWriter::State::Unwritten;
        const auto readStartTime = GetCurrentTime();
        if (!SystemAbstractions::File(primaryPath).IsExisting()) {
            diagnosticsSender.SendDiagnosticInformationFormatted(
                1,
                "%s: file not available; that is OK for the first run",
                name.c_str()
            );
            return IDurableWriter::ReadOutcome::AbsentOnFirstRun;
        }
        std::string contents;
        std::string failureReason;
        if (!ReadFile(primaryPath, contents, failureReason)) {
            QueueError(errors, ErrorType::TransientIOFailure, primaryPath, failureReason);
            return IDurableWriter::ReadOutcome::TransientIOFailure;
        }
        Record record;
        switch (record.Deserialize(contents)) {
            case Record::DecodeResult::Malformed: {
                QueueError(
                    errors,
                    ErrorType::TransientIOFailure,
                    primaryPath,
                    "'" + primaryPath + "' is truncated or malformed"
                );
                return IDurableWriter::ReadOutcome::TransientIOFailure;
            }

            case Record::DecodeResult::UnsupportedFormat: {
                return Quarantine(
                    "'" + primaryPath + "' was written in a newer format",
                    errors
                );
            }

            default: break;
        }
        if (record.typeName != expectedTypeName) {
            return Quarantine(
                "'" + primaryPath + "' holds type '" + record.typeName
                + "' rather than '" + expectedTypeName + "'",
                errors
            );
        }
        if (record.schemaVersion != expectedSchemaVersion) {
            return Quarantine(
                "'" + primaryPath + "' holds schema version "
                + std::to_string(record.schemaVersion)
                + " rather than " + std::to_string(expectedSchemaVersion),
                errors
            );
        }
        if (!decoder(record.payload)) {
            return Quarantine(
                "'" + primaryPath + "' holds a payload which could not be decoded",
                errors
            );
        }
        diagnosticsSender.SendDiagnosticInformationFormatted(
            2,
            "Read %s completed in %.0lf msec",
            name.c_str(),
            (GetCurrentTime() - readStartTime) * 1000.0
        );
        state = IDurableWriter::State::Clean;
        QueueEvent(IDurableWriter::Event::Type::Loaded);
        const auto backupStartTime = GetCurrentTime();
        BackUpVerifiedContents(contents, errors);
        diagnosticsSender.SendDiagnosticInformationFormatted(
            2,
            "Backup %s completed in %.0lf msec",
            name.c_str(),
            (GetCurrentTime() - backupStartTime) * 1000.0
        );
        return IDurableWriter::ReadOutcome::Loaded;
    }

    void DurableWriter::Impl::BackUpVerifiedContents(
        const std::string& contents,
        std::vector< StoreError >& errors
    ) {
        const auto backupDirectory = configuration.GetBackupDirectory();
        if (!EnsureDirectory(backupDirectory)) {
            QueueError(
                errors,
                ErrorType::TransientIOFailure,
                backupPath,
                "unable to create backup directory '" + backupDirectory + "'"
            );
            return;
        }
        std::string failureReason;
        if (!WriteFileAtomically(backupPath, contents, failureReason)) {
            QueueError(
                errors,
                ErrorType::TransientIOFailure,
                backupPath,
                "backup failed: " + failureReason
            );
            return;
        }
        QueueEvent(IDurableWriter::Event::Type::BackedUp);
    }

    auto DurableWriter::Impl::Quarantine(
        const std::string& reason,
        std::vector< StoreError >& errors
    ) -> IDurableWriter::ReadOutcome {
        state = IDurableWriter::State::Unwritten;
        const auto quarantineDirectory = configuration.GetQuarantineDirectory();
        if (!EnsureDirectory(quarantineDirectory)) {
            QueueError(
                errors,
                ErrorType::SchemaIncompatible,
                primaryPath,
                reason + "; unable to create quarantine directory '"
                + quarantineDirectory + "', so the file was left in place"
            );
            return IDurableWriter::ReadOutcome::SchemaIncompatible;
        }
        const auto rescuePath = MakeRescuePath(quarantineDirectory, name, time(NULL));
        SystemAbstractions::File file(primaryPath);
        if (!file.Move(rescuePath)) {
            QueueError(
                errors,
                ErrorType::SchemaIncompatible,
                primaryPath,
                reason + "; unable to move it to '" + rescuePath
                + "', so the file was left in place"
            );
            return IDurableWriter::ReadOutcome::SchemaIncompatible;
        }
        QueueError(
            errors,
            ErrorType::SchemaIncompatible,
            rescuePath,
            reason + "; moved it to '" + rescuePath + "'"
        );
        diagnosticsSender.SendDiagnosticInformationFormatted(
            3,
            "Quarantined %s as %s",
            name.c_str(),
            rescuePath.c_str()
        );
        auto event = std::make_shared< IDurableWriter::QuarantinedEvent >();
        event->name = name;
        event->rescuePath = rescuePath;
        AddToEventQueue(std::move(event));
        return IDurableWriter::ReadOutcome::SchemaIncompatible;
    }

    void DurableWriter::Impl::FlushPendingWrite(
        std::unique_lock< decltype(mutex) >& lock
    ) {
        flushDue = false;
        if (pendingWrite == nullptr) {
            flushCompletedCondition.notify_all();
            return;
        }
        const auto serialization = std::move(pendingWrite);
        pendingWrite = nullptr;
        const auto writeSaveCount = saveCount;
        flushInProgress = true;
        const auto path = primaryPath;
        const auto errorReporterSample = errorReporter;
        diagnosticsSender.SendDiagnosticInformationFormatted(
            2,
            "%s: writing %zu bytes",
            name.c_str(),
            serialization->size()
        );
        lock.unlock();
        std::string failureReason;
        const auto written = WriteFileAtomically(path, *serialization, failureReason);
        lock.lock();
        flushInProgress = false;
        if (writeSaveCount > settledSaveCount) {
            settledSaveCount = writeSaveCount;
        }
        lastFlushSucceeded = written;
        std::vector< StoreError > errors;
        if (written) {
            ++flushCount;
            if (pendingWrite == nullptr) {
                state = IDurableWriter::State::Clean;
            }
            diagnosticsSender.SendDiagnosticInformationFormatted(
                1,
                "%s: wrote %zu bytes",
                name.c_str(),
                serialization->size()
            );
            auto event = std::make_shared< IDurableWriter::FlushedEvent >();
            event->name = name;
            event->size = serialization->size();
            AddToEventQueue(std::move(event));
        } else {
            QueueError(errors, ErrorType::WriteFailure, path, failureReason);
            auto event = std::make_shared< IDurableWriter::FlushFailedEvent >();
            event->name = name;
            event->reason = failureReason;
            AddToEventQueue(std::move(event));
        }
        if (!errors.empty()) {
            reportingFlushErrors = true;
            flushCompletedCondition.notify_all();
            lock.unlock();
            ReportErrors(errorReporterSample, errors);
            lock.lock();
            reportingFlushErrors = false;
        }
        flushCompletedCondition.notify_all();
    }

    void DurableWriter::Impl::Worker() {
        std::unique_lock< decltype(mutex) > lock(mutex);
        diagnosticsSender.SendDiagnosticInformationString(
            0,
            "Writer worker thread started"
        );
        while (!stopWorker) {
            workerWakeCondition.wait(
                lock,
                [this]{
                    return (
                        stopWorker
                        || flushDue
                        || !eventQueue.IsEmpty()
                        || (workerLoopCompletion != nullptr)
                    );
                }
            );
            if (flushDue && !stopWorker) {
                FlushPendingWrite(lock);
            }
            ProcessEventQueue(lock);
            if (workerLoopCompletion != nullptr) {
                workerLoopCompletion->set_value();
                workerLoopCompletion = nullptr;
            }
        }
        diagnosticsSender.SendDiagnosticInformationString(
            0,
            "Writer worker thread stopping"
        );
    }

    void ReportErrors(
        const std::shared_ptr< IErrorReporter >& errorReporter,
        const std::vector< StoreError >& errors
    ) {
        if (errorReporter == nullptr) {
            return;
        }
        for (const auto& error: errors) {
            errorReporter->ReportError(error);
        }
    }

}
