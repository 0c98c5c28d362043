#pragma once

/**
 * @file DurableWriterImpl.hpp
 *
 * This module contains the implementation of the DurableStore::DurableWriter
 * class.
 *
 * © 2020 by Richard Walters
 */

#include <AsyncData/MultiProducerSingleConsumerQueue.hpp>
#include <condition_variable>
#include <DurableStore/Configuration.hpp>
#include <DurableStore/DurableWriter.hpp>
#include <DurableStore/IErrorReporter.hpp>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <stddef.h>
#include <string>
#include <SystemAbstractions/DiagnosticsSender.hpp>
#include <Timekeeping/Scheduler.hpp>
#include <thread>
#include <vector>

namespace DurableStore {

    /**
     * This contains the private properties of a DurableWriter class instance
     * that don't live any longer than the DurableWriter class instance itself.
     */
    struct DurableWriter::Impl
        : std::enable_shared_from_this< Impl >
    {
        // Properties

        /**
         * This is a helper object used to generate and publish
         * diagnostic messages.
         */
        SystemAbstractions::DiagnosticsSender diagnosticsSender;

        /**
         * This is used to synchronize access to the properties below.
         */
        std::mutex mutex;

        bool mobilized = false;

        /**
         * This is incremented whenever a scheduled flush is superseded,
         * so that callbacks from the scheduler for it are ignored.
         */
        size_t generation = 0;

        /**
         * This is the next identifier to use for an event subscription.
         */
        int nextEventSubscriberId = 0;

        /**
         * These are the current subscriptions to writer events.
         */
        std::map< int, IDurableWriter::EventDelegate > eventSubscribers;

        /**
         * This is the object to which read and write problems are reported.
         */
        std::shared_ptr< IErrorReporter > errorReporter;

        /**
         * This is used to time the quiet interval of save requests.
         */
        std::shared_ptr< Timekeeping::Scheduler > scheduler;

        /**
         * This holds all configuration items for the writer.
         */
        Configuration configuration;

        /**
         * This is the logical name of the value kept by the writer.
         */
        std::string name;

        std::string primaryPath;

        std::string backupPath;

        /**
         * This indicates how the primary file relates to the most recent
         * value given to the writer.
         */
        IDurableWriter::State state = IDurableWriter::State::Unwritten;

        /**
         * If not nullptr, this is the serialized record most recently
         * requested to be written, and not yet handed to the worker thread.
         */
        std::shared_ptr< const std::string > pendingWrite;

        /**
         * This is the number of save requests accepted since the writer
         * was mobilized.
         */
        size_t saveCount = 0;

        /**
         * This is the number of save requests which have been either
         * committed, attempted and failed, or discarded.
         */
        size_t settledSaveCount = 0;

        /**
         * This is the scheduler token for the callback that happens
         * when the quiet interval of the last save request passes.
         */
        int flushTimeoutToken = 0;

        /**
         * This flag is set when the worker thread should commit the
         * pending write.
         */
        bool flushDue = false;

        /**
         * This flag is set while the worker thread is committing a write,
         * with the mutex released.
         */
        bool flushInProgress = false;

        /**
         * This flag is set while the worker thread is reporting the errors
         * of a write, with the mutex released.
         */
        bool reportingFlushErrors = false;

        /**
         * This indicates whether or not the last write attempted reached
         * the disk.
         */
        bool lastFlushSucceeded = true;

        /**
         * This is the number of writes committed since the writer was
         * mobilized.
         */
        size_t flushCount = 0;

        /**
         * If this is not nullptr, then the worker thread should set the result
         * once it executes a full loop.
         */
        std::shared_ptr< std::promise< void > > workerLoopCompletion;

        /**
         * This holds events to be delivered to subscribers by the worker
         * thread.
         */
        AsyncData::MultiProducerSingleConsumerQueue<
            std::shared_ptr< IDurableWriter::Event >
        > eventQueue;

        /**
         * This is the thread which commits writes and delivers events.
         */
        std::thread worker;

        /**
         * This is used to wake the worker thread.
         */
        std::condition_variable workerWakeCondition;

        /**
         * This is notified whenever the worker thread finishes (or skips)
         * a write, or the writer is demobilized.
         */
        std::condition_variable flushCompletedCondition;

        /**
         * This flag is set when the worker thread should stop.
         */
        bool stopWorker = false;

        // Methods

        Impl();

        double GetCurrentTime();

        void QueueError(
            std::vector< StoreError >& errors,
            ErrorType type,
            const std::string& path,
            const std::string& message
        );

        void AddToEventQueue(std::shared_ptr< IDurableWriter::Event >&& event);

        void QueueEvent(IDurableWriter::Event::Type type);

        void ProcessEventQueue(
            std::unique_lock< decltype(mutex) >& lock
        );

        void ResetFlushTimer();

        void CancelFlushTimer();

        IDurableWriter::ReadOutcome ReadPrimaryFile(
            const std::string& expectedTypeName,
            unsigned int expectedSchemaVersion,
            IDurableWriter::PayloadDecoder decoder,
            std::vector< StoreError >& errors
        );

        void BackUpVerifiedContents(
            const std::string& contents,
            std::vector< StoreError >& errors
        );

        IDurableWriter::ReadOutcome Quarantine(
            const std::string& reason,
            std::vector< StoreError >& errors
        );

        void FlushPendingWrite(
            std::unique_lock< decltype(mutex) >& lock
        );

        void Worker();
    };

    /**
     * Deliver the given errors to the given reporter, if any.
     *
     * @param[in] errorReporter
     *     This is the object to which to report the errors.
     *
     * @param[in] errors
     *     These are the errors to report.
     */
    void ReportErrors(
        const std::shared_ptr< IErrorReporter >& errorReporter,
        const std::vector< StoreError >& errors
    );

}
