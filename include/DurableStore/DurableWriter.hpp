#ifndef DURABLE_STORE_DURABLE_WRITER_HPP
#define DURABLE_STORE_DURABLE_WRITER_HPP

/**
 * @file DurableWriter.hpp
 *
 * This module declares the DurableStore::DurableWriter implementation.
 *
 * © 2020 by Richard Walters
 */

#include <DurableStore/IDurableWriter.hpp>
#include <memory>
#include <stddef.h>
#include <string>
#include <SystemAbstractions/DiagnosticsSender.hpp>

namespace DurableStore {

    /**
     * This class owns the file of one named value.  Reads are done on the
     * caller's thread.  Writes are debounced: each save request restarts a
     * quiet interval, and only when the interval passes with no further
     * request is the latest value committed, by a worker thread dedicated
     * to the file.
     *
     * @note
     *     A value saved faster than once per quiet interval, without pause,
     *     is never committed until the saves stop (or Flush is called).
     */
    class DurableWriter
        : public IDurableWriter
    {
        // Lifecycle Methods
    public:
        ~DurableWriter() noexcept;
        DurableWriter(const DurableWriter&) = delete;
        DurableWriter(DurableWriter&&) noexcept;
        DurableWriter& operator=(const DurableWriter&) = delete;
        DurableWriter& operator=(DurableWriter&&) noexcept;

        // Public Methods
    public:
        /**
         * This is the constructor of the class.
         */
        DurableWriter();

        /**
         * This method forms a new subscription to diagnostic
         * messages published by the class.
         *
         * @param[in] delegate
         *     This is the function to call to deliver messages
         *     to the subscriber.
         *
         * @param[in] minLevel
         *     This is the minimum level of message that this subscriber
         *     desires to receive.
         *
         * @return
         *     A function is returned which may be called
         *     to terminate the subscription.
         */
        SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate SubscribeToDiagnostics(
            SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
            size_t minLevel = 0
        );

        /**
         * This method blocks until the writer's worker thread executes at
         * least one more loop.
         */
        void WaitForAtLeastOneWorkerLoop();

        /**
         * Return the path of the primary file.
         *
         * @return
         *     The path of the primary file is returned.
         */
        std::string GetPrimaryPath() const;

        /**
         * Return the path of the backup file.
         *
         * @return
         *     The path of the backup file is returned.
         */
        std::string GetBackupPath() const;

        /**
         * Return the path of the directory into which files that can no
         * longer be decoded are moved.
         *
         * @return
         *     The path of the quarantine directory is returned.
         */
        std::string GetQuarantineDirectory() const;

        /**
         * Return the number of writes committed to the primary file since
         * the writer was mobilized.
         *
         * @return
         *     The number of writes committed is returned.
         */
        size_t GetFlushCount() const;

        // IDurableWriter
    public:
        virtual EventsUnsubscribeDelegate SubscribeToEvents(EventDelegate eventDelegate) override;
        virtual void SetErrorReporter(std::shared_ptr< IErrorReporter > errorReporter) override;
        virtual void Mobilize(
            std::shared_ptr< Timekeeping::Scheduler > scheduler,
            const Configuration& configuration,
            const std::string& name
        ) override;
        virtual void Demobilize() override;
        virtual ReadOutcome Read(
            const std::string& typeName,
            unsigned int schemaVersion,
            PayloadDecoder decoder
        ) override;
        virtual void Save(
            const std::string& typeName,
            unsigned int schemaVersion,
            const Json::Value& payload
        ) override;
        virtual bool Flush() override;
        virtual void Remove(const std::string& name) override;
        virtual State GetState() override;

        // Private properties
    private:
        /**
         * This is the type of structure that contains the private
         * properties of the instance.  It is defined in the implementation
         * and declared here to ensure that it is scoped inside the class.
         */
        struct Impl;

        /**
         * This contains the private properties of the instance.
         */
        std::shared_ptr< Impl > impl_;
    };

}

#endif /* DURABLE_STORE_DURABLE_WRITER_HPP */
