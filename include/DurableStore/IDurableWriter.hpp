#ifndef DURABLE_STORE_I_DURABLE_WRITER_HPP
#define DURABLE_STORE_I_DURABLE_WRITER_HPP

/**
 * @file IDurableWriter.hpp
 *
 * This module declares the DurableStore::IDurableWriter interface.
 *
 * © 2020 by Richard Walters
 */

#include "Configuration.hpp"
#include "IErrorReporter.hpp"

#include <functional>
#include <Json/Value.hpp>
#include <memory>
#include <stddef.h>
#include <string>
#include <Timekeeping/Scheduler.hpp>

namespace DurableStore {

    /**
     * This is the interface to the DurableWriter component, which owns the
     * file holding one named value, along with its backup and quarantine
     * copies, and commits save requests to it from a worker thread.
     */
    class IDurableWriter {
        // Types
    public:
        /**
         * This indicates how the primary file relates to the most recent
         * value given to the writer.
         */
        enum class State {
            /**
             * No file exists for the value.
             */
            Unwritten,

            /**
             * The file holds the last value read or written.
             */
            Clean,

            /**
             * A write has been requested but not yet committed.
             */
            Dirty,
        };

        /**
         * This is the result of attempting to read the value from its file.
         */
        enum class ReadOutcome {
            /**
             * The file was decoded and a backup of it was made.
             */
            Loaded,

            /**
             * No file existed for the value.
             */
            AbsentOnFirstRun,

            /**
             * The file could not be decoded under the current format, and
             * was moved into quarantine.
             */
            SchemaIncompatible,

            /**
             * The file could not be opened, read, or parsed, and was left
             * untouched.
             */
            TransientIOFailure,
        };

        /**
         * Declare the type of function called with the payload of a file
         * being read, to decode it into the caller's value.
         *
         * @param[in] payload
         *     This is the payload read from the file.
         *
         * @return
         *     An indication of whether or not the payload was accepted
         *     is returned.
         */
        using PayloadDecoder = std::function< bool(const Json::Value& payload) >;

        /**
         * This is the base type of any event published by the writer.
         * All events will subclass this type and set the appropriate value
         * for the type field.
         */
        struct Event {
            /**
             * This is used to identify the subclass of the concrete event.
             */
            const enum class Type {
                /**
                 * This indicates the value was read from its file.
                 */
                Loaded,

                /**
                 * This indicates a verified copy of the file was made.
                 */
                BackedUp,

                /**
                 * This indicates the file was moved into quarantine.
                 */
                Quarantined,

                /**
                 * This indicates a pending write was committed.
                 */
                Flushed,

                /**
                 * This indicates a pending write could not be committed.
                 */
                FlushFailed,

                /**
                 * This indicates a file was deleted on request.
                 */
                Removed,
            } type;

            /**
             * This is the logical name of the value concerned.
             */
            std::string name;

            /**
             * This is the constructor of the event.
             *
             * @param[in] type
             *     This is used to identify the subclass of the concrete event.
             */
            explicit Event(Type type) : type(type) {}
        };

        /**
         * This is an event published by the writer.  It announces that the
         * file could not be decoded and was moved aside.
         */
        struct QuarantinedEvent : public Event {
            /**
             * This is the path of the rescue copy.
             */
            std::string rescuePath;

            /**
             * This is the default constructor.
             */
            QuarantinedEvent()
                : Event(Type::Quarantined)
            {
            }
        };

        /**
         * This is an event published by the writer.  It announces that a
         * pending write was committed to the file.
         */
        struct FlushedEvent : public Event {
            /**
             * This is the number of bytes written.
             */
            size_t size = 0;

            /**
             * This is the default constructor.
             */
            FlushedEvent()
                : Event(Type::Flushed)
            {
            }
        };

        /**
         * This is an event published by the writer.  It announces that a
         * pending write could not be committed to the file.
         */
        struct FlushFailedEvent : public Event {
            /**
             * This describes why the write failed.
             */
            std::string reason;

            /**
             * This is the default constructor.
             */
            FlushFailedEvent()
                : Event(Type::FlushFailed)
            {
            }
        };

        /**
         * Declare the type of delegate used to deliver events published by the
         * writer.
         *
         * @param[in] baseEvent
         *     This is a reference to the base of the event that was published.
         *     The delegate should look at the event's type and downcast
         *     the reference to the matching subtype for more details.
         */
        using EventDelegate = std::function<
            void(
                const IDurableWriter::Event& baseEvent
            )
        >;

        /**
         * Declare the type of delegate returned when a subscriber subscribes
         * to writer events.  When called, this delegate cancels the
         * subscription.
         */
        using EventsUnsubscribeDelegate = std::function< void() >;

        // Methods
    public:
        /**
         * Subscribe to events published by the writer.
         *
         * @param[in] eventDelegate
         *     This is the delegate to be called, from the writer's worker
         *     thread, whenever an event is published by the writer.
         *
         * @return
         *     A delegate that can be called to cancel the subscription
         *     is returned.
         */
        virtual EventsUnsubscribeDelegate SubscribeToEvents(EventDelegate eventDelegate) = 0;

        /**
         * Set the object to which read and write problems are reported.
         *
         * @param[in] errorReporter
         *     This is the object to which read and write problems are
         *     reported.  It may be nullptr, in which case problems are only
         *     published as diagnostic messages.
         */
        virtual void SetErrorReporter(std::shared_ptr< IErrorReporter > errorReporter) = 0;

        /**
         * This method binds the writer to the file for the given name and
         * starts the writer's worker thread.
         *
         * @param[in] scheduler
         *     This is used to time the quiet interval of save requests.
         *
         * @param[in] configuration
         *     This holds the configuration items for the writer.
         *
         * @param[in] name
         *     This is the logical name of the value, which is also the name
         *     of its file.
         *
         * @throw std::logic_error
         *     This is thrown if another writer in the process is already
         *     bound to the same file.
         */
        virtual void Mobilize(
            std::shared_ptr< Timekeeping::Scheduler > scheduler,
            const Configuration& configuration,
            const std::string& name
        ) = 0;

        /**
         * This method stops the writer's worker thread.  Any write still
         * waiting for its quiet interval is discarded.
         */
        virtual void Demobilize() = 0;

        /**
         * Attempt to read the value from its file.  This is done on the
         * calling thread.
         *
         * @param[in] typeName
         *     This is the type name the file must carry.
         *
         * @param[in] schemaVersion
         *     This is the schema version the file must carry.
         *
         * @param[in] decoder
         *     This is called with the payload of the file, if the file
         *     carries the expected type name and schema version.
         *
         * @return
         *     The outcome of the read is returned.
         *
         * @throw std::logic_error
         *     This is thrown if the writer is not mobilized.
         */
        virtual ReadOutcome Read(
            const std::string& typeName,
            unsigned int schemaVersion,
            PayloadDecoder decoder
        ) = 0;

        /**
         * Request that the given value be written to the file once no
         * further request has been made for the quiet interval.  This
         * replaces any earlier request not yet committed.
         *
         * @param[in] typeName
         *     This is the type name to store with the value.
         *
         * @param[in] schemaVersion
         *     This is the schema version to store with the value.
         *
         * @param[in] payload
         *     This is the encoded value to store.
         *
         * @throw std::logic_error
         *     This is thrown if the writer is not mobilized.
         */
        virtual void Save(
            const std::string& typeName,
            unsigned int schemaVersion,
            const Json::Value& payload
        ) = 0;

        /**
         * Commit any pending write now, and wait for it to complete.
         *
         * @return
         *     An indication of whether or not the last write attempted
         *     reached the disk is returned.
         */
        virtual bool Flush() = 0;

        /**
         * Delete the file for the given name, without making a backup.
         * If the name is the writer's own, any pending write is cancelled
         * first.
         *
         * @param[in] name
         *     This is the logical name of the value whose file to delete.
         */
        virtual void Remove(const std::string& name) = 0;

        /**
         * Return how the primary file relates to the most recent value
         * given to the writer.
         *
         * @return
         *     The current state of the primary file is returned.
         */
        virtual State GetState() = 0;
    };

}

#endif /* DURABLE_STORE_I_DURABLE_WRITER_HPP */
