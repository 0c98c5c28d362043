#pragma once

/**
 * @file Common.hpp
 *
 * This module declares the base fixture used to test the
 * DurableStore::DurableWriter class.  The fixture is subclassed to test
 * various aspects of the class, including:
 * - Reading: loading, backing up, and quarantining the stored value
 * - Writing: deferring, coalescing, flushing, and removing writes
 *
 * © 2020 by Richard Walters
 */

#include <chrono>
#include <DurableStore/Configuration.hpp>
#include <DurableStore/DurableWriter.hpp>
#include <DurableStore/IDurableWriter.hpp>
#include <DurableStore/IErrorReporter.hpp>
#include <functional>
#include <future>
#include <gtest/gtest.h>
#include <Json/Value.hpp>
#include <memory>
#include <mutex>
#include <stddef.h>
#include <string>
#include <SystemAbstractions/DiagnosticsSender.hpp>
#include <Timekeeping/Scheduler.hpp>
#include <vector>

namespace DurableWriterTests {

    /**
     * This is a fake time-keeper which is used to test the writer.
     */
    struct MockTimeKeeper
        : public Timekeeping::Clock
    {
        // Properties

        std::mutex mutex;
        double currentTime = 0.0;

        // Methods

        void Advance(double amount);

        // Timekeeping::Clock

        virtual double GetCurrentTime() override;
    };

    /**
     * This is a fake error reporter which is used to test the writer.
     */
    struct MockErrorReporter
        : public DurableStore::IErrorReporter
    {
        // Properties

        std::mutex mutex;
        std::vector< DurableStore::StoreError > errors;

        // Methods

        size_t CountErrors(DurableStore::ErrorType type);

        // DurableStore::IErrorReporter

        virtual void ReportError(const DurableStore::StoreError& error) override;
    };

    /**
     * This holds information about an event published by the unit
     * under test.
     */
    struct EventInfo {
        DurableStore::IDurableWriter::Event::Type type;
        std::string name;
        std::string rescuePath;
        size_t size = 0;
        std::string reason;
    };

    /**
     * This is the base class for the concrete DurableWriterTests test
     * fixtures, providing common setup and teardown for each test.
     */
    struct Common
        : public ::testing::Test
    {
        // Properties

        DurableStore::Configuration configuration;
        std::vector< std::string > diagnosticMessages;
        SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate diagnosticsUnsubscribeDelegate;
        std::promise< void > eventsAwaited;
        std::vector< EventInfo > events;
        DurableStore::IDurableWriter::EventsUnsubscribeDelegate eventsUnsubscribeDelegate;
        std::shared_ptr< MockErrorReporter > mockErrorReporter = std::make_shared< MockErrorReporter >();
        std::shared_ptr< MockTimeKeeper > mockTimeKeeper = std::make_shared< MockTimeKeeper >();
        std::mutex mutex;
        size_t numEventsAwaiting = 0;
        std::shared_ptr< Timekeeping::Scheduler > scheduler = std::make_shared< Timekeeping::Scheduler >();
        std::string testAreaPath;
        DurableStore::IDurableWriter::Event::Type typeOfEventsAwaited = DurableStore::IDurableWriter::Event::Type::Flushed;
        DurableStore::DurableWriter writer;

        // Methods

        bool Await(
            std::future< void >& future,
            std::chrono::milliseconds timeout
        );
        size_t CountEvents(DurableStore::IDurableWriter::Event::Type type);
        bool AwaitEvents(
            DurableStore::IDurableWriter::Event::Type type,
            size_t numEvents,
            std::chrono::milliseconds timeout = std::chrono::milliseconds(1000)
        );
        bool NoEventsWithin(
            DurableStore::IDurableWriter::Event::Type type,
            size_t numEvents
        );
        void WriterPublishedEvent(const DurableStore::IDurableWriter::Event& baseEvent);
        void MobilizeWriter(const std::string& name = "Prefs");
        void AdvanceTime(double amount);
        std::string MakeRecord(
            const std::string& typeName,
            unsigned int schemaVersion,
            const Json::Value& payload
        );
        void WriteFile(
            const std::string& path,
            const std::string& contents
        );
        std::string ReadFile(const std::string& path);
        bool DecodeFile(
            const std::string& path,
            Json::Value& payload
        );
        size_t CountFiles(const std::string& directory);
        bool DiagnosticMessageContains(const std::string& text);

        // ::testing::Test

        virtual void SetUp() override;
        virtual void TearDown() override;
    };

}
