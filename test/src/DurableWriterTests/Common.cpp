/**
 * @file Common.cpp
 *
 * This module provides the implementation of the base fixture used to test
 * the DurableStore::DurableWriter class.
 *
 * © 2020 by Richard Walters
 */

#include "Common.hpp"
#include "../../../src/Record.hpp"

#include <algorithm>
#include <DurableStore/DurableWriter.hpp>
#include <DurableStore/IDurableWriter.hpp>
#include <functional>
#include <gtest/gtest.h>
#include <stddef.h>
#include <StringExtensions/StringExtensions.hpp>
#include <SystemAbstractions/File.hpp>
#include <vector>

namespace DurableWriterTests {

    void MockTimeKeeper::Advance(double amount) {
        std::lock_guard< decltype(mutex) > lock(mutex);
        currentTime += amount;
    }

    double MockTimeKeeper::GetCurrentTime() {
        std::lock_guard< decltype(mutex) > lock(mutex);
        return currentTime;
    }

    size_t MockErrorReporter::CountErrors(DurableStore::ErrorType type) {
        std::lock_guard< decltype(mutex) > lock(mutex);
        return (size_t)std::count_if(
            errors.begin(),
            errors.end(),
            [type](const DurableStore::StoreError& error){
                return (error.type == type);
            }
        );
    }

    void MockErrorReporter::ReportError(const DurableStore::StoreError& error) {
        std::lock_guard< decltype(mutex) > lock(mutex);
        errors.push_back(error);
    }

    bool Common::Await(
        std::future< void >& future,
        std::chrono::milliseconds timeout
    ) {
        return (
            future.wait_for(timeout) == std::future_status::ready
        );
    }

    size_t Common::CountEvents(DurableStore::IDurableWriter::Event::Type type) {
        return (size_t)std::count_if(
            events.begin(),
            events.end(),
            [type](const EventInfo& event){
                return (event.type == type);
            }
        );
    }

    bool Common::AwaitEvents(
        DurableStore::IDurableWriter::Event::Type type,
        size_t numEvents,
        std::chrono::milliseconds timeout
    ) {
        std::unique_lock< decltype(mutex) > lock(mutex);
        if (CountEvents(type) >= numEvents) {
            return true;
        }
        eventsAwaited = std::promise< void >();
        auto eventsWereSent = eventsAwaited.get_future();
        typeOfEventsAwaited = type;
        numEventsAwaiting = numEvents;
        lock.unlock();
        const auto result = Await(eventsWereSent, timeout);
        lock.lock();
        numEventsAwaiting = 0;
        return result;
    }

    bool Common::NoEventsWithin(
        DurableStore::IDurableWriter::Event::Type type,
        size_t numEvents
    ) {
        return !AwaitEvents(type, numEvents, std::chrono::milliseconds(100));
    }

    void Common::WriterPublishedEvent(const DurableStore::IDurableWriter::Event& baseEvent) {
        EventInfo eventInfo;
        eventInfo.type = baseEvent.type;
        eventInfo.name = baseEvent.name;
        switch (baseEvent.type) {
            case DurableStore::IDurableWriter::Event::Type::Quarantined: {
                const auto& event = static_cast< const DurableStore::IDurableWriter::QuarantinedEvent& >(baseEvent);
                eventInfo.rescuePath = event.rescuePath;
            } break;

            case DurableStore::IDurableWriter::Event::Type::Flushed: {
                const auto& event = static_cast< const DurableStore::IDurableWriter::FlushedEvent& >(baseEvent);
                eventInfo.size = event.size;
            } break;

            case DurableStore::IDurableWriter::Event::Type::FlushFailed: {
                const auto& event = static_cast< const DurableStore::IDurableWriter::FlushFailedEvent& >(baseEvent);
                eventInfo.reason = event.reason;
            } break;

            default: break;
        }
        std::lock_guard< decltype(mutex) > lock(mutex);
        events.push_back(std::move(eventInfo));
        if (
            (numEventsAwaiting > 0)
            && (CountEvents(typeOfEventsAwaited) >= numEventsAwaiting)
        ) {
            numEventsAwaiting = 0;
            eventsAwaited.set_value();
        }
    }

    void Common::MobilizeWriter(const std::string& name) {
        writer.Mobilize(scheduler, configuration, name);
    }

    void Common::AdvanceTime(double amount) {
        mockTimeKeeper->Advance(amount);
        scheduler->WakeUp();
    }

    std::string Common::MakeRecord(
        const std::string& typeName,
        unsigned int schemaVersion,
        const Json::Value& payload
    ) {
        DurableStore::Record record;
        record.typeName = typeName;
        record.schemaVersion = schemaVersion;
        record.payload = payload;
        return record.Serialize();
    }

    void Common::WriteFile(
        const std::string& path,
        const std::string& contents
    ) {
        SystemAbstractions::File file(path);
        ASSERT_TRUE(file.OpenReadWrite());
        const SystemAbstractions::IFile::Buffer buffer(contents.begin(), contents.end());
        ASSERT_EQ(buffer.size(), file.Write(buffer, buffer.size(), 0));
        file.Close();
    }

    std::string Common::ReadFile(const std::string& path) {
        SystemAbstractions::File file(path);
        if (!file.Open()) {
            return "";
        }
        SystemAbstractions::IFile::Buffer buffer((size_t)file.GetSize());
        const auto amountRead = file.Read(buffer, buffer.size(), 0);
        file.Close();
        return std::string(buffer.begin(), buffer.begin() + amountRead);
    }

    bool Common::DecodeFile(
        const std::string& path,
        Json::Value& payload
    ) {
        DurableStore::Record record;
        if (record.Deserialize(ReadFile(path)) != DurableStore::Record::DecodeResult::Decoded) {
            return false;
        }
        payload = record.payload;
        return true;
    }

    size_t Common::CountFiles(const std::string& directory) {
        std::vector< std::string > list;
        SystemAbstractions::File::ListDirectory(directory, list);
        return list.size();
    }

    bool Common::DiagnosticMessageContains(const std::string& text) {
        std::lock_guard< decltype(mutex) > lock(mutex);
        return std::any_of(
            diagnosticMessages.begin(),
            diagnosticMessages.end(),
            [&text](const std::string& message){
                return (message.find(text) != std::string::npos);
            }
        );
    }

    void Common::SetUp() {
        testAreaPath = (
            SystemAbstractions::File::GetExeParentDirectory()
            + "/TestArea-DurableWriter"
        );
        (void)SystemAbstractions::File::DeleteDirectory(testAreaPath);
        ASSERT_TRUE(SystemAbstractions::File::CreateDirectory(testAreaPath));
        configuration.baseDirectory = testAreaPath;
        configuration.quietInterval = 0.5;
        scheduler->SetClock(mockTimeKeeper);
        writer.SetErrorReporter(mockErrorReporter);
        diagnosticsUnsubscribeDelegate = writer.SubscribeToDiagnostics(
            [this](
                std::string senderName,
                size_t level,
                std::string message
            ){
                std::lock_guard< decltype(mutex) > lock(mutex);
                diagnosticMessages.push_back(
                    StringExtensions::sprintf(
                        "%s[%zu]: %s",
                        senderName.c_str(),
                        level,
                        message.c_str()
                    )
                );
            },
            0
        );
        eventsUnsubscribeDelegate = writer.SubscribeToEvents(
            [this](
                const DurableStore::IDurableWriter::Event& baseEvent
            ){
                WriterPublishedEvent(baseEvent);
            }
        );
    }

    void Common::TearDown() {
        writer.Demobilize();
        eventsUnsubscribeDelegate();
        diagnosticsUnsubscribeDelegate();
        ASSERT_TRUE(SystemAbstractions::File::DeleteDirectory(testAreaPath));
    }

}
