/**
 * @file DurableWriter.cpp
 *
 * This module contains the implementation of the DurableStore::DurableWriter
 * class.
 *
 * © 2020 by Richard Walters
 */

#include "DurableWriterImpl.hpp"
#include "FileOperations.hpp"
#include "Record.hpp"
#include "Utilities.hpp"

#include <DurableStore/DurableWriter.hpp>
#include <future>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <SystemAbstractions/DiagnosticsSender.hpp>
#include <SystemAbstractions/File.hpp>
#include <thread>
#include <vector>

namespace {

    /**
     * This keeps track of the primary files to which writers in the
     * process are bound, so that no two writers share one file.
     */
    struct BoundPaths {
        // Properties

        /**
         * This is used to synchronize access to the paths.
         */
        std::mutex mutex;

        /**
         * These are the paths of the primary files to which writers
         * are bound.
         */
        std::set< std::string > paths;

        // Methods

        /**
         * Record that a writer is bound to the given path.
         *
         * @param[in] path
         *     This is the path of the primary file of the writer.
         *
         * @return
         *     An indication of whether or not the path was free is returned.
         */
        bool Claim(const std::string& path) {
            std::lock_guard< decltype(mutex) > lock(mutex);
            return paths.insert(path).second;
        }

        /**
         * Record that a writer is no longer bound to the given path.
         *
         * @param[in] path
         *     This is the path of the primary file of the writer.
         */
        void Release(const std::string& path) {
            std::lock_guard< decltype(mutex) > lock(mutex);
            (void)paths.erase(path);
        }
    } BOUND_PATHS;

    /**
     * Check that the given name may be used as the name of a file
     * in the base directory.
     *
     * @param[in] name
     *     This is the name to check.
     *
     * @throw std::logic_error
     *     This is thrown if the name is empty or would refer to a
     *     file outside the base directory.
     */
    void CheckName(const std::string& name) {
        if (
            name.empty()
            || (name == ".")
            || (name == "..")
            || (name.find_first_of("/\\") != std::string::npos)
        ) {
            throw std::logic_error("'" + name + "' is not a valid value name");
        }
    }

}

namespace DurableStore {

    DurableWriter::~DurableWriter() noexcept {
        if (impl_ != nullptr) {
            Demobilize();
        }
    }
    DurableWriter::DurableWriter(DurableWriter&&) noexcept = default;
    DurableWriter& DurableWriter::operator=(DurableWriter&&) noexcept = default;

    DurableWriter::DurableWriter()
        : impl_(new Impl())
    {
    }

    SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate DurableWriter::SubscribeToDiagnostics(
        SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
        size_t minLevel
    ) {
        return impl_->diagnosticsSender.SubscribeToDiagnostics(delegate, minLevel);
    }

    void DurableWriter::WaitForAtLeastOneWorkerLoop() {
        std::unique_lock< decltype(impl_->mutex) > lock(impl_->mutex);
        if (!impl_->mobilized) {
            return;
        }
        impl_->workerLoopCompletion = std::make_shared< std::promise< void > >();
        auto workerLoopWasCompleted = impl_->workerLoopCompletion->get_future();
        impl_->workerWakeCondition.notify_one();
        lock.unlock();
        workerLoopWasCompleted.wait();
    }

    std::string DurableWriter::GetPrimaryPath() const {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->primaryPath;
    }

    std::string DurableWriter::GetBackupPath() const {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->backupPath;
    }

    std::string DurableWriter::GetQuarantineDirectory() const {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->configuration.GetQuarantineDirectory();
    }

    size_t DurableWriter::GetFlushCount() const {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->flushCount;
    }

    auto DurableWriter::SubscribeToEvents(EventDelegate eventDelegate) -> EventsUnsubscribeDelegate {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        const auto eventSubscriberId = impl_->nextEventSubscriberId++;
        impl_->eventSubscribers[eventSubscriberId] = eventDelegate;
        const std::weak_ptr< Impl > implWeak = impl_;
        return [implWeak, eventSubscriberId]{
            const auto impl = implWeak.lock();
            if (impl == nullptr) {
                return;
            }
            std::lock_guard< decltype(impl->mutex) > lock(impl->mutex);
            (void)impl->eventSubscribers.erase(eventSubscriberId);
        };
    }

    void DurableWriter::SetErrorReporter(std::shared_ptr< IErrorReporter > errorReporter) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        impl_->errorReporter = errorReporter;
    }

    void DurableWriter::Mobilize(
        std::shared_ptr< Timekeeping::Scheduler > scheduler,
        const Configuration& configuration,
        const std::string& name
    ) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        if (impl_->mobilized) {
            return;
        }
        if (
            (scheduler == nullptr)
            || (scheduler->GetClock() == nullptr)
        ) {
            throw std::logic_error("DurableWriter needs a scheduler with a clock");
        }
        if (configuration.baseDirectory.empty()) {
            throw std::logic_error("DurableWriter needs a base directory");
        }
        if (!(configuration.quietInterval > 0.0)) {
            throw std::logic_error("DurableWriter needs a positive quiet interval");
        }
        CheckName(name);
        const auto primaryPath = JoinPath(configuration.baseDirectory, name);
        if (!BOUND_PATHS.Claim(primaryPath)) {
            throw std::logic_error(
                "another DurableWriter is already bound to '" + primaryPath + "'"
            );
        }
        ++impl_->generation;
        impl_->mobilized = true;
        impl_->scheduler = scheduler;
        impl_->configuration = configuration;
        impl_->name = name;
        impl_->primaryPath = primaryPath;
        impl_->backupPath = JoinPath(configuration.GetBackupDirectory(), name);
        impl_->state = State::Unwritten;
        impl_->pendingWrite = nullptr;
        impl_->saveCount = 0;
        impl_->settledSaveCount = 0;
        impl_->flushDue = false;
        impl_->lastFlushSucceeded = true;
        impl_->flushCount = 0;
        if (!EnsureDirectory(configuration.baseDirectory)) {
            impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                "unable to create base directory '%s'",
                configuration.baseDirectory.c_str()
            );
        }
        SystemAbstractions::File temporaryFile(GetTemporaryPath(primaryPath));
        if (temporaryFile.IsExisting()) {
            impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                1,
                "%s: deleting '%s' left over from an earlier write",
                name.c_str(),
                temporaryFile.GetPath().c_str()
            );
            temporaryFile.Destroy();
        }
        impl_->stopWorker = false;
        impl_->worker = std::thread(&Impl::Worker, impl_.get());
    }

    void DurableWriter::Demobilize() {
        std::unique_lock< decltype(impl_->mutex) > lock(impl_->mutex);
        if (!impl_->mobilized) {
            return;
        }
        impl_->mobilized = false;
        impl_->CancelFlushTimer();
        if (impl_->pendingWrite != nullptr) {
            impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                "%s: discarding write not yet committed",
                impl_->name.c_str()
            );
            impl_->pendingWrite = nullptr;
        }
        impl_->flushDue = false;
        impl_->scheduler = nullptr;
        impl_->flushCompletedCondition.notify_all();
        auto worker = std::move(impl_->worker);
        if (worker.joinable()) {
            impl_->stopWorker = true;
            impl_->workerWakeCondition.notify_one();
            lock.unlock();
            worker.join();
            lock.lock();
        }
        BOUND_PATHS.Release(impl_->primaryPath);
    }

    auto DurableWriter::Read(
        const std::string& typeName,
        unsigned int schemaVersion,
        PayloadDecoder decoder
    ) -> ReadOutcome {
        std::unique_lock< decltype(impl_->mutex) > lock(impl_->mutex);
        if (!impl_->mobilized) {
            throw std::logic_error("DurableWriter::Read called before Mobilize");
        }
        std::vector< StoreError > errors;
        const auto outcome = impl_->ReadPrimaryFile(
            typeName,
            schemaVersion,
            decoder,
            errors
        );
        if (impl_->pendingWrite != nullptr) {
            impl_->state = State::Dirty;
        }
        const auto errorReporter = impl_->errorReporter;
        lock.unlock();
        ReportErrors(errorReporter, errors);
        return outcome;
    }

    void DurableWriter::Save(
        const std::string& typeName,
        unsigned int schemaVersion,
        const Json::Value& payload
    ) {
        Record record;
        record.typeName = typeName;
        record.schemaVersion = schemaVersion;
        record.payload = payload;
        const auto serialization = std::make_shared< const std::string >(record.Serialize());
        std::unique_lock< decltype(impl_->mutex) > lock(impl_->mutex);
        if (!impl_->mobilized) {
            throw std::logic_error("DurableWriter::Save called before Mobilize");
        }
        if (serialization->empty()) {
            std::vector< StoreError > errors;
            impl_->QueueError(
                errors,
                ErrorType::WriteFailure,
                impl_->primaryPath,
                "unable to serialize value"
            );
            const auto errorReporter = impl_->errorReporter;
            lock.unlock();
            ReportErrors(errorReporter, errors);
            return;
        }
        impl_->pendingWrite = serialization;
        ++impl_->saveCount;
        impl_->state = State::Dirty;
        impl_->ResetFlushTimer();
    }

    bool DurableWriter::Flush() {
        std::unique_lock< decltype(impl_->mutex) > lock(impl_->mutex);
        if (!impl_->mobilized) {
            return impl_->lastFlushSucceeded;
        }
        if (impl_->pendingWrite != nullptr) {
            impl_->CancelFlushTimer();
            impl_->flushDue = true;
            impl_->workerWakeCondition.notify_one();
        }
        const auto saveCount = impl_->saveCount;
        impl_->flushCompletedCondition.wait(
            lock,
            [this, saveCount]{
                return (
                    !impl_->mobilized
                    || (
                        (impl_->settledSaveCount >= saveCount)
                        && !impl_->reportingFlushErrors
                    )
                );
            }
        );
        return impl_->lastFlushSucceeded;
    }

    void DurableWriter::Remove(const std::string& name) {
        std::unique_lock< decltype(impl_->mutex) > lock(impl_->mutex);
        if (!impl_->mobilized) {
            throw std::logic_error("DurableWriter::Remove called before Mobilize");
        }
        CheckName(name);
        const auto path = JoinPath(impl_->configuration.baseDirectory, name);
        if (name == impl_->name) {
            impl_->CancelFlushTimer();
            impl_->pendingWrite = nullptr;
            impl_->settledSaveCount = impl_->saveCount;
            impl_->flushDue = false;
            impl_->flushCompletedCondition.wait(
                lock,
                [this]{
                    return !impl_->flushInProgress;
                }
            );
            impl_->state = State::Unwritten;
            impl_->flushCompletedCondition.notify_all();
        }
        SystemAbstractions::File file(path);
        if (!file.IsExisting()) {
            return;
        }
        file.Destroy();
        std::vector< StoreError > errors;
        if (SystemAbstractions::File(path).IsExisting()) {
            impl_->QueueError(
                errors,
                ErrorType::TransientIOFailure,
                path,
                "unable to delete '" + path + "'"
            );
        } else {
            impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                3,
                "Removed %s",
                path.c_str()
            );
            auto event = std::make_shared< Event >(Event::Type::Removed);
            event->name = name;
            impl_->AddToEventQueue(std::move(event));
        }
        const auto errorReporter = impl_->errorReporter;
        lock.unlock();
        ReportErrors(errorReporter, errors);
    }

    auto DurableWriter::GetState() -> State {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->state;
    }

}
