#ifndef DURABLE_STORE_OBJECT_STORE_HPP
#define DURABLE_STORE_OBJECT_STORE_HPP

/**
 * @file ObjectStore.hpp
 *
 * This module declares the DurableStore::ObjectStore template.
 *
 * © 2020 by Richard Walters
 */

#include "Configuration.hpp"
#include "DurableWriter.hpp"
#include "IDurableWriter.hpp"
#include "ValueCodec.hpp"

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <Timekeeping/Scheduler.hpp>
#include <type_traits>

namespace DurableStore {

    /**
     * This binds one in-memory value, under one logical name, to a file
     * on disk.  The value is read once, when the store is initialized, and
     * written again some time after each call to Save.
     *
     * @tparam T
     *     This is the type of value kept by the store.  It must be
     *     default-constructible, since the stored copy is decoded into
     *     a default-constructed instance.
     */
    template< typename T > class ObjectStore {
        static_assert(
            std::is_default_constructible< T >::value,
            "ObjectStore value type must be default-constructible"
        );

        // Lifecycle Methods
    public:
        ~ObjectStore() noexcept {
            writer_->Demobilize();
        }
        ObjectStore(const ObjectStore&) = delete;
        ObjectStore(ObjectStore&&) = delete;
        ObjectStore& operator=(const ObjectStore&) = delete;
        ObjectStore& operator=(ObjectStore&&) = delete;

        // Public Methods
    public:
        /**
         * This is the constructor of the class.
         *
         * @param[in] scheduler
         *     This is used to time the quiet interval of save requests.
         *
         * @param[in] configuration
         *     This holds the configuration items for the store.
         *
         * @param[in] codec
         *     This is used to translate the value to and from its
         *     stored form.
         *
         * @param[in] writer
         *     This is the object which owns the value's file.  If nullptr,
         *     a DurableWriter is made.
         */
        ObjectStore(
            std::shared_ptr< Timekeeping::Scheduler > scheduler,
            const Configuration& configuration,
            const ValueCodec< T >& codec,
            std::shared_ptr< IDurableWriter > writer = nullptr
        )
            : scheduler_(scheduler)
            , configuration_(configuration)
            , codec_(codec)
            , writer_(writer)
        {
            if (writer_ == nullptr) {
                writer_ = std::make_shared< DurableWriter >();
            }
        }

        /**
         * Set the object to which read and write problems are reported.
         *
         * @param[in] errorReporter
         *     This is the object to which read and write problems are
         *     reported.
         */
        void SetErrorReporter(std::shared_ptr< IErrorReporter > errorReporter) {
            writer_->SetErrorReporter(errorReporter);
        }

        /**
         * Bind the given value to the store, using the codec's type name
         * as the name of the value, and read back any stored copy.
         *
         * @param[in] value
         *     This is the value to write on each call to Save.
         *
         * @return
         *     The stored copy of the value is returned, or nullptr if
         *     there is none that can be used.
         */
        std::shared_ptr< T > Init(std::shared_ptr< T > value) {
            return Init(value, codec_.typeName);
        }

        /**
         * Bind the given value to the store under the given name, and read
         * back any stored copy.  This does disk I/O on the calling thread.
         *
         * @param[in] value
         *     This is the value to write on each call to Save.
         *
         * @param[in] name
         *     This is the logical name of the value, which is also the name
         *     of its file.
         *
         * @return
         *     The stored copy of the value is returned, or nullptr if
         *     there is none that can be used.
         *
         * @throw std::logic_error
         *     This is thrown if the store was already initialized, or if
         *     another store in the process uses the same file.
         */
        std::shared_ptr< T > Init(
            std::shared_ptr< T > value,
            const std::string& name
        ) {
            std::unique_lock< decltype(mutex_) > lock(mutex_);
            if (
                binding_
                || (value_ != nullptr)
            ) {
                throw std::logic_error("ObjectStore for '" + name_ + "' is already initialized");
            }
            if (value == nullptr) {
                throw std::logic_error("ObjectStore for '" + name + "' given no value");
            }
            binding_ = true;
            lock.unlock();
            try {
                writer_->Mobilize(scheduler_, configuration_, name);
            } catch (const std::logic_error&) {
                lock.lock();
                binding_ = false;
                throw;
            }
            lock.lock();
            value_ = value;
            name_ = name;
            binding_ = false;
            lock.unlock();
            auto persisted = std::make_shared< T >();
            const auto outcome = writer_->Read(
                codec_.typeName,
                codec_.schemaVersion,
                [this, persisted](const Json::Value& payload){
                    return codec_.decode(payload, *persisted);
                }
            );
            if (outcome == IDurableWriter::ReadOutcome::Loaded) {
                return persisted;
            } else {
                return nullptr;
            }
        }

        /**
         * Request that the bound value be written to disk.  The value is
         * encoded now, but written later, on another thread.
         *
         * @throw std::logic_error
         *     This is thrown if the store has not been initialized.
         */
        void Save() {
            std::unique_lock< decltype(mutex_) > lock(mutex_);
            if (value_ == nullptr) {
                throw std::logic_error("ObjectStore::Save called before Init");
            }
            const auto value = value_;
            lock.unlock();
            writer_->Save(
                codec_.typeName,
                codec_.schemaVersion,
                codec_.encode(*value)
            );
        }

        /**
         * Delete the file for the given name, without making a backup.
         *
         * @param[in] name
         *     This is the logical name of the value whose file to delete.
         *
         * @throw std::logic_error
         *     This is thrown if the store has not been initialized.
         */
        void Remove(const std::string& name) {
            std::unique_lock< decltype(mutex_) > lock(mutex_);
            if (value_ == nullptr) {
                throw std::logic_error("ObjectStore::Remove called before Init");
            }
            lock.unlock();
            writer_->Remove(name);
        }

        /**
         * Write any pending save request now, and wait for it to complete.
         * Call this before shutting down, since pending writes are otherwise
         * lost.
         *
         * @return
         *     An indication of whether or not the last write attempted
         *     reached the disk is returned.
         */
        bool Flush() {
            return writer_->Flush();
        }

        /**
         * Return an indication of whether or not Init has been called.
         *
         * @return
         *     An indication of whether or not Init has been called
         *     is returned.
         */
        bool IsInitialized() const {
            std::lock_guard< decltype(mutex_) > lock(mutex_);
            return (value_ != nullptr);
        }

        /**
         * Return the logical name of the value.
         *
         * @return
         *     The logical name of the value is returned, or an empty string
         *     if the store has not been initialized.
         */
        std::string GetName() const {
            std::lock_guard< decltype(mutex_) > lock(mutex_);
            return name_;
        }

        // Private properties
    private:
        /**
         * This is used to synchronize access to the properties below.
         * It is never held while calling the writer.
         */
        mutable std::mutex mutex_;

        std::shared_ptr< Timekeeping::Scheduler > scheduler_;

        Configuration configuration_;

        ValueCodec< T > codec_;

        /**
         * This is the object which owns the value's file.
         */
        std::shared_ptr< IDurableWriter > writer_;

        /**
         * This is the value written on each call to Save.
         */
        std::shared_ptr< T > value_;

        std::string name_;

        /**
         * This flag is set while Init is binding the store to its file.
         */
        bool binding_ = false;
    };

}

#endif /* DURABLE_STORE_OBJECT_STORE_HPP */
