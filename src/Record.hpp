#ifndef DURABLE_STORE_RECORD_HPP
#define DURABLE_STORE_RECORD_HPP

/**
 * @file Record.hpp
 *
 * This module declares the DurableStore::Record structure.
 *
 * © 2020 by Richard Walters
 */

#include <Json/Value.hpp>
#include <string>

namespace DurableStore {

    /**
     * This is the container in which a value is stored on disk.  It carries
     * enough about the value's format to tell, before decoding the value,
     * whether the software reading it can understand it.
     */
    struct Record {
        // Types

        /**
         * These are the possible results of decoding a record.
         */
        enum class DecodeResult {
            /**
             * All fields of the record were decoded.
             */
            Decoded,

            /**
             * The serialization ended early, carried extra bytes, or held a
             * payload that isn't valid JSON.
             */
            Malformed,

            /**
             * The serialization was written in a newer container format than
             * this software supports.
             */
            UnsupportedFormat,
        };

        // Properties

        /**
         * This identifies the type of value stored in the record.
         */
        std::string typeName;

        /**
         * This is the version of the layout of the payload.
         */
        unsigned int schemaVersion = 0;

        /**
         * This is the encoded value.
         */
        Json::Value payload;

        // Methods

        /**
         * Set the properties of the record from the given serialization.
         *
         * @param[in] serialization
         *     This is the serialized form of the record.
         *
         * @return
         *     An indication of whether or not the record was decoded,
         *     and if not, why, is returned.
         */
        DecodeResult Deserialize(const std::string& serialization);

        /**
         * This method returns a string which can be used to construct a new
         * record with the exact same contents as this record.
         *
         * @return
         *     A string which can be used to construct a new record with the
         *     exact same contents as this record is returned.
         *
         * @retval ""
         *     This is returned if the record could not be serialized.
         */
        std::string Serialize() const;
    };

}

#endif /* DURABLE_STORE_RECORD_HPP */
