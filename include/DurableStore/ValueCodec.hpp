#ifndef DURABLE_STORE_VALUE_CODEC_HPP
#define DURABLE_STORE_VALUE_CODEC_HPP

/**
 * @file ValueCodec.hpp
 *
 * This module declares the DurableStore::ValueCodec template.
 *
 * © 2020 by Richard Walters
 */

#include <functional>
#include <Json/Value.hpp>
#include <string>

namespace DurableStore {

    /**
     * This holds the functions used to translate values of one type to and
     * from the JSON payload stored on disk, along with the identity of the
     * format they produce.
     *
     * @tparam T
     *     This is the type of value translated by the codec.
     */
    template< typename T > struct ValueCodec {
        // Types

        /**
         * Declare the type of function used to encode a value.
         *
         * @param[in] value
         *     This is the value to encode.
         *
         * @return
         *     The encoded value is returned.
         */
        using Encoder = std::function< Json::Value(const T& value) >;

        /**
         * Declare the type of function used to decode a value.
         *
         * @param[in] payload
         *     This is the encoded value.
         *
         * @param[out] value
         *     This is where to store the decoded value.  When used by an
         *     ObjectStore, this is a default-constructed instance, so T
         *     must be default-constructible.
         *
         * @return
         *     An indication of whether or not the payload could be decoded
         *     is returned.  Returning false marks the stored file as
         *     incompatible with the current format.
         */
        using Decoder = std::function< bool(const Json::Value& payload, T& value) >;

        // Properties

        /**
         * This identifies the type of value stored.  It is also the default
         * logical name of the value.
         */
        std::string typeName;

        /**
         * This is the version of the payload layout produced by the encoder.
         * Files written with any other version are treated as incompatible.
         */
        unsigned int schemaVersion = 1;

        Encoder encode;

        Decoder decode;
    };

}

#endif /* DURABLE_STORE_VALUE_CODEC_HPP */
