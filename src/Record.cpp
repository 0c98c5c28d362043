/**
 * @file Record.cpp
 *
 * This module contains the implementation of the DurableStore::Record
 * structure.
 *
 * © 2020 by Richard Walters
 */

#include "Record.hpp"

#include <Json/Value.hpp>
#include <Serialization/SerializedInteger.hpp>
#include <Serialization/SerializedString.hpp>
#include <SystemAbstractions/StringFile.hpp>

namespace {

    constexpr int CURRENT_SERIALIZATION_VERSION = 1;

}

namespace DurableStore {

    auto Record::Deserialize(const std::string& serialization) -> DecodeResult {
        SystemAbstractions::StringFile buffer(serialization);
        Serialization::SerializedInteger intField;
        if (!intField.Deserialize(&buffer)) {
            return DecodeResult::Malformed;
        }
        const auto version = (int)intField;
        if (version < 1) {
            return DecodeResult::Malformed;
        }
        if (version > CURRENT_SERIALIZATION_VERSION) {
            return DecodeResult::UnsupportedFormat;
        }
        Serialization::SerializedString stringField;
        if (!stringField.Deserialize(&buffer)) {
            return DecodeResult::Malformed;
        }
        typeName = (std::string)stringField;
        if (!intField.Deserialize(&buffer)) {
            return DecodeResult::Malformed;
        }
        if ((int)intField < 0) {
            return DecodeResult::Malformed;
        }
        schemaVersion = (unsigned int)(int)intField;
        if (!stringField.Deserialize(&buffer)) {
            return DecodeResult::Malformed;
        }
        if (buffer.GetPosition() != buffer.GetSize()) {
            return DecodeResult::Malformed;
        }
        payload = Json::Value::FromEncoding(stringField);
        if (payload.GetType() == Json::Value::Type::Invalid) {
            return DecodeResult::Malformed;
        }
        return DecodeResult::Decoded;
    }

    std::string Record::Serialize() const {
        SystemAbstractions::StringFile buffer;
        Serialization::SerializedInteger intField(CURRENT_SERIALIZATION_VERSION);
        if (!intField.Serialize(&buffer)) {
            return "";
        }
        Serialization::SerializedString stringField(typeName);
        if (!stringField.Serialize(&buffer)) {
            return "";
        }
        intField = (int)schemaVersion;
        if (!intField.Serialize(&buffer)) {
            return "";
        }
        stringField = payload.ToEncoding();
        if (!stringField.Serialize(&buffer)) {
            return "";
        }
        return buffer;
    }

}
