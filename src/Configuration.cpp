/**
 * @file Configuration.cpp
 *
 * This module contains the implementation of the
 * DurableStore::Configuration structure methods.
 *
 * © 2020 by Richard Walters
 */

#include "FileOperations.hpp"

#include <DurableStore/Configuration.hpp>
#include <Json/Value.hpp>

namespace DurableStore {

    Configuration::Configuration(const Json::Value& json) {
        if (json.GetType() != Json::Value::Type::Object) {
            return;
        }
        if (json.Has("baseDirectory")) {
            baseDirectory = (std::string)json["baseDirectory"];
        }
        if (json.Has("backupDirectoryName")) {
            backupDirectoryName = (std::string)json["backupDirectoryName"];
        }
        if (json.Has("quarantineDirectoryName")) {
            quarantineDirectoryName = (std::string)json["quarantineDirectoryName"];
        }
        if (json.Has("quietInterval")) {
            const auto& value = json["quietInterval"];
            if (value.GetType() == Json::Value::Type::Integer) {
                quietInterval = (double)(int)value;
            } else if (value.GetType() == Json::Value::Type::FloatingPoint) {
                quietInterval = (double)value;
            }
        }
    }

    Configuration::operator Json::Value() const {
        return Json::Object({
            {"baseDirectory", baseDirectory},
            {"backupDirectoryName", backupDirectoryName},
            {"quarantineDirectoryName", quarantineDirectoryName},
            {"quietInterval", quietInterval},
        });
    }

    std::string Configuration::GetBackupDirectory() const {
        return JoinPath(baseDirectory, backupDirectoryName);
    }

    std::string Configuration::GetQuarantineDirectory() const {
        return JoinPath(baseDirectory, quarantineDirectoryName);
    }

}
