#ifndef DURABLE_STORE_CONFIGURATION_HPP
#define DURABLE_STORE_CONFIGURATION_HPP

/**
 * @file Configuration.hpp
 *
 * This module declares the DurableStore::Configuration structure.
 *
 * © 2020 by Richard Walters
 */

#include <Json/Value.hpp>
#include <string>

namespace DurableStore {

    /**
     * This holds all configuration items for a durable writer.
     */
    struct Configuration {
        // Properties

        /**
         * This is the directory holding the primary file of each value.
         */
        std::string baseDirectory;

        /**
         * This is the name of the subdirectory of the base directory which
         * holds verified copies of primary files.
         */
        std::string backupDirectoryName = "backup";

        /**
         * This is the name of the subdirectory of the base directory into
         * which files that can no longer be decoded are moved.
         */
        std::string quarantineDirectoryName = "corrupted";

        /**
         * This is the amount of time, in seconds, that must pass without
         * another save request before a pending write is committed.
         */
        double quietInterval = 0.5;

        // Methods

        /**
         * This is the constructor of the structure.
         *
         * @param[in] json
         *     If not null, this holds configuration items to set, keyed by
         *     property name.  Missing items keep their default values.
         */
        Configuration(const Json::Value& json = nullptr);

        /**
         * This method returns a JSON value which can be used to construct a
         * new configuration with the exact same contents as this one.
         *
         * @return
         *     A JSON value which can be used to construct a new configuration
         *     with the exact same contents as this one is returned.
         */
        operator Json::Value() const;

        /**
         * Return the path of the backup directory.
         *
         * @return
         *     The path of the backup directory is returned.
         */
        std::string GetBackupDirectory() const;

        /**
         * Return the path of the quarantine directory.
         *
         * @return
         *     The path of the quarantine directory is returned.
         */
        std::string GetQuarantineDirectory() const;
    };

}

#endif /* DURABLE_STORE_CONFIGURATION_HPP */
