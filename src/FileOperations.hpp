#ifndef DURABLE_STORE_FILE_OPERATIONS_HPP
#define DURABLE_STORE_FILE_OPERATIONS_HPP

/**
 * @file FileOperations.hpp
 *
 * This module contains the declaration of free functions used by other parts
 * of the library implementation to work with files.
 *
 * © 2020 by Richard Walters
 */

#include <string>
#include <time.h>

namespace DurableStore {

    /**
     * Return the path of the given entry within the given directory.
     *
     * @param[in] directory
     *     This is the path of the directory.
     *
     * @param[in] name
     *     This is the name of the entry within the directory.
     *
     * @return
     *     The path of the entry is returned.
     */
    std::string JoinPath(
        const std::string& directory,
        const std::string& name
    );

    /**
     * Make sure the given directory exists, creating it and any missing
     * parent directories if needed.
     *
     * @param[in] directory
     *     This is the path of the directory.
     *
     * @return
     *     An indication of whether or not the directory exists is returned.
     */
    bool EnsureDirectory(const std::string& directory);

    /**
     * Read the entire contents of the given file.
     *
     * @param[in] path
     *     This is the path of the file to read.
     *
     * @param[out] contents
     *     This is where to store the contents of the file.
     *
     * @param[out] failureReason
     *     If the file could not be read, this is where to store a
     *     description of what went wrong.
     *
     * @return
     *     An indication of whether or not the file was read is returned.
     */
    bool ReadFile(
        const std::string& path,
        std::string& contents,
        std::string& failureReason
    );

    /**
     * Replace the contents of the given file, by writing the new contents
     * to a temporary file next to it and then renaming the temporary file
     * over it.  Readers of the file see either the old contents or the
     * new contents, never a mix.
     *
     * @param[in] path
     *     This is the path of the file to write.
     *
     * @param[in] contents
     *     These are the new contents of the file.
     *
     * @param[out] failureReason
     *     If the file could not be written, this is where to store a
     *     description of what went wrong.
     *
     * @return
     *     An indication of whether or not the file was written is returned.
     */
    bool WriteFileAtomically(
        const std::string& path,
        const std::string& contents,
        std::string& failureReason
    );

    /**
     * Return the path of the temporary file used when replacing the given
     * file.
     *
     * @param[in] path
     *     This is the path of the file being replaced.
     *
     * @return
     *     The path of the temporary file is returned.
     */
    std::string GetTemporaryPath(const std::string& path);

    /**
     * Pick a path in the given directory, not already in use, to which
     * to move a file that can no longer be decoded.  The path is formed
     * from the given name and time, with a counter added if needed to
     * avoid any existing file.
     *
     * @param[in] directory
     *     This is the path of the quarantine directory.
     *
     * @param[in] name
     *     This is the logical name of the value in the file.
     *
     * @param[in] now
     *     This is the current calendar time.
     *
     * @return
     *     The path to which to move the file is returned.
     */
    std::string MakeRescuePath(
        const std::string& directory,
        const std::string& name,
        time_t now
    );

}

#endif /* DURABLE_STORE_FILE_OPERATIONS_HPP */
