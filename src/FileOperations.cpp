/**
 * @file FileOperations.cpp
 *
 * This module contains the implementation of free functions used by other
 * parts of the library implementation to work with files.
 *
 * © 2020 by Richard Walters
 */

#include "FileOperations.hpp"

#include <stddef.h>
#include <string>
#include <SystemAbstractions/File.hpp>
#include <time.h>

namespace {

    /**
     * This is appended to the path of a file to form the path of the
     * temporary file used when replacing it.
     */
    const std::string TEMPORARY_FILE_SUFFIX = ".tmp";

    /**
     * Format the given calendar time, in UTC, in a form suitable for
     * use in a file name.
     *
     * @param[in] now
     *     This is the calendar time to format.
     *
     * @return
     *     The formatted time is returned.
     */
    std::string FormatTimestamp(time_t now) {
        struct tm brokenDownTime;
#ifdef _WIN32
        (void)gmtime_s(&brokenDownTime, &now);
#else
        (void)gmtime_r(&now, &brokenDownTime);
#endif
        char buffer[20];
        const auto length = strftime(
            buffer,
            sizeof(buffer),
            "%Y%m%d-%H%M%S",
            &brokenDownTime
        );
        return std::string(buffer, length);
    }

}

namespace DurableStore {

    std::string JoinPath(
        const std::string& directory,
        const std::string& name
    ) {
        if (
            directory.empty()
            || (directory.back() == '/')
        ) {
            return directory + name;
        }
        return directory + "/" + name;
    }

    bool EnsureDirectory(const std::string& directory) {
        SystemAbstractions::File file(directory);
        if (file.IsDirectory()) {
            return true;
        }
        return SystemAbstractions::File::CreateDirectory(directory);
    }

    bool ReadFile(
        const std::string& path,
        std::string& contents,
        std::string& failureReason
    ) {
        SystemAbstractions::File file(path);
        if (!file.Open()) {
            failureReason = "unable to open '" + path + "' for reading";
            return false;
        }
        SystemAbstractions::IFile::Buffer buffer((size_t)file.GetSize());
        const auto amountRead = file.Read(buffer, buffer.size(), 0);
        file.Close();
        if (amountRead != buffer.size()) {
            failureReason = (
                "read only " + std::to_string(amountRead)
                + " of " + std::to_string(buffer.size())
                + " bytes from '" + path + "'"
            );
            return false;
        }
        contents.assign(buffer.begin(), buffer.end());
        return true;
    }

    bool WriteFileAtomically(
        const std::string& path,
        const std::string& contents,
        std::string& failureReason
    ) {
        SystemAbstractions::File temporaryFile(GetTemporaryPath(path));
        temporaryFile.Destroy();
        if (!temporaryFile.OpenReadWrite()) {
            failureReason = "unable to create '" + temporaryFile.GetPath() + "'";
            return false;
        }
        const SystemAbstractions::IFile::Buffer buffer(contents.begin(), contents.end());
        const auto amountWritten = temporaryFile.Write(buffer, buffer.size(), 0);
        temporaryFile.Close();
        if (amountWritten != buffer.size()) {
            failureReason = (
                "wrote only " + std::to_string(amountWritten)
                + " of " + std::to_string(buffer.size())
                + " bytes to '" + temporaryFile.GetPath() + "'"
            );
            temporaryFile.Destroy();
            return false;
        }
        if (!temporaryFile.Move(path)) {
            failureReason = "unable to replace '" + path + "'";
            temporaryFile.Destroy();
            return false;
        }
        return true;
    }

    std::string GetTemporaryPath(const std::string& path) {
        return path + TEMPORARY_FILE_SUFFIX;
    }

    std::string MakeRescuePath(
        const std::string& directory,
        const std::string& name,
        time_t now
    ) {
        const auto basePath = JoinPath(directory, name + "-" + FormatTimestamp(now));
        auto rescuePath = basePath;
        for (size_t suffix = 1; SystemAbstractions::File(rescuePath).IsExisting(); ++suffix) {
            rescuePath = basePath + "-" + std::to_string(suffix);
        }
        return rescuePath;
    }

}
