/**
 * @file FileOperationsTests.cpp
 *
 * This module contains the unit tests of the free functions used by
 * the library to work with files.
 *
 * © 2020 by Richard Walters
 */

#include "../../src/FileOperations.hpp"

#include <gtest/gtest.h>
#include <string>
#include <SystemAbstractions/File.hpp>

namespace {

    /**
     * This is the test fixture for these tests, providing common
     * setup and teardown for each test.
     */
    struct FileOperationsTests
        : public ::testing::Test
    {
        // Properties

        std::string testAreaPath;

        // ::testing::Test

        virtual void SetUp() override {
            testAreaPath = (
                SystemAbstractions::File::GetExeParentDirectory()
                + "/TestArea-FileOperations"
            );
            (void)SystemAbstractions::File::DeleteDirectory(testAreaPath);
            ASSERT_TRUE(SystemAbstractions::File::CreateDirectory(testAreaPath));
        }

        virtual void TearDown() override {
            ASSERT_TRUE(SystemAbstractions::File::DeleteDirectory(testAreaPath));
        }
    };

}

TEST_F(FileOperationsTests, JoinPath) {
    EXPECT_EQ("a/b", DurableStore::JoinPath("a", "b"));
    EXPECT_EQ("a/b", DurableStore::JoinPath("a/", "b"));
    EXPECT_EQ("b", DurableStore::JoinPath("", "b"));
}

TEST_F(FileOperationsTests, Write_Atomically_Then_Read) {
    // Arrange
    const auto path = testAreaPath + "/Prefs";
    std::string failureReason;

    // Act
    const auto written = DurableStore::WriteFileAtomically(path, "Hello, World!", failureReason);
    std::string contents;
    const auto read = DurableStore::ReadFile(path, contents, failureReason);

    // Assert
    EXPECT_TRUE(written);
    EXPECT_TRUE(read);
    EXPECT_EQ("Hello, World!", contents);
    EXPECT_FALSE(SystemAbstractions::File(DurableStore::GetTemporaryPath(path)).IsExisting());
}

TEST_F(FileOperationsTests, Write_Atomically_Replaces_Whole_File) {
    // Arrange
    const auto path = testAreaPath + "/Prefs";
    std::string failureReason;
    ASSERT_TRUE(DurableStore::WriteFileAtomically(path, "a much longer old value", failureReason));

    // Act
    const auto written = DurableStore::WriteFileAtomically(path, "short", failureReason);

    // Assert
    EXPECT_TRUE(written);
    std::string contents;
    ASSERT_TRUE(DurableStore::ReadFile(path, contents, failureReason));
    EXPECT_EQ("short", contents);
}

TEST_F(FileOperationsTests, Write_Atomically_Fails_Into_Missing_Directory) {
    // Arrange
    const auto path = testAreaPath + "/nowhere/Prefs";
    std::string failureReason;

    // Act
    const auto written = DurableStore::WriteFileAtomically(path, "Hello", failureReason);

    // Assert
    EXPECT_FALSE(written);
    EXPECT_FALSE(failureReason.empty());
    EXPECT_FALSE(SystemAbstractions::File(path).IsExisting());
}

TEST_F(FileOperationsTests, Read_Missing_File_Fails) {
    // Arrange
    std::string contents;
    std::string failureReason;

    // Act
    const auto read = DurableStore::ReadFile(testAreaPath + "/Prefs", contents, failureReason);

    // Assert
    EXPECT_FALSE(read);
    EXPECT_FALSE(failureReason.empty());
}

TEST_F(FileOperationsTests, Ensure_Directory) {
    // Arrange
    const auto directory = testAreaPath + "/backup";

    // Act
    const auto firstResult = DurableStore::EnsureDirectory(directory);
    const auto secondResult = DurableStore::EnsureDirectory(directory);

    // Assert
    EXPECT_TRUE(firstResult);
    EXPECT_TRUE(secondResult);
    EXPECT_TRUE(SystemAbstractions::File(directory).IsDirectory());
}

TEST_F(FileOperationsTests, Rescue_Paths_Are_Distinct) {
    // Arrange
    const time_t now = 1577934245; // 2020-01-02 03:04:05 UTC
    std::string failureReason;

    // Act
    const auto firstPath = DurableStore::MakeRescuePath(testAreaPath, "Prefs", now);
    ASSERT_TRUE(DurableStore::WriteFileAtomically(firstPath, "1", failureReason));
    const auto secondPath = DurableStore::MakeRescuePath(testAreaPath, "Prefs", now);
    ASSERT_TRUE(DurableStore::WriteFileAtomically(secondPath, "2", failureReason));
    const auto thirdPath = DurableStore::MakeRescuePath(testAreaPath, "Prefs", now);

    // Assert
    EXPECT_EQ(testAreaPath + "/Prefs-20200102-030405", firstPath);
    EXPECT_EQ(testAreaPath + "/Prefs-20200102-030405-1", secondPath);
    EXPECT_EQ(testAreaPath + "/Prefs-20200102-030405-2", thirdPath);
}
