#include <gtest/gtest.h>

#include <string>

#include "bkg/security/path_guard.hpp"

using bkg::security::NormalizedPath;
using bkg::security::PathGuard;

// =============================================================================
// validate()
// =============================================================================

TEST(PathGuardTest, RejectsEmptyInputs) {
    EXPECT_FALSE(PathGuard::validate("", "/path/file.db"));
    EXPECT_FALSE(PathGuard::validate("/backup", ""));
    EXPECT_FALSE(PathGuard::validate("", ""));
}

TEST(PathGuardTest, AcceptsFileInsideBackupDir) {
    EXPECT_TRUE(PathGuard::validate("/backup", "/backup/my-backup.db"));
    EXPECT_TRUE(PathGuard::validate("/backup/", "/backup/2024-01-01.db"));
}

TEST(PathGuardTest, AcceptsNestedSubdirectory) {
    EXPECT_TRUE(PathGuard::validate("/backup", "/backup/daily/2024/x.db"));
}

TEST(PathGuardTest, AcceptsWindowsPaths) {
    EXPECT_TRUE(PathGuard::validate("C:\\Users\\test\\backup",
                                    "C:\\Users\\test\\backup\\file.db"));
    EXPECT_TRUE(PathGuard::validate("c:/Users/test/backup",
                                    "C:\\Users\\test\\backup\\file.db"));
}

TEST(PathGuardTest, AcceptsMixedSeparators) {
    EXPECT_TRUE(PathGuard::validate("/srv\\backup", "\\srv/backup\\file.db"));
}

TEST(PathGuardTest, RejectsTraversal) {
    EXPECT_FALSE(PathGuard::validate("/backup", "/backup/../etc/passwd.db"));
    EXPECT_FALSE(PathGuard::validate("/backup", "/backup/sub/../../etc/test.db"));
    EXPECT_FALSE(PathGuard::validate("C:\\backup", "C:\\backup\\..\\Windows\\x.db"));
}

TEST(PathGuardTest, AcceptsTraversalThatStaysInside) {
    EXPECT_TRUE(PathGuard::validate("/backup", "/backup/sub/../file.db"));
    EXPECT_TRUE(PathGuard::validate("/backup", "/backup/./sub/./file.db"));
}

TEST(PathGuardTest, RejectsClimbAboveRoot) {
    EXPECT_FALSE(PathGuard::validate("/backup", "/../backup/file.db"));
    EXPECT_FALSE(PathGuard::validate("backup", "../backup/file.db"));
}

TEST(PathGuardTest, RejectsPathsOutsideBackupDir) {
    EXPECT_FALSE(PathGuard::validate("/backup", "/other/path/file.db"));
    EXPECT_FALSE(PathGuard::validate("/backup/dir", "/backup/file.db"));
}

TEST(PathGuardTest, RejectsSiblingWithSharedPrefix) {
    EXPECT_FALSE(PathGuard::validate("/backup", "/backupEvil/file.db"));
    EXPECT_FALSE(PathGuard::validate("/backup", "/backup-old/file.db"));
}

TEST(PathGuardTest, RejectsBaseDirectoryItself) {
    EXPECT_FALSE(PathGuard::validate("/backup", "/backup"));
    EXPECT_FALSE(PathGuard::validate("/backup", "/backup/"));
    EXPECT_FALSE(PathGuard::validate("/backup.db", "/backup.db"));
}

TEST(PathGuardTest, RejectsRootMismatch) {
    EXPECT_FALSE(PathGuard::validate("/backup", "backup/file.db"));
    EXPECT_FALSE(PathGuard::validate("C:\\backup", "D:\\backup\\file.db"));
    EXPECT_FALSE(PathGuard::validate("C:\\backup", "C:backup\\file.db"));
}

TEST(PathGuardTest, RejectsOtherExtensions) {
    EXPECT_FALSE(PathGuard::validate("/backup", "/backup/file.txt"));
    EXPECT_FALSE(PathGuard::validate("/backup", "/backup/file.sql"));
    EXPECT_FALSE(PathGuard::validate("/backup", "/backup/file.json"));
    EXPECT_FALSE(PathGuard::validate("/backup", "/backup/file.db.bak"));
    EXPECT_FALSE(PathGuard::validate("/backup", "/backup/file"));
}

TEST(PathGuardTest, ExtensionIsCaseSensitive) {
    EXPECT_FALSE(PathGuard::validate("/backup", "/backup/file.DB"));
    EXPECT_FALSE(PathGuard::validate("/backup", "/backup/file.Db"));
}

TEST(PathGuardTest, RejectsBareExtensionFileName) {
    EXPECT_FALSE(PathGuard::validate("/backup", "/backup/.db"));
}

TEST(PathGuardTest, DirectoryComparisonIsCaseInsensitive) {
    EXPECT_TRUE(PathGuard::validate("/Backup", "/backup/file.db"));
    EXPECT_TRUE(PathGuard::validate("/backup", "/BACKUP/file.db"));
}

TEST(PathGuardTest, RejectsEmbeddedNul) {
    std::string candidate("/backup/evil.db\0.txt", 20);
    EXPECT_FALSE(PathGuard::validate("/backup", candidate));
}

TEST(PathGuardTest, CustomExtension) {
    EXPECT_TRUE(PathGuard::validate("/exports", "/exports/report.csv", ".csv"));
    EXPECT_FALSE(PathGuard::validate("/exports", "/exports/report.db", ".csv"));
    EXPECT_FALSE(PathGuard::validate("/exports", "/exports/report.csv", ""));
}

// =============================================================================
// normalize()
// =============================================================================

TEST(PathGuardNormalizeTest, PosixAbsolute) {
    auto p = PathGuard::normalize("/a/./b//c/../d");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->root, "/");
    EXPECT_TRUE(p->isAbsolute());
    EXPECT_EQ(p->str(), "/a/b/d");
}

TEST(PathGuardNormalizeTest, DriveRoots) {
    auto abs = PathGuard::normalize("D:\\Data\\x");
    ASSERT_TRUE(abs.has_value());
    EXPECT_EQ(abs->root, "d:/");
    EXPECT_TRUE(abs->isAbsolute());
    EXPECT_EQ(abs->str(), "d:/Data/x");

    auto rel = PathGuard::normalize("D:x");
    ASSERT_TRUE(rel.has_value());
    EXPECT_EQ(rel->root, "d:");
    EXPECT_FALSE(rel->isAbsolute());
}

TEST(PathGuardNormalizeTest, UncRoot) {
    auto p = PathGuard::normalize("\\\\server\\share\\f.db");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->root, "//");
    ASSERT_EQ(p->segments.size(), 3u);
    EXPECT_EQ(p->segments[0], "server");
}

TEST(PathGuardNormalizeTest, RelativeCollapses) {
    auto p = PathGuard::normalize("a/b/../../c");
    ASSERT_TRUE(p.has_value());
    EXPECT_TRUE(p->root.empty());
    EXPECT_EQ(p->str(), "c");
}

TEST(PathGuardNormalizeTest, EscapeIsUnresolvable) {
    EXPECT_FALSE(PathGuard::normalize("/..").has_value());
    EXPECT_FALSE(PathGuard::normalize("a/../..").has_value());
    EXPECT_FALSE(PathGuard::normalize("C:\\..\\x").has_value());
}

TEST(PathGuardNormalizeTest, ExtensionOf) {
    EXPECT_EQ(PathGuard::extensionOf("a.db"), ".db");
    EXPECT_EQ(PathGuard::extensionOf("a.tar.db"), ".db");
    EXPECT_EQ(PathGuard::extensionOf(".db"), "");
    EXPECT_EQ(PathGuard::extensionOf("noext"), "");
}

TEST(PathGuardNormalizeTest, IsWithinRequiresDeeperPath) {
    NormalizedPath base{"/", {"backup"}};
    NormalizedPath same{"/", {"BACKUP"}};
    NormalizedPath inside{"/", {"Backup", "f.db"}};
    EXPECT_FALSE(PathGuard::isWithin(base, same));
    EXPECT_TRUE(PathGuard::isWithin(base, inside));
}
