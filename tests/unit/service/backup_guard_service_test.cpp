#include <gtest/gtest.h>

#include <string>

#include "bkg/foundation/error_code.hpp"
#include "bkg/security/message_codes.hpp"
#include "bkg/service/backup_guard_service.hpp"
#include "support/capturing_logger.hpp"

using namespace std::chrono_literals;
using bkg::foundation::ErrorCode;
using bkg::service::BackupGuardService;
using bkg::service::GuardConfig;
using bkg::service::RetryHint;
using bkg::test::CapturingLogger;
using kcenon::common::interfaces::log_level;
namespace codes = bkg::security::codes;

namespace {

GuardConfig makeConfig() {
    GuardConfig cfg;
    cfg.backupDirectory = "/var/lib/erp/backups";
    cfg.defaultRateLimit = {3, 60000ms};
    cfg.routeLimits.emplace("exchange_rate", bkg::security::RateLimiterConfig{2, 60000ms});
    return cfg;
}

} // namespace

class BackupGuardServiceTest : public ::testing::Test {
protected:
    void SetUp() override { sink_ = bkg::test::installCapturingLogger(); }
    void TearDown() override { bkg::test::uninstallCapturingLogger(); }

    std::shared_ptr<CapturingLogger> sink_;
    BackupGuardService guard_{makeConfig()};
};

// ===========================================================================
// Backup paths
// ===========================================================================

TEST_F(BackupGuardServiceTest, AuthorizesPathInsideDirectory) {
    auto result = guard_.authorizeBackupPath("/var/lib/erp/backups/2024-01-01.db");
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), "/var/lib/erp/backups/2024-01-01.db");
    EXPECT_TRUE(sink_->matching("Rejected backup path").empty());
}

TEST_F(BackupGuardServiceTest, RejectsTraversalWithStableCode) {
    auto result = guard_.authorizeBackupPath("/var/lib/erp/backups/../secrets.db");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidBackupPath);
    EXPECT_EQ(result.error().message(), codes::kInvalidBackupPath);
    EXPECT_FALSE(result.error().hasContext());
}

TEST_F(BackupGuardServiceTest, RejectsWrongExtension) {
    auto result = guard_.authorizeBackupPath("/var/lib/erp/backups/dump.sql");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().message(), codes::kInvalidBackupPath);
}

TEST_F(BackupGuardServiceTest, RejectionDetailGoesToLogOnly) {
    (void)guard_.authorizeBackupPath("/etc/passwd");

    auto records = sink_->matching("Rejected backup path");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::warning);
    EXPECT_NE(records[0].message.find("[Backup]"), std::string::npos);
    EXPECT_NE(records[0].message.find("/etc/passwd"), std::string::npos);
}

TEST_F(BackupGuardServiceTest, ConfiguredExtensionApplies) {
    auto cfg = makeConfig();
    cfg.backupExtension = ".sqlite";
    BackupGuardService guard(std::move(cfg));

    EXPECT_TRUE(guard.authorizeBackupPath("/var/lib/erp/backups/a.sqlite").hasValue());
    EXPECT_TRUE(guard.authorizeBackupPath("/var/lib/erp/backups/a.db").hasError());
}

TEST_F(BackupGuardServiceTest, UnsetDirectoryRejectsEverything) {
    BackupGuardService guard(GuardConfig{});
    EXPECT_TRUE(guard.authorizeBackupPath("/var/lib/erp/backups/a.db").hasError());
}

// ===========================================================================
// Rate limiting
// ===========================================================================

TEST_F(BackupGuardServiceTest, RouteLimitIsEnforced) {
    EXPECT_TRUE(guard_.acquire("exchange_rate", "user-1").hasValue());
    EXPECT_TRUE(guard_.acquire("exchange_rate", "user-1").hasValue());

    auto third = guard_.acquire("exchange_rate", "user-1");
    ASSERT_TRUE(third.hasError());
    EXPECT_EQ(third.error().code(), ErrorCode::RateLimited);
    EXPECT_EQ(third.error().message(), codes::kRateLimitExceeded);

    const auto* hint = third.error().context<RetryHint>();
    ASSERT_NE(hint, nullptr);
    EXPECT_EQ(hint->remaining, 0u);
    EXPECT_GT(hint->retryAfter, 0ms);
    EXPECT_LE(hint->retryAfter, 60000ms);
}

TEST_F(BackupGuardServiceTest, RejectionIsLoggedAsSecurityWarning) {
    (void)guard_.acquire("exchange_rate", "user-1");
    (void)guard_.acquire("exchange_rate", "user-1");
    (void)guard_.acquire("exchange_rate", "user-1");

    auto records = sink_->matching("Rate limit exceeded");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::warning);
    EXPECT_NE(records[0].message.find("[Security]"), std::string::npos);
    EXPECT_NE(records[0].message.find("user-1"), std::string::npos);
}

TEST_F(BackupGuardServiceTest, SubjectsAreIndependent) {
    (void)guard_.acquire("exchange_rate", "user-1");
    (void)guard_.acquire("exchange_rate", "user-1");
    EXPECT_TRUE(guard_.acquire("exchange_rate", "user-1").hasError());
    EXPECT_TRUE(guard_.acquire("exchange_rate", "user-2").hasValue());
    EXPECT_EQ(guard_.trackedSubjects(), 2u);
}

TEST_F(BackupGuardServiceTest, RoutesAreIndependent) {
    (void)guard_.acquire("exchange_rate", "user-1");
    (void)guard_.acquire("exchange_rate", "user-1");
    EXPECT_TRUE(guard_.acquire("exchange_rate", "user-1").hasError());

    // Unlisted route uses the default of 3.
    EXPECT_TRUE(guard_.acquire("backup_list", "user-1").hasValue());
    EXPECT_TRUE(guard_.acquire("backup_list", "user-1").hasValue());
    EXPECT_TRUE(guard_.acquire("backup_list", "user-1").hasValue());
    EXPECT_TRUE(guard_.acquire("backup_list", "user-1").hasError());
}

TEST_F(BackupGuardServiceTest, QuotaDoesNotConsume) {
    auto fresh = guard_.quota("exchange_rate", "user-1");
    EXPECT_EQ(fresh.remaining, 2u);
    EXPECT_EQ(fresh.retryAfter, 0ms);
    EXPECT_EQ(guard_.trackedSubjects(), 0u);

    (void)guard_.acquire("exchange_rate", "user-1");
    auto used = guard_.quota("exchange_rate", "user-1");
    EXPECT_EQ(used.remaining, 1u);
    EXPECT_GT(used.retryAfter, 0ms);

    EXPECT_EQ(guard_.quota("exchange_rate", "user-1").remaining, 1u);
}

TEST_F(BackupGuardServiceTest, ForgetStartsFreshWindow) {
    (void)guard_.acquire("exchange_rate", "user-1");
    (void)guard_.acquire("exchange_rate", "user-1");
    EXPECT_TRUE(guard_.acquire("exchange_rate", "user-1").hasError());

    EXPECT_TRUE(guard_.forget("exchange_rate", "user-1"));
    EXPECT_FALSE(guard_.forget("exchange_rate", "user-1"));
    EXPECT_TRUE(guard_.acquire("exchange_rate", "user-1").hasValue());
}
