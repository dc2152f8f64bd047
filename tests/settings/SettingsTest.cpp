#include <gtest/gtest.h>

#include "settings/DirectorySettings.hpp"
#include "settings/LedgerSettings.hpp"
#include <cstdlib>
#include <vector>

using namespace bank;

class SettingsTest : public ::testing::Test {
protected:
    void SetUp() override { clearEnv(); }
    void TearDown() override { clearEnv(); }

    static void clearEnv() {
        static const std::vector<std::string> names = {
            "DIRECTORY_BACKEND", "LEDGER_BACKEND",
            "BANK_DB_HOST", "BANK_DB_PORT", "BANK_DB_NAME", "BANK_DB_USER", "BANK_DB_PASSWORD",
            "LEDGER_DB_HOST", "LEDGER_DB_PORT", "LEDGER_DB_NAME", "LEDGER_DB_USER", "LEDGER_DB_PASSWORD",
        };
        for (const auto& name : names) {
            unsetenv(name.c_str());
        }
    }

    static void set(const char* name, const char* value) {
        setenv(name, value, 1);
    }
};

// ============================================
// BACKEND SELECTION
// ============================================

TEST_F(SettingsTest, MemoryBackendsNeedNoDatabase) {
    set("DIRECTORY_BACKEND", "memory");
    set("LEDGER_BACKEND", "memory");

    settings::DirectorySettings directory;
    settings::LedgerSettings ledger;

    EXPECT_EQ(directory.getBackend(), settings::StorageBackend::MEMORY);
    EXPECT_EQ(ledger.getBackend(), settings::StorageBackend::MEMORY);
    EXPECT_THROW(directory.getDatabase(), std::logic_error);
}

TEST_F(SettingsTest, UnknownBackendRejected) {
    set("LEDGER_BACKEND", "tigerbeetle");

    EXPECT_THROW(settings::LedgerSettings(), std::invalid_argument);
}

TEST_F(SettingsTest, PostgresBackendRequiresPassword) {
    EXPECT_THROW(settings::DirectorySettings(), std::runtime_error);
    EXPECT_THROW(settings::LedgerSettings(), std::runtime_error);
}

// ============================================
// CONNECTION
// ============================================

TEST_F(SettingsTest, DirectoryReadsBankDbVariables) {
    set("BANK_DB_HOST", "db.internal");
    set("BANK_DB_PORT", "6432");
    set("BANK_DB_PASSWORD", "secret");

    settings::DirectorySettings directory;
    const auto& db = directory.getDatabase();

    EXPECT_EQ(db.getHost(), "db.internal");
    EXPECT_EQ(db.getPort(), 6432);
    EXPECT_EQ(db.getName(), "bank_db");
    EXPECT_EQ(db.getConnectionString(),
              "host=db.internal port=6432 dbname=bank_db user=bank_user password=secret");
}

TEST_F(SettingsTest, LedgerFallsBackToBankDbVariables) {
    set("BANK_DB_HOST", "db.internal");
    set("BANK_DB_PASSWORD", "secret");
    set("LEDGER_DB_NAME", "ledger_db");

    settings::LedgerSettings ledger;
    const auto& db = ledger.getDatabase();

    EXPECT_EQ(db.getHost(), "db.internal");
    EXPECT_EQ(db.getName(), "ledger_db");
    EXPECT_NE(db.getConnectionString().find("password=secret"), std::string::npos);
}

TEST_F(SettingsTest, InvalidPortRejected) {
    set("BANK_DB_PASSWORD", "secret");

    set("BANK_DB_PORT", "54x");
    EXPECT_THROW(settings::DirectorySettings(), std::invalid_argument);

    set("BANK_DB_PORT", "70000");
    EXPECT_THROW(settings::DirectorySettings(), std::invalid_argument);
}
