#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "application/MasterAccountBootstrap.hpp"
#include "adapters/secondary/InMemoryLedgerGateway.hpp"
#include "mocks/MockLedgerGateway.hpp"

using namespace bank;
using namespace bank::tests::mocks;
using ::testing::_;
using ::testing::Return;

class MasterAccountBootstrapTest : public ::testing::Test {
protected:
    void SetUp() override {
        ledger_ = std::make_shared<adapters::secondary::InMemoryLedgerGateway>();
        bootstrap_ = std::make_shared<application::MasterAccountBootstrap>(ledger_);
    }

    std::shared_ptr<adapters::secondary::InMemoryLedgerGateway> ledger_;
    std::shared_ptr<application::MasterAccountBootstrap> bootstrap_;
};

TEST_F(MasterAccountBootstrapTest, CreatesBothMasterAccounts) {
    auto report = bootstrap_->ensureMasterAccounts();

    EXPECT_TRUE(report.complete());
    EXPECT_EQ(report.masterDebit, domain::LedgerStatus::OK);
    EXPECT_EQ(report.masterCredit, domain::LedgerStatus::OK);

    auto debit = ledger_->getAccount(domain::MASTER_DEBIT_ACCOUNT_ID);
    auto credit = ledger_->getAccount(domain::MASTER_CREDIT_ACCOUNT_ID);
    ASSERT_TRUE(debit.ok());
    ASSERT_TRUE(credit.ok());
    EXPECT_EQ(debit.account->category, domain::AccountCategory::MASTER_DEBIT);
    EXPECT_EQ(credit.account->category, domain::AccountCategory::MASTER_CREDIT);
}

TEST_F(MasterAccountBootstrapTest, SecondRunIsIdempotent) {
    bootstrap_->ensureMasterAccounts();

    auto report = bootstrap_->ensureMasterAccounts();

    EXPECT_TRUE(report.complete());
    EXPECT_EQ(report.masterDebit, domain::LedgerStatus::ALREADY_EXISTS);
    EXPECT_EQ(report.masterCredit, domain::LedgerStatus::ALREADY_EXISTS);
    EXPECT_EQ(ledger_->accountCount(), 2u);
}

TEST_F(MasterAccountBootstrapTest, EngineFailureDoesNotThrow) {
    auto mockLedger = std::make_shared<MockLedgerGateway>();
    application::MasterAccountBootstrap bootstrap(mockLedger);

    EXPECT_CALL(*mockLedger, createAccount(domain::MASTER_DEBIT_ACCOUNT_ID, domain::AccountCategory::MASTER_DEBIT))
        .WillOnce(Return(accountResult(domain::LedgerStatus::UNAVAILABLE)));
    EXPECT_CALL(*mockLedger, createAccount(domain::MASTER_CREDIT_ACCOUNT_ID, domain::AccountCategory::MASTER_CREDIT))
        .WillOnce(Return(accountResult(domain::LedgerStatus::ALREADY_EXISTS)));

    application::BootstrapReport report;
    EXPECT_NO_THROW(report = bootstrap.ensureMasterAccounts());

    EXPECT_FALSE(report.complete());
    EXPECT_EQ(report.masterDebit, domain::LedgerStatus::UNAVAILABLE);
    EXPECT_EQ(report.masterCredit, domain::LedgerStatus::ALREADY_EXISTS);
}
