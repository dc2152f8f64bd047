#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "application/MoneyMovementService.hpp"
#include "application/AccountProvisioner.hpp"
#include "application/MasterAccountBootstrap.hpp"
#include "adapters/secondary/InMemoryLedgerGateway.hpp"
#include "adapters/secondary/InMemoryUserRepository.hpp"
#include "mocks/MockLedgerGateway.hpp"

using namespace bank;
using namespace bank::tests::mocks;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

class MoneyMovementServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        userRepo_ = std::make_shared<adapters::secondary::InMemoryUserRepository>();
        ledger_ = std::make_shared<adapters::secondary::InMemoryLedgerGateway>();
        application::MasterAccountBootstrap bootstrap(ledger_);
        bootstrap.ensureMasterAccounts();
        provisioner_ = std::make_shared<application::AccountProvisioner>(userRepo_, ledger_);
        service_ = std::make_shared<application::MoneyMovementService>(userRepo_, ledger_);
    }

    void TearDown() override {
        userRepo_->clear();
    }

    domain::UserId createUser(const std::string& email, bool provision = true) {
        domain::User user(utils::UuidGenerator::generate(), email, "Test", "User");
        userRepo_->save(user);
        if (provision) {
            EXPECT_TRUE(provisioner_->provision(user.userId).success);
        }
        return user.userId;
    }

    int64_t balanceOf(const domain::UserId& userId) {
        auto user = userRepo_->findById(userId);
        auto totals = ledger_->getPostedTotals(*user->ledgerAccountId);
        return domain::LedgerAccount::computeBalance(totals.debitsPosted, totals.creditsPosted);
    }

    std::shared_ptr<adapters::secondary::InMemoryUserRepository> userRepo_;
    std::shared_ptr<adapters::secondary::InMemoryLedgerGateway> ledger_;
    std::shared_ptr<application::AccountProvisioner> provisioner_;
    std::shared_ptr<application::MoneyMovementService> service_;
};

// ============================================
// DEPOSIT
// ============================================

TEST_F(MoneyMovementServiceTest, Deposit_CreditsUserFromMasterCredit) {
    auto user = createUser("ana@example.com");

    auto result = service_->deposit(user, 10000);

    ASSERT_TRUE(result.success) << result.message;
    EXPECT_NE(result.transferId, 0u);
    EXPECT_FALSE(result.alreadyApplied);
    EXPECT_EQ(balanceOf(user), 10000);
    EXPECT_EQ(ledger_->getPostedTotals(domain::MASTER_CREDIT_ACCOUNT_ID).debitsPosted, 10000u);
}

TEST_F(MoneyMovementServiceTest, Deposit_NonPositiveAmountRejectedBeforeEngine) {
    auto user = createUser("ana@example.com");

    EXPECT_EQ(service_->deposit(user, 0).error, domain::OperationError::INVALID_AMOUNT);
    EXPECT_EQ(service_->deposit(user, -5).error, domain::OperationError::INVALID_AMOUNT);
    EXPECT_EQ(ledger_->transferCount(), 0u);
}

TEST_F(MoneyMovementServiceTest, Deposit_UnknownUser) {
    auto result = service_->deposit(utils::UuidGenerator::generate(), 100);

    EXPECT_EQ(result.error, domain::OperationError::IDENTITY_NOT_FOUND);
}

TEST_F(MoneyMovementServiceTest, Deposit_UserWithoutAccount) {
    auto user = createUser("ana@example.com", false);

    auto result = service_->deposit(user, 100);

    EXPECT_EQ(result.error, domain::OperationError::ACCOUNT_NOT_LINKED);
}

// ============================================
// WITHDRAW
// ============================================

TEST_F(MoneyMovementServiceTest, Withdraw_DebitsUserToMasterDebit) {
    auto user = createUser("ana@example.com");
    service_->deposit(user, 10000);

    auto result = service_->withdraw(user, 3000);

    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(balanceOf(user), 7000);
    EXPECT_EQ(ledger_->getPostedTotals(domain::MASTER_DEBIT_ACCOUNT_ID).creditsPosted, 3000u);
}

TEST_F(MoneyMovementServiceTest, Withdraw_ExactBalanceAllowed) {
    auto user = createUser("ana@example.com");
    service_->deposit(user, 500);

    EXPECT_TRUE(service_->withdraw(user, 500).success);
    EXPECT_EQ(balanceOf(user), 0);
}

TEST_F(MoneyMovementServiceTest, Withdraw_InsufficientFundsLeavesBalance) {
    auto user = createUser("ana@example.com");
    service_->deposit(user, 7000);
    auto transfersBefore = ledger_->transferCount();

    auto result = service_->withdraw(user, 8000);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, domain::OperationError::INSUFFICIENT_FUNDS);
    EXPECT_EQ(balanceOf(user), 7000);
    EXPECT_EQ(ledger_->transferCount(), transfersBefore);
}

TEST_F(MoneyMovementServiceTest, Withdraw_BalanceReadFailureIsUnavailable) {
    auto mockLedger = std::make_shared<NiceMock<MockLedgerGateway>>();
    application::MoneyMovementService service(userRepo_, mockLedger);
    auto user = createUser("ana@example.com");

    EXPECT_CALL(*mockLedger, getPostedTotals(_))
        .WillOnce(Return(totalsResult(domain::LedgerStatus::UNAVAILABLE)));
    EXPECT_CALL(*mockLedger, createTransfer(_)).Times(0);

    auto result = service.withdraw(user, 100);

    EXPECT_EQ(result.error, domain::OperationError::ENGINE_UNAVAILABLE);
}

TEST_F(MoneyMovementServiceTest, Withdraw_EngineSideLimitMapsToInsufficientFunds) {
    auto mockLedger = std::make_shared<NiceMock<MockLedgerGateway>>();
    application::MoneyMovementService service(userRepo_, mockLedger);
    auto user = createUser("ana@example.com");

    // Баланс прочитан до конкурентного списания, движок отклоняет перевод
    EXPECT_CALL(*mockLedger, getPostedTotals(_))
        .WillOnce(Return(totalsResult(domain::LedgerStatus::OK, 0, 1000)));
    EXPECT_CALL(*mockLedger, createTransfer(_))
        .WillOnce(Return(domain::LedgerStatus::EXCEEDS_CREDITS));

    auto result = service.withdraw(user, 1000);

    EXPECT_EQ(result.error, domain::OperationError::INSUFFICIENT_FUNDS);
}

// ============================================
// TRANSFER
// ============================================

TEST_F(MoneyMovementServiceTest, Transfer_ConservesTotal) {
    auto u1 = createUser("u1@example.com");
    auto u2 = createUser("u2@example.com");
    service_->deposit(u1, 10000);

    auto result = service_->transfer(u1, u2, 3000);

    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(balanceOf(u1), 7000);
    EXPECT_EQ(balanceOf(u2), 3000);
    EXPECT_EQ(balanceOf(u1) + balanceOf(u2), 10000);
}

TEST_F(MoneyMovementServiceTest, Transfer_SameUserRejected) {
    auto u1 = createUser("u1@example.com");
    service_->deposit(u1, 1000);

    auto result = service_->transfer(u1, u1, 100);

    EXPECT_EQ(result.error, domain::OperationError::SAME_ACCOUNT);
    EXPECT_EQ(balanceOf(u1), 1000);
}

TEST_F(MoneyMovementServiceTest, Transfer_InsufficientFunds) {
    auto u1 = createUser("u1@example.com");
    auto u2 = createUser("u2@example.com");
    service_->deposit(u1, 100);

    auto result = service_->transfer(u1, u2, 101);

    EXPECT_EQ(result.error, domain::OperationError::INSUFFICIENT_FUNDS);
    EXPECT_EQ(balanceOf(u2), 0);
}

TEST_F(MoneyMovementServiceTest, Transfer_RecipientWithoutAccount) {
    auto u1 = createUser("u1@example.com");
    auto u2 = createUser("u2@example.com", false);
    service_->deposit(u1, 1000);

    auto result = service_->transfer(u1, u2, 100);

    EXPECT_EQ(result.error, domain::OperationError::ACCOUNT_NOT_LINKED);
    EXPECT_EQ(balanceOf(u1), 1000);
}

// ============================================
// IDEMPOTENCY
// ============================================

TEST_F(MoneyMovementServiceTest, Retry_SameTransferIdAppliedOnce) {
    auto user = createUser("ana@example.com");

    auto first = service_->deposit(user, 500, 9001);
    auto retry = service_->deposit(user, 500, 9001);

    EXPECT_TRUE(first.success);
    EXPECT_FALSE(first.alreadyApplied);
    EXPECT_TRUE(retry.success);
    EXPECT_TRUE(retry.alreadyApplied);
    EXPECT_EQ(retry.transferId, 9001u);
    EXPECT_EQ(balanceOf(user), 500);
}

TEST_F(MoneyMovementServiceTest, Retry_SameIdDifferentMovementIsDuplicate) {
    auto user = createUser("ana@example.com");
    service_->deposit(user, 500, 9001);

    auto result = service_->deposit(user, 700, 9001);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, domain::OperationError::DUPLICATE_SUBMISSION);
    EXPECT_EQ(balanceOf(user), 500);
}

TEST_F(MoneyMovementServiceTest, Retry_WithdrawAfterDrainIsAlreadyApplied) {
    auto user = createUser("ana@example.com");
    service_->deposit(user, 3000);

    auto first = service_->withdraw(user, 3000, 777);
    auto retry = service_->withdraw(user, 3000, 777);

    ASSERT_TRUE(first.success) << first.message;
    EXPECT_TRUE(retry.success) << retry.message;
    EXPECT_TRUE(retry.alreadyApplied);
    EXPECT_EQ(retry.error, domain::OperationError::NONE);
    EXPECT_EQ(retry.transferId, 777u);
    EXPECT_EQ(balanceOf(user), 0);
}

TEST_F(MoneyMovementServiceTest, Retry_TransferAfterDrainIsAlreadyApplied) {
    auto u1 = createUser("ana@example.com");
    auto u2 = createUser("ben@example.com");
    service_->deposit(u1, 1000);

    auto first = service_->transfer(u1, u2, 1000, 888);
    auto retry = service_->transfer(u1, u2, 1000, 888);

    ASSERT_TRUE(first.success) << first.message;
    EXPECT_TRUE(retry.success) << retry.message;
    EXPECT_TRUE(retry.alreadyApplied);
    EXPECT_EQ(balanceOf(u1), 0);
    EXPECT_EQ(balanceOf(u2), 1000);
    EXPECT_EQ(ledger_->transferCount(), 2u);
}

TEST_F(MoneyMovementServiceTest, Retry_WithdrawIdReusedForOtherMovementIsDuplicate) {
    auto user = createUser("ana@example.com");
    service_->deposit(user, 3000);
    service_->withdraw(user, 3000, 777);

    auto result = service_->withdraw(user, 500, 777);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, domain::OperationError::DUPLICATE_SUBMISSION);
    EXPECT_EQ(result.transferId, 777u);
}

TEST_F(MoneyMovementServiceTest, Retry_PriorTransferFoundSkipsBalanceReadAndSubmit) {
    auto mockLedger = std::make_shared<NiceMock<MockLedgerGateway>>();
    application::MoneyMovementService service(userRepo_, mockLedger);
    auto user = createUser("ana@example.com");
    uint64_t accountId = *userRepo_->findById(user)->ledgerAccountId;

    EXPECT_CALL(*mockLedger, lookupTransfer(555))
        .WillOnce(Return(domain::Transfer(555, accountId, domain::MASTER_DEBIT_ACCOUNT_ID, 200)));
    EXPECT_CALL(*mockLedger, getPostedTotals(_)).Times(0);
    EXPECT_CALL(*mockLedger, createTransfer(_)).Times(0);

    auto result = service.withdraw(user, 200, 555);

    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.alreadyApplied);
}

TEST_F(MoneyMovementServiceTest, SuppliedTransferIdIsSubmittedAsIs) {
    auto mockLedger = std::make_shared<NiceMock<MockLedgerGateway>>();
    application::MoneyMovementService service(userRepo_, mockLedger);
    auto user = createUser("ana@example.com");

    EXPECT_CALL(*mockLedger, createTransfer(::testing::Field(&domain::Transfer::id, 4096u)))
        .WillOnce(Return(domain::LedgerStatus::OK));

    auto result = service.deposit(user, 100, 4096);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.transferId, 4096u);
}

TEST_F(MoneyMovementServiceTest, GeneratedIdClashIsDuplicateSubmission) {
    auto mockLedger = std::make_shared<NiceMock<MockLedgerGateway>>();
    application::MoneyMovementService service(userRepo_, mockLedger);
    auto user = createUser("ana@example.com");

    EXPECT_CALL(*mockLedger, createTransfer(_))
        .WillOnce(Return(domain::LedgerStatus::ALREADY_EXISTS));
    EXPECT_CALL(*mockLedger, lookupTransfer(_)).Times(0);

    auto result = service.deposit(user, 100);

    EXPECT_EQ(result.error, domain::OperationError::DUPLICATE_SUBMISSION);
}

TEST_F(MoneyMovementServiceTest, EngineUnavailableOnSubmit) {
    auto mockLedger = std::make_shared<NiceMock<MockLedgerGateway>>();
    application::MoneyMovementService service(userRepo_, mockLedger);
    auto user = createUser("ana@example.com");

    EXPECT_CALL(*mockLedger, createTransfer(_))
        .WillOnce(Return(domain::LedgerStatus::UNAVAILABLE));

    auto result = service.deposit(user, 100, 31337);

    EXPECT_EQ(result.error, domain::OperationError::ENGINE_UNAVAILABLE);
    EXPECT_EQ(result.transferId, 31337u);
}
