#include <gtest/gtest.h>

#include "adapters/secondary/InMemoryUserRepository.hpp"
#include "utils/UuidGenerator.hpp"

using namespace bank;
using namespace bank::adapters::secondary;

class InMemoryUserRepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        repo_ = std::make_shared<InMemoryUserRepository>();
    }

    domain::User saveUser(const std::string& email) {
        domain::User user(utils::UuidGenerator::generate(), email, "Test", "User");
        return repo_->save(user);
    }

    std::shared_ptr<InMemoryUserRepository> repo_;
};

// ============================================
// SAVE / EMAIL INDEX
// ============================================

TEST_F(InMemoryUserRepositoryTest, Save_EmailOwnedByAnotherUserThrows) {
    saveUser("ana@example.com");

    EXPECT_THROW(saveUser("ana@example.com"), std::runtime_error);
    EXPECT_EQ(repo_->size(), 1u);
}

TEST_F(InMemoryUserRepositoryTest, Save_ChangedEmailReleasesPreviousOne) {
    auto user = saveUser("ana@example.com");

    user.email = "ana.new@example.com";
    repo_->save(user);

    EXPECT_FALSE(repo_->findByEmail("ana@example.com").has_value());
    auto found = repo_->findByEmail("ana.new@example.com");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->userId, user.userId);

    // Освобождённый адрес снова доступен
    EXPECT_NO_THROW(saveUser("ana@example.com"));
    EXPECT_EQ(repo_->size(), 2u);
}

TEST_F(InMemoryUserRepositoryTest, DeleteById_ReleasesEmail) {
    auto user = saveUser("ana@example.com");

    EXPECT_TRUE(repo_->deleteById(user.userId));

    EXPECT_FALSE(repo_->findById(user.userId).has_value());
    EXPECT_FALSE(repo_->findByEmail("ana@example.com").has_value());
    EXPECT_FALSE(repo_->deleteById(user.userId));
}

// ============================================
// LEDGER LINK
// ============================================

TEST_F(InMemoryUserRepositoryTest, LinkLedgerAccount_IsSetOnce) {
    auto user = saveUser("ana@example.com");

    EXPECT_TRUE(repo_->linkLedgerAccount(user.userId, 5000));
    EXPECT_TRUE(repo_->linkLedgerAccount(user.userId, 5000));
    EXPECT_FALSE(repo_->linkLedgerAccount(user.userId, 6000));

    auto found = repo_->findByLedgerAccountId(5000);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->userId, user.userId);
    EXPECT_FALSE(repo_->findByLedgerAccountId(6000).has_value());
}

TEST_F(InMemoryUserRepositoryTest, LinkLedgerAccount_UnknownUser) {
    EXPECT_FALSE(repo_->linkLedgerAccount(utils::UuidGenerator::generate(), 5000));
}
