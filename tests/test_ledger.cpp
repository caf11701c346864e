#include <gtest/gtest.h>
#include <stmt_ledger.hpp>
#include "statement_fixture.hpp"

using namespace stmt;

namespace {

CanonicalTransaction ledger_tx(const std::string& id, const std::string& date, const std::string& account, bool income)
{
    CanonicalTransaction t;
    t.id = id;
    t.date = date;
    t.createdAt = 1750000000;
    t.changedAt = 1750000000;
    t.incomeInstrument = 2;
    t.outcomeInstrument = 2;
    if (income) { t.incomeAccount = account; t.income = 100; }
    else        { t.outcomeAccount = account; t.outcome = 100; }
    t.comment = "tx " + id;
    return t;
}

LedgerSnapshot snapshot_with_transactions()
{
    LedgerSnapshot s = fixture::make_snapshot();
    s.transactions.push_back(ledger_tx("t1", "2025-07-01", "acc-yandex", false));
    s.transactions.push_back(ledger_tx("t2", "2025-07-15", "acc-yandex", true));
    s.transactions.push_back(ledger_tx("t3", "2025-08-01", "acc-yandex", false));
    s.transactions.push_back(ledger_tx("t4", "2025-07-10", "acc-cash", false));
    CanonicalTransaction gone = ledger_tx("t5", "2025-07-11", "acc-yandex", false);
    gone.deleted = true;
    s.transactions.push_back(gone);
    return s;
}

} // namespace

TEST(LedgerTests, test_resolve_context)
{
    ResolutionRequest req;
    req.account_title = "yandex bank";
    ResolutionContext ctx;
    ResolutionError err;
    ASSERT_TRUE(resolve_context(fixture::make_snapshot(), req, ctx, &err));
    EXPECT_EQ(ctx.accountId, "acc-yandex");
    EXPECT_EQ(ctx.currencyId, 2);
    EXPECT_EQ(ctx.userId, 77);
    EXPECT_EQ(err.kind, ResolutionErrorKind::None);
}

TEST(LedgerTests, test_account_title_must_match_exactly)
{
    ResolutionRequest req;
    req.account_title = "Yandex Bank";
    ResolutionContext ctx;
    ResolutionError err;
    EXPECT_FALSE(resolve_context(fixture::make_snapshot(), req, ctx, &err));
    EXPECT_EQ(err.kind, ResolutionErrorKind::AccountNotFound);
    EXPECT_NE(err.message.find("Yandex Bank"), std::string::npos);
}

TEST(LedgerTests, test_currency_not_found)
{
    LedgerSnapshot s = fixture::make_snapshot();
    s.instruments.erase(s.instruments.begin() + 1);
    ResolutionRequest req;
    req.account_title = "cash";
    ResolutionContext ctx;
    ResolutionError err;
    EXPECT_FALSE(resolve_context(s, req, ctx, &err));
    EXPECT_EQ(err.kind, ResolutionErrorKind::CurrencyNotFound);
}

TEST(LedgerTests, test_currency_matched_by_full_title)
{
    LedgerSnapshot s = fixture::make_snapshot();
    s.instruments[1].shortTitle = "RUR";
    ResolutionRequest req;
    req.account_title = "cash";
    ResolutionContext ctx;
    ASSERT_TRUE(resolve_context(s, req, ctx));
    EXPECT_EQ(ctx.currencyId, 2);
}

TEST(LedgerTests, test_default_user)
{
    LedgerSnapshot s = fixture::make_snapshot();
    s.users.clear();
    ResolutionRequest req;
    req.account_title = "cash";
    ResolutionContext ctx;
    ASSERT_TRUE(resolve_context(s, req, ctx));
    EXPECT_EQ(ctx.userId, kDefaultUserId);
}

TEST(LedgerTests, test_delete_by_account_and_range)
{
    DeletionFilter f;
    f.account_title = std::string("yandex bank");
    f.start_date = std::string("2025-07-01");
    f.end_date = std::string("2025-07-31");

    Batch b;
    ASSERT_TRUE(plan_deletion(snapshot_with_transactions(), f, 1760000000, b));
    ASSERT_EQ(b.transactions.size(), 2u);
    EXPECT_EQ(b.transactions[0].id, "t1");
    EXPECT_EQ(b.transactions[1].id, "t2");
    for (const auto& t : b.transactions) {
        EXPECT_TRUE(t.deleted);
        EXPECT_EQ(t.changedAt, 1760000000);
        EXPECT_EQ(t.createdAt, 1750000000);
        EXPECT_EQ(t.userId, 77);
    }
    EXPECT_EQ(b.clientTimestamp, 1760000000);
    EXPECT_EQ(b.serverTimestamp, 1753000000);
}

TEST(LedgerTests, test_delete_everything_live)
{
    Batch b;
    ASSERT_TRUE(plan_deletion(snapshot_with_transactions(), DeletionFilter{}, 5, b));
    EXPECT_EQ(b.transactions.size(), 4u);
}

TEST(LedgerTests, test_delete_unknown_account)
{
    DeletionFilter f;
    f.account_title = std::string("nope");
    Batch b;
    b.transactions.resize(3);
    ResolutionError err;
    EXPECT_FALSE(plan_deletion(snapshot_with_transactions(), f, 5, b, &err));
    EXPECT_EQ(err.kind, ResolutionErrorKind::AccountNotFound);
}

TEST(LedgerTests, test_list_accounts)
{
    LedgerSnapshot s = fixture::make_snapshot();
    s.accounts.push_back({ "acc-eur", "euro card", 42, false });
    const auto rows = list_accounts(s);
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0].title, "cash");
    EXPECT_EQ(rows[0].currency, "RUB");
    EXPECT_EQ(rows[1].id, "acc-yandex");
    EXPECT_EQ(rows[2].currency, "?");
}
