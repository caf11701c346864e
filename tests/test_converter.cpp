#include <gtest/gtest.h>
#include <stmt_converter.hpp>
#include "statement_fixture.hpp"

using namespace stmt;

namespace {

Converter make_converter(const ParserOptions& opt = {})
{
    Converter c(opt);
    c.set_clock([] { return std::int64_t(1753700000); });
    c.set_id_source(fixture::CountingIds{});
    return c;
}

ResolutionRequest yandex()
{
    ResolutionRequest req;
    req.account_title = "yandex bank";
    return req;
}

} // namespace

TEST(ConverterTests, test_statement_to_batch)
{
    const Converter c = make_converter();
    Batch b;
    ConversionReport report;
    ResolutionError err;
    ASSERT_TRUE(c.convert(fixture::kStatement, fixture::make_snapshot(), yandex(), b, &report, &err)) << err.message;

    EXPECT_EQ(b.serverTimestamp, 1753000000);
    EXPECT_EQ(b.clientTimestamp, 1753700000);
    ASSERT_EQ(b.transactions.size(), 3u);

    const CanonicalTransaction& taxi = b.transactions[0];
    EXPECT_EQ(taxi.id, "id-1");
    EXPECT_EQ(taxi.date, "2025-07-28");
    EXPECT_EQ(taxi.outcome, 500);
    EXPECT_EQ(taxi.income, 0);
    ASSERT_TRUE(taxi.outcomeAccount.has_value());
    EXPECT_EQ(*taxi.outcomeAccount, "acc-yandex");
    ASSERT_TRUE(taxi.payee.has_value());
    EXPECT_EQ(*taxi.payee, "YANDEX_GO");
    EXPECT_EQ(taxi.comment, "Оплата товаров и услуг YANDEX_GO");
    EXPECT_EQ(taxi.userId, 77);
    EXPECT_EQ(taxi.createdAt, 1753700000);

    const CanonicalTransaction& transfer = b.transactions[1];
    EXPECT_EQ(transfer.income, 1200);
    EXPECT_EQ(transfer.outcome, 0);
    ASSERT_TRUE(transfer.incomeAccount.has_value());
    ASSERT_TRUE(transfer.payee.has_value());
    EXPECT_EQ(*transfer.payee, "Иванов Иван И.");

    const CanonicalTransaction& ozon = b.transactions[2];
    EXPECT_EQ(ozon.date, "2025-07-30");
    EXPECT_EQ(ozon.outcome, 1000);

    EXPECT_EQ(report.anchors, 4u);
    EXPECT_EQ(report.intermediates, 3u);
    EXPECT_EQ(report.assembled, 3u);
    EXPECT_EQ(total_skipped(report), 1u);
}

TEST(ConverterTests, test_two_valid_one_malformed)
{
    const Converter c = make_converter();
    Batch b;
    c.convert(fixture::kTwoValidOneMalformed, fixture::make_context(), b);
    ASSERT_EQ(b.transactions.size(), 2u);

    int incomes = 0, outcomes = 0;
    for (const auto& t : b.transactions) {
        // exactly one side carries the amount
        EXPECT_NE(t.income == 0, t.outcome == 0);
        EXPECT_NE(t.incomeAccount.has_value(), t.outcomeAccount.has_value());
        if (t.income) ++incomes;
        if (t.outcome) ++outcomes;
    }
    EXPECT_EQ(incomes, 1);
    EXPECT_EQ(outcomes, 1);
    EXPECT_EQ(b.transactions[0].income, 2500);
    EXPECT_EQ(b.transactions[1].outcome, 750);
    EXPECT_EQ(b.transactions[1].date, "2025-08-03");
}

TEST(ConverterTests, test_hundredths)
{
    ParserOptions opt;
    opt.minor_unit_exponent = 2;
    const Converter c = make_converter(opt);
    Batch b;
    c.convert(fixture::kStatement, fixture::make_context(), b);
    ASSERT_EQ(b.transactions.size(), 3u);
    EXPECT_EQ(b.transactions[1].income, 120050);
    EXPECT_EQ(b.transactions[2].outcome, 100000);
}

TEST(ConverterTests, test_unresolved_account_aborts)
{
    const Converter c = make_converter();
    Batch b;
    b.transactions.resize(2);
    ConversionReport report;
    ResolutionError err;
    ResolutionRequest req;
    req.account_title = "missing";
    EXPECT_FALSE(c.convert(fixture::kStatement, fixture::make_snapshot(), req, b, &report, &err));
    EXPECT_EQ(err.kind, ResolutionErrorKind::AccountNotFound);
    EXPECT_TRUE(b.transactions.empty());
    EXPECT_EQ(report.anchors, 0u);
}

TEST(ConverterTests, test_unresolved_currency_aborts)
{
    LedgerSnapshot s = fixture::make_snapshot();
    s.instruments.pop_back();
    const Converter c = make_converter();
    Batch b;
    ResolutionError err;
    EXPECT_FALSE(c.convert(fixture::kStatement, s, yandex(), b, nullptr, &err));
    EXPECT_EQ(err.kind, ResolutionErrorKind::CurrencyNotFound);
    EXPECT_TRUE(b.transactions.empty());
}

TEST(ConverterTests, test_zero_amount_is_not_recorded)
{
    const Converter c = make_converter();
    Batch b;
    ConversionReport report;
    c.convert("Оплата товаров и услуг CASHBACK\n05.08.2025 в 08:00 05.08.2025 +0,40 ₽ +0,40 ₽\n",
              fixture::make_context(), b, &report);
    EXPECT_TRUE(b.transactions.empty());
    EXPECT_EQ(count(report, SkipKind::ZeroAmountSkip), 1u);
}

TEST(ConverterTests, test_invalid_processing_date_is_skipped)
{
    const Converter c = make_converter();
    Batch b;
    ConversionReport report;
    c.convert("Оплата товаров и услуг METRO\n30.01.2025 в 08:00 31.02.2025 –10,00 ₽ –10,00 ₽\n",
              fixture::make_context(), b, &report);
    EXPECT_TRUE(b.transactions.empty());
    EXPECT_EQ(count(report, SkipKind::DateParseError), 1u);
    ASSERT_EQ(report.diagnostics.size(), 1u);
    EXPECT_EQ(report.diagnostics[0].raw, "31.02.2025");
}

TEST(ConverterTests, test_amount_out_of_range_is_skipped)
{
    const Converter c = make_converter();
    Batch b;
    ConversionReport report;
    c.convert("Оплата товаров и услуг METRO\n30.01.2025 в 08:00 30.01.2025 "
              "–99999999999999999999999 ₽ –99999999999999999999999 ₽\n",
              fixture::make_context(), b, &report);
    EXPECT_TRUE(b.transactions.empty());
    EXPECT_EQ(count(report, SkipKind::AmountParseError), 1u);
}

TEST(ConverterTests, test_normalize_falls_back_to_transaction_fields)
{
    const Converter c = make_converter();
    IntermediateTransaction t;
    t.description = "Оплата товаров и услуг METRO";
    t.transactionDateTime = "27.07.2025 в 08:16";
    t.transactionAmount = "–55,00 ₽";
    Outcome<NormalizedFields> n = c.normalize(t);
    ASSERT_TRUE(succeeded(n));
    EXPECT_EQ(std::get<NormalizedFields>(n).date, "2025-07-27");
    EXPECT_TRUE(std::get<NormalizedFields>(n).amount.negative);
    EXPECT_EQ(std::get<NormalizedFields>(n).amount.minor, 55);
}

TEST(ConverterTests, test_empty_text)
{
    const Converter c = make_converter();
    Batch b;
    ConversionReport report;
    c.convert("", fixture::make_context(), b, &report, 42);
    EXPECT_TRUE(b.transactions.empty());
    EXPECT_EQ(b.serverTimestamp, 42);
    EXPECT_EQ(report.anchors, 0u);
}
