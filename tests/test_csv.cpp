#include <gtest/gtest.h>
#include <sstream>
#include <stmt_csv.hpp>
#include "statement_fixture.hpp"

using namespace stmt;

namespace {

Batch sample_batch()
{
    Batch b;
    CanonicalTransaction out;
    out.id = "id-1";
    out.date = "2025-07-28";
    out.createdAt = out.changedAt = 100;
    out.userId = 77;
    out.incomeInstrument = out.outcomeInstrument = 2;
    out.outcomeAccount = std::string("acc-yandex");
    out.outcome = 50000;
    out.payee = std::string("YANDEX_GO");
    out.comment = "Оплата товаров и услуг YANDEX_GO";
    b.transactions.push_back(out);

    CanonicalTransaction in;
    in.id = "id-2";
    in.date = "2025-07-28";
    in.createdAt = in.changedAt = 100;
    in.userId = 77;
    in.incomeInstrument = in.outcomeInstrument = 2;
    in.incomeAccount = std::string("acc-yandex");
    in.income = 120050;
    in.comment = "Входящий перевод СБП; Иванов \"Иван\"";
    b.transactions.push_back(in);
    return b;
}

} // namespace

TEST(CsvTests, test_export)
{
    ExportOptions opt;
    opt.minor_unit_exponent = 2;
    opt.use_decimal_comma = true;

    std::ostringstream os;
    export_transactions_csv(sample_batch(), &os, nullptr, opt);
    EXPECT_EQ(os.str(),
        "Id;Date;Created;Changed;User;IncomeAccount;IncomeInstrument;Income;OutcomeAccount;OutcomeInstrument;Outcome;Payee;Comment;Deleted\n"
        "id-1;2025-07-28;100;100;77;;2;0,00;acc-yandex;2;500,00;YANDEX_GO;Оплата товаров и услуг YANDEX_GO;0\n"
        "id-2;2025-07-28;100;100;77;acc-yandex;2;1200,50;;2;0,00;;\"Входящий перевод СБП; Иванов \"\"Иван\"\"\";0\n");
}

TEST(CsvTests, test_export_without_header_and_deleted_column)
{
    ExportOptions opt;
    opt.include_header = false;
    opt.include_deleted = false;
    opt.delimiter = ',';
    opt.write_utf8_bom = true;

    Batch b = sample_batch();
    b.transactions.resize(1);
    b.transactions[0].outcome = 500;

    std::ostringstream os;
    export_transactions_csv(b, &os, nullptr, opt);
    EXPECT_EQ(os.str(),
        "\xEF\xBB\xBF"
        "id-1,2025-07-28,100,100,77,,2,0,acc-yandex,2,500,YANDEX_GO,Оплата товаров и услуг YANDEX_GO\n");
}

TEST(CsvTests, test_export_data_canonical_values)
{
    ExportData data;
    export_transactions_csv(sample_batch(), nullptr, &data);
    ASSERT_EQ(data.size(), 3u);
    const TxRow& row = data[1];
    EXPECT_EQ(row[to_index(ExportField::Date)].second, "20250728");
    EXPECT_EQ(row[to_index(ExportField::Outcome)].second, "50000");
    EXPECT_EQ(row[to_index(ExportField::Payee)].second, "yandex_go");
    EXPECT_EQ(row[to_index(ExportField::Comment)].second, "оплататоваровиуслугyandex_go");
}

TEST(CsvTests, test_fmt_amount)
{
    EXPECT_EQ(fmt_amount(1200, 0), "1200");
    EXPECT_EQ(fmt_amount(120050, 2), "1200.50");
    EXPECT_EQ(fmt_amount(5, 2, true), "0,05");
    EXPECT_EQ(fmt_amount(-500, 0), "-500");
}

TEST(CsvTests, test_csv_escape)
{
    EXPECT_EQ(csv_escape("plain", ';'), "plain");
    EXPECT_EQ(csv_escape("a;b", ';'), "\"a;b\"");
    EXPECT_EQ(csv_escape("a;b", ','), "a;b");
    EXPECT_EQ(csv_escape("line\nbreak", ';'), "\"line\nbreak\"");
}

TEST(CsvTests, test_preview_lines)
{
    Batch b = sample_batch();
    b.transactions[0].outcome = 500;
    b.transactions[1].income = 1200;
    b.transactions.push_back(b.transactions[0]);

    const auto lines = preview_lines(b, 2, 0, 10);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "1. 2025-07-28 | Оплата тов | -500");
    EXPECT_EQ(lines[1], "2. 2025-07-28 | Входящий п | +1200");
    EXPECT_EQ(lines[2], "... 1 more");
}

TEST(CsvTests, test_export_deletion_batch_in_hundredths)
{
    LedgerSnapshot s = fixture::make_snapshot();
    Batch converted = sample_batch();
    s.transactions = converted.transactions;

    Batch tombstones;
    ASSERT_TRUE(plan_deletion(s, DeletionFilter{}, 200, tombstones));

    ExportOptions opt;
    opt.include_header = false;
    opt.minor_unit_exponent = 2;
    std::ostringstream os;
    export_transactions_csv(tombstones, &os, nullptr, opt);
    EXPECT_NE(os.str().find(";500.00;YANDEX_GO;"), std::string::npos);
    EXPECT_NE(os.str().find(";1200.50;"), std::string::npos);
    EXPECT_NE(os.str().find(";200;77;"), std::string::npos);
    EXPECT_EQ(os.str().back(), '\n');
    EXPECT_NE(os.str().find(";1\n"), std::string::npos);
}
