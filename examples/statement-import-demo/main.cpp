#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QFile>
#include <QString>
#include <fstream>
#include <stmt_converter.hpp>
#include <stmt_csv.hpp>
#include <stmt_ledger.hpp>
#include <stmt_xml_pugi.hpp>

namespace {

QString S(const std::string& s) { return QString::fromUtf8(s.c_str()); }

bool read_all(const QString& path, std::string& out)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        qCritical().noquote() << "Cannot open" << path << ":" << f.errorString();
        return false;
    }
    const QByteArray ba = f.readAll();
    out.assign(ba.constData(), static_cast<size_t>(ba.size()));
    return true;
}

bool load_snapshot(const QString& path, stmt::LedgerSnapshot& snapshot)
{
    std::string xml, err;
    if (!read_all(path, xml))
        return false;
    stmt::SnapshotReader reader;
    if (!reader.read_string(xml, snapshot, &err)) {
        qCritical("Snapshot error: %s", err.c_str());
        return false;
    }
    return true;
}

bool write_csv(const QString& path, const stmt::Batch& batch, const stmt::ExportOptions& opt)
{
    std::ofstream os(path.toStdString(), std::ios::binary);
    if (!os) {
        qCritical().noquote() << "Cannot create" << path;
        return false;
    }
    stmt::export_transactions_csv(batch, &os, nullptr, opt);
    os.flush();
    if (!os) {
        qCritical().noquote() << "Write error on" << path;
        return false;
    }
    qInfo().noquote() << "[INFO] Wrote" << batch.transactions.size() << "rows to" << path;
    return true;
}

bool load_options(const QCommandLineParser& cli, stmt::ParserOptions& opt)
{
    if (!cli.isSet("options"))
        return true;
    std::string err;
    stmt::OptionsReader reader;
    if (!reader.read_file(cli.value("options").toStdString(), opt, &err)) {
        qCritical("Options error: %s", err.c_str());
        return false;
    }
    return true;
}

int run_import(const QCommandLineParser& cli, const QStringList& args)
{
    if (args.size() < 3 || !cli.isSet("account")) {
        qCritical("usage: import <statement.txt> <snapshot.xml> --account <title> [--options x.xml] [--csv out.csv]");
        return 2;
    }

    stmt::ParserOptions opt;
    if (!load_options(cli, opt))
        return 1;

    std::string text;
    stmt::LedgerSnapshot snapshot;
    if (!read_all(args.at(1), text) || !load_snapshot(args.at(2), snapshot))
        return 1;

    stmt::ResolutionRequest req;
    req.account_title = cli.value("account").toStdString();

    stmt::Converter converter(opt);
    stmt::Batch batch;
    stmt::ConversionReport report;
    stmt::ResolutionError rerr;
    if (!converter.convert(text, snapshot, req, batch, &report, &rerr)) {
        qCritical("Conversion aborted: %s", rerr.message.c_str());
        return 1;
    }

    for (const auto& d : report.diagnostics) {
        qWarning().noquote() << "[SKIP]" << stmt::to_string(d.kind) << "@" << d.position
                             << S(d.reason) << "|" << S(d.raw);
    }
    qInfo().noquote() << "[INFO] anchors:" << report.anchors
                      << " segments:" << report.intermediates
                      << " records:" << report.assembled
                      << " skipped:" << stmt::total_skipped(report);

    for (const auto& line : stmt::preview_lines(batch, 10, opt.minor_unit_exponent))
        qInfo().noquote() << S(line);

    if (cli.isSet("csv")) {
        stmt::ExportOptions eopt;
        eopt.minor_unit_exponent = opt.minor_unit_exponent;
        if (!write_csv(cli.value("csv"), batch, eopt))
            return 1;
    }
    return 0;
}

int run_list_accounts(const QStringList& args)
{
    if (args.size() < 2) {
        qCritical("usage: list-accounts <snapshot.xml>");
        return 2;
    }
    stmt::LedgerSnapshot snapshot;
    if (!load_snapshot(args.at(1), snapshot))
        return 1;

    const auto rows = stmt::list_accounts(snapshot);
    qInfo().noquote() << "[INFO] Accounts:" << rows.size();
    for (const auto& r : rows) {
        qInfo().noquote() << S(r.title).leftJustified(30, QLatin1Char(' '))
                          << S(r.id).leftJustified(40, QLatin1Char(' '))
                          << S(r.currency);
    }
    return 0;
}

int run_delete(const QCommandLineParser& cli, const QStringList& args)
{
    if (args.size() < 2) {
        qCritical("usage: delete <snapshot.xml> [--account <title>] [--start-date D] [--end-date D] [--options x.xml] [--csv out.csv]");
        return 2;
    }
    if (!cli.isSet("account") && !cli.isSet("start-date") && !cli.isSet("end-date") && !cli.isSet("all")) {
        qCritical("Give --account, --start-date/--end-date or --all");
        return 2;
    }
    stmt::ParserOptions opt;
    stmt::LedgerSnapshot snapshot;
    if (!load_options(cli, opt) || !load_snapshot(args.at(1), snapshot))
        return 1;

    stmt::DeletionFilter filter;
    if (cli.isSet("account"))    filter.account_title = cli.value("account").toStdString();
    if (cli.isSet("start-date")) filter.start_date = cli.value("start-date").toStdString();
    if (cli.isSet("end-date"))   filter.end_date = cli.value("end-date").toStdString();

    stmt::Batch batch;
    stmt::ResolutionError rerr;
    if (!stmt::plan_deletion(snapshot, filter, stmt::unix_now(), batch, &rerr)) {
        qCritical("Deletion aborted: %s", rerr.message.c_str());
        return 1;
    }
    qInfo().noquote() << "[INFO] Transactions to delete:" << batch.transactions.size();

    if (cli.isSet("csv")) {
        stmt::ExportOptions eopt;
        eopt.minor_unit_exponent = opt.minor_unit_exponent;
        return write_csv(cli.value("csv"), batch, eopt) ? 0 : 1;
    }
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("statement-import-demo");

    QCommandLineParser cli;
    cli.setApplicationDescription("Bank statement text to ledger transactions (dry run, no network)");
    cli.addHelpOption();
    cli.addPositionalArgument("command", "import | list-accounts | delete");
    cli.addOptions({
        { "account",    "Ledger account title.", "title" },
        { "options",    "Parser options XML.", "file" },
        { "csv",        "Write the resulting batch as CSV.", "file" },
        { "start-date", "First date to delete (YYYY-MM-DD).", "date" },
        { "end-date",   "Last date to delete (YYYY-MM-DD).", "date" },
        { "all",        "Delete every live transaction." }
    });
    cli.process(app);

    const QStringList args = cli.positionalArguments();
    if (args.isEmpty())
        cli.showHelp(2);

    const QString command = args.first();
    if (command == "import")
        return run_import(cli, args);
    if (command == "list-accounts")
        return run_list_accounts(args);
    if (command == "delete")
        return run_delete(cli, args);

    qCritical().noquote() << "Unknown command" << command;
    return 2;
}
