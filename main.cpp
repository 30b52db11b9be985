/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#include "console_observer.h"
#include "lanxfer_config.h"
#include "lanxfer_debug.h"
#include "transfer_sender.h"
#include "transfer_server.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFileInfo>
#include <QHostAddress>
#include <QTextStream>

#include <KLocalizedString>

namespace {

constexpr int EXIT_USAGE = 2;

int usageError(const QCommandLineParser &parser, const QString &message)
{
    QTextStream err(stderr);
    err << message << '\n' << '\n' << parser.helpText();
    return EXIT_USAGE;
}

int runSend(const QString &path, const QHostAddress &target, const QHostAddress &local,
            const TransferConfig &config)
{
    ConsoleObserver observer;
    TransferSender sender(config, &observer);

    const bool ok = QFileInfo(path).isDir() ? sender.sendDirectory(path, target, local)
                                            : sender.sendFile(path, target, local);
    return ok ? 0 : 1;
}

int runReceive(const QHostAddress &local, const TransferConfig &config)
{
    ConsoleObserver observer;
    TransferServer server(config, &observer);

    if (!server.start(local, config.port)) {
        return 1;
    }
    observer.statusMessage(StatusLevel::Info, i18n("Saving into %1. Type q and Enter to stop.",
                                                   QFileInfo(config.receivedDir).absoluteFilePath()));

    QTextStream in(stdin);
    for (;;) {
        const QString line = in.readLine();
        if (line.isNull() || line.trimmed().compare(QLatin1String("q"), Qt::CaseInsensitive) == 0) {
            break;
        }
    }

    server.stop();
    if (!server.waitForHandlers(0)) {
        observer.statusMessage(StatusLevel::Info, i18n("Waiting for transfers in progress..."));
        server.waitForHandlers();
    }

    const QList<FailedValidation> late = server.takeFailedValidations();
    if (!late.isEmpty()) {
        observer.validationSummary(late);
    }
    return 0;
}

} // namespace

int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("lanxfer"));
    app.setApplicationVersion(QStringLiteral("1.0"));
    KLocalizedString::setApplicationDomain("lanxfer");

    QCommandLineParser parser;
    parser.setApplicationDescription(i18n("Send files and directories to another machine on the local network"));
    const QCommandLineOption helpOption = parser.addHelpOption();
    const QCommandLineOption versionOption = parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"), i18n("\"send\" or \"receive\""));
    parser.addPositionalArgument(QStringLiteral("path"), i18n("File or directory to send"), QStringLiteral("[path]"));

    const QCommandLineOption targetOption({QStringLiteral("t"), QStringLiteral("target")},
                                          i18n("Receiver IP address"), QStringLiteral("address"));
    const QCommandLineOption localOption({QStringLiteral("l"), QStringLiteral("local")},
                                         i18n("Local interface address to bind"), QStringLiteral("address"));
    const QCommandLineOption configOption({QStringLiteral("c"), QStringLiteral("config")},
                                          i18n("JSON configuration file"), QStringLiteral("file"));
    parser.addOption(targetOption);
    parser.addOption(localOption);
    parser.addOption(configOption);

    if (!parser.parse(app.arguments())) {
        return usageError(parser, parser.errorText());
    }
    if (parser.isSet(helpOption)) {
        parser.showHelp(0);
    }
    if (parser.isSet(versionOption)) {
        parser.showVersion();
    }

    TransferConfig config;
    if (parser.isSet(configOption)) {
        QString error;
        if (!loadTransferConfig(parser.value(configOption), config, error)) {
            QTextStream(stderr) << i18n("Invalid configuration: %1", error) << '\n';
            return 1;
        }
    }

    QHostAddress local;
    if (parser.isSet(localOption) && !local.setAddress(parser.value(localOption))) {
        return usageError(parser, i18n("Not an IP address: %1", parser.value(localOption)));
    }

    const QStringList args = parser.positionalArguments();
    const QString command = args.value(0);
    qCDebug(LANXFER_LOG) << "Command" << command << "port" << config.port;

    if (command == QLatin1String("send")) {
        if (args.size() != 2) {
            return usageError(parser, i18n("send needs exactly one path"));
        }
        QHostAddress target;
        if (!parser.isSet(targetOption)) {
            return usageError(parser, i18n("send needs --target"));
        }
        if (!target.setAddress(parser.value(targetOption))) {
            return usageError(parser, i18n("Not an IP address: %1", parser.value(targetOption)));
        }
        return runSend(args.at(1), target, local, config);
    }

    if (command == QLatin1String("receive")) {
        if (args.size() != 1) {
            return usageError(parser, i18n("receive takes no path"));
        }
        return runReceive(local.isNull() ? QHostAddress(QHostAddress::Any) : local, config);
    }

    return usageError(parser, command.isEmpty() ? i18n("No command given") : i18n("Unknown command: %1", command));
}
