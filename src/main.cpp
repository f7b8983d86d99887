#include <signal.h>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTextStream>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include <plink/Client/LinkClient.hpp>
#include <plink/Version.hpp>
#include "core/LinkMonitor.hpp"
#include "core/YamlConfig.hpp"

namespace {

enum ExitCode {
    ExitOk = 0,
    ExitConfigError = 1,
    ExitPayloadError = 2,
    ExitRequestFailed = 3,
};

// QJsonDocument only accepts objects and arrays at the top level.
bool parsePayload(const QString& text, QJsonValue& out, QString& error)
{
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson("[" + text.toUtf8() + "]", &parseError);
    if (parseError.error != QJsonParseError::NoError || doc.array().size() != 1) {
        error = parseError.error != QJsonParseError::NoError
            ? parseError.errorString() : QStringLiteral("expected a single JSON value");
        return false;
    }
    out = doc.array().at(0);
    return true;
}

QString toLine(const plink::Message& message)
{
    return QString::fromUtf8(message.toJson());
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("paige-link");
    app.setApplicationVersion(plink::CLIENT_VERSION);
    app.setOrganizationName("Paige");

    QCommandLineParser parser;
    parser.setApplicationDescription("Connects to the Paige backend over WebSocket.");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOption("config", "YAML configuration file.", "file",
                                    QDir::homePath() + "/.paige/link.yaml");
    QCommandLineOption urlOption("url", "Backend WebSocket URL (overrides link.url).", "url");
    QCommandLineOption sendOption("send", "Send one message of this type and print the reply.",
                                  "type");
    QCommandLineOption payloadOption("payload", "JSON payload for --send.", "json", "{}");
    QCommandLineOption watchOption("watch", "Keep running and print every broadcast.");
    QCommandLineOption traceOption("trace", "Write all traffic to a TSV trace file.", "file");
    QCommandLineOption verboseOption({"v", "verbose"}, "Log message traffic.");
    parser.addOptions({configOption, urlOption, sendOption, payloadOption, watchOption,
                       traceOption, verboseOption});
    parser.process(app);

    boost::log::core::get()->set_filter(
        boost::log::trivial::severity >= (parser.isSet(verboseOption)
                                              ? boost::log::trivial::debug
                                              : boost::log::trivial::info));

    // A missing default file means built-in defaults; an explicit one must exist.
    paige::YamlConfig yamlConfig;
    const QString configPath = parser.value(configOption);
    if (parser.isSet(configOption) || QFile::exists(configPath)) {
        try {
            yamlConfig.load(configPath);
            BOOST_LOG_TRIVIAL(info) << "[main] Loaded " << configPath.toStdString();
        } catch (const YAML::Exception& e) {
            BOOST_LOG_TRIVIAL(error) << "[main] Cannot load " << configPath.toStdString()
                                     << ": " << e.what();
            return ExitConfigError;
        }
    }
    if (parser.isSet(urlOption))
        yamlConfig.setUrl(parser.value(urlOption));

    plink::ClientConfig clientConfig;
    try {
        clientConfig = yamlConfig.toClientConfig();
    } catch (const YAML::Exception& e) {
        BOOST_LOG_TRIVIAL(error) << "[main] Invalid configuration: " << e.what();
        return ExitConfigError;
    }

    QJsonValue payload;
    if (parser.isSet(sendOption)) {
        QString error;
        if (!parsePayload(parser.value(payloadOption), payload, error)) {
            BOOST_LOG_TRIVIAL(error) << "[main] Invalid --payload: " << error.toStdString();
            return ExitPayloadError;
        }
    }

    plink::LinkClient client(clientConfig);
    paige::LinkMonitor monitor;
    monitor.attach(&client);
    if (parser.isSet(traceOption) && !monitor.openTrace(parser.value(traceOption).toStdString()))
        return ExitConfigError;

    QTextStream out(stdout);
    const bool watch = parser.isSet(watchOption);

    if (watch) {
        QObject::connect(&client, &plink::LinkClient::broadcastReceived, &app,
                         [&out](const plink::Message& message) {
            out << toLine(message) << Qt::endl;
        });
    }

    if (parser.isSet(sendOption)) {
        // Queued until the handshake has gone out.
        const QString type = parser.value(sendOption);
        client.send(type, payload)
            .then(&app, [&out, &app, watch](const plink::SendResult& result) {
                if (result)
                    out << toLine(*result) << Qt::endl;
                if (!watch)
                    app.exit(ExitOk);
            })
            .onFailed(&app, [&app](const plink::LinkError& e) {
                BOOST_LOG_TRIVIAL(error) << "[main] Request failed: " << e.message().toStdString();
                app.exit(ExitRequestFailed);
            });
    } else if (!watch) {
        // Plain connectivity probe: done once the handshake is out.
        client.onStatusChange([&app](plink::ConnectionStatus status, int) {
            if (status == plink::ConnectionStatus::Connected)
                QMetaObject::invokeMethod(&app, [&app]() { app.exit(ExitOk); },
                                          Qt::QueuedConnection);
        });
    }

    static QCoreApplication* g_app = &app;
    auto quit = [](int) {
        QMetaObject::invokeMethod(g_app, []() { g_app->quit(); }, Qt::QueuedConnection);
    };
    signal(SIGINT, quit);
    signal(SIGTERM, quit);

    client.connect();
    int ret = app.exec();

    monitor.detach();
    client.disconnect();
    BOOST_LOG_TRIVIAL(debug) << "[main] " << monitor.outboundCount() << " sent, "
                             << monitor.inboundCount() << " broadcast(s) received";
    return ret;
}
