#include <QCoreApplication>
#include <QCommandLineParser>
#include <QFile>
#include <QJsonDocument>
#include <QTextStream>

#include "config/config_store.h"
#include "core/bootstrap.h"
#include "core/log_manager.h"
#include "pipeline/safety_pipeline.h"
#include "safety/codec.h"

namespace {

enum ExitCode { Ok = 0, Failed = 1, Usage = 2, StartupFailed = 3 };

void writeJson(const QJsonObject& obj) {
    QTextStream out(stdout);
    out << QJsonDocument(obj).toJson(QJsonDocument::Indented);
}

int fail(const SafetyFailure& failure) {
    QTextStream err(stderr);
    err << QJsonDocument(failure.toJson()).toJson(QJsonDocument::Compact) << "\n";
    return Failed;
}

Result<QByteArray> readInput(const QString& path) {
    QFile file;
    bool opened = false;
    if (path.isEmpty() || path == QStringLiteral("-")) {
        opened = file.open(stdin, QIODevice::ReadOnly);
    } else {
        file.setFileName(path);
        opened = file.open(QIODevice::ReadOnly);
    }
    if (!opened)
        return std::unexpected(SafetyFailure::invalidInput(
            "unreadable_input", QStringLiteral("cannot read %1").arg(path.isEmpty() ? QStringLiteral("stdin") : path)));
    return file.readAll();
}

int runFilter(const Bootstrap& boot, const QStringList& args, bool raw) {
    auto input = readInput(args.value(0));
    if (!input) return fail(input.error());

    CandidateResponse candidate;
    if (raw) {
        PipelineOptions options;
        options.appendTruncationDisclaimer = boot.appendTruncationDisclaimer();
        SafetyPipeline pipeline(boot.filter(), nullptr,
                                RegenerationPolicy(boot.maxBoundaryRegenerations()), options);
        GeneratedOutput output;
        output.rawText = QString::fromUtf8(*input);
        candidate = pipeline.toCandidate(output);
    } else {
        auto decoded = Codec::decodeCandidate(*input);
        if (!decoded) {
            writeJson(Codec::encodeFiltered(boot.filter()->blockMalformed(decoded.error())));
            return Ok;
        }
        candidate = *decoded;
    }

    const FilteredResponse response = boot.filter()->filter(candidate);
    writeJson(Codec::encodeFiltered(response));
    return Ok;
}

int runSanitize(const Bootstrap& boot, const QStringList& args) {
    QString query = args.join(QLatin1Char(' '));
    if (args.isEmpty()) {
        auto input = readInput(QString());
        if (!input) return fail(input.error());
        query = QString::fromUtf8(*input);
    }

    auto sanitized = boot.filter()->sanitizeInput(query);
    if (!sanitized) return fail(sanitized.error());

    QJsonObject obj = Codec::encodeSanitized(*sanitized);
    obj["wrapped"] = InputSanitizer::wrapForPrompt(sanitized->text);
    writeJson(obj);
    return Ok;
}

}

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("medguard"));
    app.setApplicationVersion(QStringLiteral("1.0.0"));
    app.setOrganizationName(QStringLiteral("MedGuard"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Output safety filter for patient-facing answers."));
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOpt(QStringList{"c", "config"}, "Configuration file.", "path");
    QCommandLineOption logDirOpt("log-dir", "Write medguard.log into this directory.", "dir");
    QCommandLineOption rawOpt("raw", "Input is raw generator output starting with a BOUNDARY_CHECK line.");
    QCommandLineOption debugOpt("debug", "Log at debug level.");
    parser.addOptions({configOpt, logDirOpt, rawOpt, debugOpt});
    parser.addPositionalArgument("command", "filter | sanitize");
    parser.addPositionalArgument("args", "filter: [file|-]  sanitize: <query...>", "[args...]");
    parser.process(app);

    QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(Usage);
    }
    const QString command = args.takeFirst();

    // --- 1. Config ---
    ConfigStore configStore;
    if (parser.isSet(configOpt) && !configStore.load(parser.value(configOpt))) {
        QTextStream(stderr) << "medguard: cannot load config " << parser.value(configOpt) << "\n";
        return Usage;
    }
    QVariantMap runtime;
    if (parser.isSet(logDirOpt))
        runtime["log_dir"] = parser.value(logDirOpt);
    if (parser.isSet(debugOpt))
        runtime["debug_mode"] = true;
    if (!runtime.isEmpty())
        configStore.setRuntimeOptions(runtime, false);

    // --- 2. Bootstrap ---
    Bootstrap boot;
    boot.setConfig(&configStore);
    QObject::connect(&boot, &Bootstrap::stepProgress,
                     [](const QString& step, bool success, const QString& message) {
        if (!success)
            QTextStream(stderr) << "medguard: " << step << ": " << message << "\n";
    });
    if (!boot.start())
        return StartupFailed;

    // --- 3. Command ---
    int code = Usage;
    if (command == QStringLiteral("filter")) {
        code = runFilter(boot, args, parser.isSet(rawOpt));
    } else if (command == QStringLiteral("sanitize")) {
        code = runSanitize(boot, args);
    } else {
        QTextStream(stderr) << "medguard: unknown command " << command << "\n";
    }

    boot.stop();
    return code;
}
