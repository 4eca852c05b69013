#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>

#include "cli/commands.hpp"
#include "cli/logging.hpp"
#include "config/key_store.hpp"
#include "crypto/keys.hpp"

#include <memory>

namespace {

int fail(const uuidv47::Error& error) {
    QTextStream(stderr) << "uuidv47: " << QString::fromStdString(error.message)
                        << QLatin1Char('\n');
    return uuidv47::cli::exit_code_for(error);
}

int print_lines(const QStringList& lines) {
    QTextStream out(stdout);
    for (const auto& line : lines) {
        out << line << QLatin1Char('\n');
    }
    return uuidv47::cli::EXIT_OK;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("uuidv47");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("uuidv47");
    app.setOrganizationDomain("uuidv47.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Mask UUIDv7 timestamps behind UUIDv4-shaped facades."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption keyOption(
        QStringList{QStringLiteral("k"), QStringLiteral("key")},
        QStringLiteral("Facade key as <k0>:<k1> (decimal or 0x-hex halves)."),
        QStringLiteral("key"));
    parser.addOption(keyOption);

    const QCommandLineOption settingsOption(
        QStringList{QStringLiteral("settings")},
        QStringLiteral("Use this INI file as the key store instead of the default settings."),
        QStringLiteral("file"));
    parser.addOption(settingsOption);

    const QCommandLineOption saveOption(
        QStringList{QStringLiteral("save")},
        QStringLiteral("With 'keygen': persist the new key to the key store."));
    parser.addOption(saveOption);

    const QCommandLineOption verboseOption(
        QStringList{QStringLiteral("v"), QStringLiteral("verbose")},
        QStringLiteral("Enable debug logging (also enabled by UUIDV47_DEBUG=1)."));
    parser.addOption(verboseOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("encode | decode | generate | keygen | inspect"));
    parser.addPositionalArgument(QStringLiteral("args"),
                                 QStringLiteral("Identifiers (read from stdin when omitted), or a count for 'generate'."),
                                 QStringLiteral("[args...]"));
    parser.process(app);

    uuidv47::cli::install_logging(parser.isSet(verboseOption));

    const auto init = uuidv47::crypto::init();
    if (init.is_err()) {
        qCCritical(uuidv47CliLog) << QString::fromStdString(init.unwrap_err().message);
        return fail(init.unwrap_err());
    }

    auto positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(uuidv47::cli::EXIT_USAGE);
    }
    const auto command = positional.takeFirst();

    const auto store = parser.isSet(settingsOption)
        ? std::make_unique<uuidv47::config::KeyStore>(parser.value(settingsOption))
        : std::make_unique<uuidv47::config::KeyStore>();
    qCDebug(uuidv47CliLog) << "command" << command << "key store" << store->location();

    if (command == QStringLiteral("encode") || command == QStringLiteral("decode")) {
        const auto key = uuidv47::cli::resolve_key(parser.value(keyOption), *store);
        if (key.is_err()) {
            return fail(key.unwrap_err());
        }

        QList<qsizetype> lines;
        if (positional.isEmpty()) {
            QTextStream in(stdin);
            positional = uuidv47::cli::read_ids(in, &lines);
        }

        const auto result = command == QStringLiteral("encode")
            ? uuidv47::cli::encode_all(positional, key.unwrap(), lines)
            : uuidv47::cli::decode_all(positional, key.unwrap(), lines);
        if (result.is_err()) {
            return fail(result.unwrap_err());
        }
        return print_lines(result.unwrap());
    }

    if (command == QStringLiteral("generate")) {
        const auto result = uuidv47::cli::generate(positional.value(0));
        if (result.is_err()) {
            return fail(result.unwrap_err());
        }
        return print_lines(result.unwrap());
    }

    if (command == QStringLiteral("keygen")) {
        const auto key = uuidv47::crypto::generate_key();
        if (parser.isSet(saveOption)) {
            const auto stored = store->store(key);
            if (stored.is_err()) {
                return fail(stored.unwrap_err());
            }
        }
        return print_lines({QString::fromStdString(uuidv47::crypto::to_string(key))});
    }

    if (command == QStringLiteral("inspect")) {
        QList<qsizetype> lines;
        if (positional.isEmpty()) {
            QTextStream in(stdin);
            positional = uuidv47::cli::read_ids(in, &lines);
        }
        const auto result = uuidv47::cli::inspect_all(positional, lines);
        if (result.is_err()) {
            return fail(result.unwrap_err());
        }
        return print_lines(result.unwrap());
    }

    qCWarning(uuidv47CliLog) << "unknown command" << command;
    QTextStream(stderr) << "uuidv47: unknown command '" << command << "'\n";
    return uuidv47::cli::EXIT_USAGE;
}
