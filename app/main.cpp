#include "AppException.hpp"
#include "HelloSession.hpp"
#include "HelloWindow.hpp"
#include "Logger.hpp"
#include "Preferences.hpp"
#include "TranslationManager.hpp"
#include <app_version.hpp>

#include <QApplication>
#include <QGuiApplication>
#include <QMessageBox>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <locale.h>
#include <vector>


bool initialize_loggers(bool verbose)
{
    try {
        Logger::setup_loggers(verbose);
        return true;
    } catch (const std::exception &e) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Failed to initialize loggers: {}", e.what());
        } else {
            std::fprintf(stderr, "Failed to initialize loggers: %s\n", e.what());
        }
        return false;
    }
}

namespace {

struct ParsedArguments {
    bool development_mode{false};
    std::vector<char*> qt_args;
};

ParsedArguments parse_command_line(int argc, char** argv)
{
    ParsedArguments parsed;
    parsed.qt_args.reserve(static_cast<size_t>(argc) + 1);

    for (int i = 0; i < argc; ++i) {
        const bool is_flag = (i > 0);
        if (is_flag && std::strcmp(argv[i], "--dev") == 0) {
            parsed.development_mode = true;
            continue;
        }
        parsed.qt_args.push_back(argv[i]);
    }
    parsed.qt_args.push_back(nullptr);
    return parsed;
}

int run_application(const ParsedArguments& parsed_args)
{
    setlocale(LC_ALL, "");

    QCoreApplication::setApplicationName(QString::fromUtf8(APP_ID));
    QGuiApplication::setApplicationDisplayName(QString::fromUtf8(APP_DISPLAY_NAME));

    int qt_argc = static_cast<int>(parsed_args.qt_args.size()) - 1;
    char** qt_argv = const_cast<char**>(parsed_args.qt_args.data());
    QApplication app(qt_argc, qt_argv);

    Preferences preferences;
    try {
        preferences = Preferences::load_for_mode(parsed_args.development_mode,
                                                 std::filesystem::current_path());
    } catch (const ErrorCodes::AppException& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Cannot start without preferences:\n{}", ex.get_full_details());
        }
        QMessageBox::critical(nullptr, QString::fromUtf8(APP_DISPLAY_NAME),
                              QString::fromStdString(ex.get_user_message()));
        return EXIT_FAILURE;
    }

    TranslationManager::instance().initialize(&app, preferences.locale_path, APP_ID);

    HelloSession session(preferences, HelloSession::system_environment(preferences),
                         [](const LocaleId& locale) {
                             TranslationManager::instance().set_locale(locale);
                         });
    session.start();

    HelloWindow window(session);
    window.run();

    const int result = app.exec();
    window.shutdown();
    return result;
}

} // namespace


int main(int argc, char **argv) {
    const ParsedArguments parsed_args = parse_command_line(argc, argv);

    if (!initialize_loggers(parsed_args.development_mode)) {
        return EXIT_FAILURE;
    }

    try {
        return run_application(parsed_args);
    } catch (const std::exception& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Error: {}", ex.what());
        } else {
            std::fprintf(stderr, "Error: %s\n", ex.what());
        }
        return EXIT_FAILURE;
    }
}
