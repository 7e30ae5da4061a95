#include "TranslationManager.hpp"
#include "LocaleResolver.hpp"
#include "Logger.hpp"

#include <QApplication>
#include <QCoreApplication>
#include <QEvent>
#include <QString>

#include <cstdlib>
#include <cstring>
#include <libintl.h>

class TranslationManager::GettextTranslator : public QTranslator
{
public:
    explicit GettextTranslator(QObject* parent = nullptr)
        : QTranslator(parent)
    {}

    void set_domain(const std::string& domain)
    {
        domain_ = domain;
    }

    bool isEmpty() const override
    {
        return domain_.empty();
    }

    QString translate(const char* context, const char* sourceText, const char* disambiguation, int n) const override
    {
        Q_UNUSED(context)
        Q_UNUSED(disambiguation)
        Q_UNUSED(n)

        if (!sourceText || domain_.empty()) {
            return QString();
        }

        const char* translated = dgettext(domain_.c_str(), sourceText);
        if (translated == sourceText || std::strcmp(translated, sourceText) == 0) {
            return QString();
        }
        return QString::fromUtf8(translated);
    }

private:
    std::string domain_;
};

TranslationManager::TranslationManager() = default;

TranslationManager& TranslationManager::instance()
{
    static TranslationManager manager;
    return manager;
}

void TranslationManager::initialize(QApplication* app, const std::string& locale_path, const std::string& domain)
{
    app_ = app;
    domain_ = domain;

    bindtextdomain(domain_.c_str(), locale_path.c_str());
    bind_textdomain_codeset(domain_.c_str(), "UTF-8");
    textdomain(domain_.c_str());

    if (!translator_) {
        translator_ = std::make_unique<GettextTranslator>();
    }
    translator_->set_domain(domain_);
    if (app_) {
        app_->removeTranslator(translator_.get());
        app_->installTranslator(translator_.get());
    }
}

void TranslationManager::set_locale(const LocaleId& locale)
{
    // gettext picks the catalog from LANGUAGE; textdomain() flushes its lookup cache.
    // Catalog directories may use either spelling, so both are listed.
    std::string language = LocaleResolver::normalize(locale);
    const LocaleId posix = LocaleResolver::to_posix(locale);
    if (posix != language) {
        language += ":" + posix;
    }
    setenv("LANGUAGE", language.c_str(), 1);
    if (!domain_.empty()) {
        textdomain(domain_.c_str());
    }
    current_locale_ = locale;

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Active locale set to '{}'", locale);
    }

    if (!app_) {
        return;
    }

    // QApplication forwards this as one posted LanguageChange per top-level widget.
    QEvent event(QEvent::LanguageChange);
    QCoreApplication::sendEvent(app_, &event);
}

LocaleId TranslationManager::current_locale() const
{
    return current_locale_;
}
