#ifndef TRANSLATIONMANAGER_HPP
#define TRANSLATIONMANAGER_HPP

#include "Types.hpp"

#include <QObject>
#include <QTranslator>
#include <memory>
#include <string>

class QApplication;

/**
 * @brief Owns the process-wide gettext domain and the Qt bridge translator.
 *
 * gettext catalogs are the single source of translations: widget strings
 * passed through tr() are looked up in the same domain as _() strings.
 */
class TranslationManager : public QObject
{
public:
    static TranslationManager& instance();

    void initialize(QApplication* app, const std::string& locale_path, const std::string& domain);
    void set_locale(const LocaleId& locale);
    LocaleId current_locale() const;
    const std::string& domain() const { return domain_; }

private:
    class GettextTranslator;

    TranslationManager();

    QApplication* app_{nullptr};
    std::unique_ptr<GettextTranslator> translator_;
    std::string domain_;
    LocaleId current_locale_;
};

#endif // TRANSLATIONMANAGER_HPP
