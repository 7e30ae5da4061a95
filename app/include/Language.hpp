#ifndef LANGUAGE_HPP
#define LANGUAGE_HPP

#include "Types.hpp"

#include <QString>

#include <array>
#include <string_view>

struct LanguageName {
    std::string_view id;
    const char* native_name;
};

inline constexpr std::array<LanguageName, 24> kLanguageNames{{
    {"ar", "العربية"},
    {"ca", "Català"},
    {"cs", "Čeština"},
    {"da", "Dansk"},
    {"de", "Deutsch"},
    {"el", "Ελληνικά"},
    {"en", "English"},
    {"en-GB", "English (UK)"},
    {"es", "Español"},
    {"fi", "Suomi"},
    {"fr", "Français"},
    {"hu", "Magyar"},
    {"it", "Italiano"},
    {"ja", "日本語"},
    {"nl", "Nederlands"},
    {"pl", "Polski"},
    {"pt", "Português"},
    {"pt-BR", "Português (Brasil)"},
    {"ru", "Русский"},
    {"sv", "Svenska"},
    {"tr", "Türkçe"},
    {"uk", "Українська"},
    {"zh-CN", "中文 (简体)"},
    {"zh-TW", "中文 (繁體)"}
}};

// Native name for the language selector; the id itself when the language is not listed.
inline QString languageDisplayName(const LocaleId& id)
{
    for (const auto& entry : kLanguageNames) {
        if (entry.id == id) {
            return QString::fromUtf8(entry.native_name);
        }
    }
    return QString::fromStdString(id);
}

#endif // LANGUAGE_HPP
