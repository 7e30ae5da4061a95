#include "HelloHelpActions.hpp"

#include <app_version.hpp>

#include <QDialog>
#include <QDialogButtonBox>
#include <QLabel>
#include <QPixmap>
#include <QTabWidget>
#include <QVBoxLayout>
#include <QString>

void HelloHelpActions::show_about(QWidget* parent, const std::string& logo_path, const std::string& website)
{
    QDialog dialog(parent);
    dialog.setWindowTitle(QObject::tr("About %1").arg(QString::fromUtf8(APP_DISPLAY_NAME)));
    dialog.resize(480, 360);

    auto* layout = new QVBoxLayout(&dialog);
    auto* tabs = new QTabWidget(&dialog);
    layout->addWidget(tabs);

    auto* about_tab = new QWidget(&dialog);
    auto* about_layout = new QVBoxLayout(about_tab);
    about_layout->setSpacing(8);

    if (QPixmap logo_pix(QString::fromStdString(logo_path)); !logo_pix.isNull()) {
        auto* logo_label = new QLabel(about_tab);
        logo_label->setAlignment(Qt::AlignHCenter);
        logo_label->setPixmap(logo_pix.scaled(128, 128, Qt::KeepAspectRatio, Qt::SmoothTransformation));
        about_layout->addWidget(logo_label);
    }

    auto* program_name = new QLabel(QStringLiteral("<h2>%1</h2>").arg(QString::fromUtf8(APP_DISPLAY_NAME)), about_tab);
    program_name->setAlignment(Qt::AlignHCenter);
    about_layout->addWidget(program_name);

    const QString version_text = QObject::tr("Version: %1").arg(QString::fromUtf8(APP_VERSION_STRING));
    auto* version_label = new QLabel(version_text, about_tab);
    version_label->setAlignment(Qt::AlignHCenter);
    about_layout->addWidget(version_label);

    auto* comments_label = new QLabel(
        QObject::tr("Welcome screen that helps you get started with your new system."), about_tab);
    comments_label->setAlignment(Qt::AlignHCenter);
    comments_label->setWordWrap(true);
    about_layout->addWidget(comments_label);

    if (!website.empty()) {
        auto* website_label = new QLabel(QStringLiteral("<a href=\"%1\">%2</a>")
                                             .arg(QString::fromStdString(website), QObject::tr("Visit the website")),
                                         about_tab);
        website_label->setOpenExternalLinks(true);
        website_label->setAlignment(Qt::AlignHCenter);
        about_layout->addWidget(website_label);
    }

    about_layout->addStretch(1);
    tabs->addTab(about_tab, QObject::tr("About"));

    auto* credits_tab = new QWidget(&dialog);
    auto* credits_layout = new QVBoxLayout(credits_tab);
    auto* credits_label = new QLabel(
        QObject::tr("Translations are provided by the community through gettext catalogs."), credits_tab);
    credits_label->setWordWrap(true);
    credits_label->setAlignment(Qt::AlignHCenter);
    credits_layout->addWidget(credits_label);
    credits_layout->addStretch(1);
    tabs->addTab(credits_tab, QObject::tr("Credits"));

    auto* button_box = new QDialogButtonBox(QDialogButtonBox::Close, &dialog);
    QObject::connect(button_box, &QDialogButtonBox::rejected, &dialog, &QDialog::accept);
    layout->addWidget(button_box);

    dialog.exec();
}
