#include "HelloWindow.hpp"

#include "ErrorMessages.hpp"
#include "HelloHelpActions.hpp"
#include "HelloUiBuilder.hpp"
#include "Language.hpp"
#include "Logger.hpp"

#include <QApplication>
#include <QCheckBox>
#include <QCloseEvent>
#include <QComboBox>
#include <QDesktopServices>
#include <QEvent>
#include <QIcon>
#include <QLabel>
#include <QMessageBox>
#include <QProcess>
#include <QPushButton>
#include <QSignalBlocker>
#include <QStackedWidget>
#include <QString>
#include <QUrl>

#include <app_version.hpp>

HelloWindow::HelloWindow(HelloSession& session, QWidget* parent)
    : QMainWindow(parent),
      session(session),
      ui_logger(Logger::get_logger("ui_logger"))
{
    HelloUiBuilder ui_builder;
    ui_builder.build(*this);
    populate_languages();
    sync_session_to_ui();
    retranslate_ui();
    connect_signals();
    set_app_icon();
}


HelloWindow::~HelloWindow() = default;


void HelloWindow::run()
{
    show();
}


void HelloWindow::shutdown()
{
    if (shut_down_) {
        return;
    }
    shut_down_ = true;
    if (!session.shutdown() && ui_logger) {
        ui_logger->warn("Language choice could not be saved");
    }
}


void HelloWindow::connect_signals()
{
    connect(home_button, &QPushButton::clicked, this, &HelloWindow::on_home_requested);
    connect(about_button, &QPushButton::clicked, this, &HelloWindow::on_about_clicked);
    connect(install_button, &QPushButton::clicked, this, &HelloWindow::on_install_clicked);
    connect(autostart_switch, &QCheckBox::toggled, this, &HelloWindow::on_autostart_toggled);
    connect(language_selector, qOverload<int>(&QComboBox::currentIndexChanged),
            this, &HelloWindow::on_language_selected);

    for (const auto& [page, button] : page_buttons) {
        const PageId id = page;
        connect(button, &QPushButton::clicked, this, [this, id]() {
            on_page_requested(id);
        });
    }
    for (const auto& [name, button] : link_buttons) {
        const std::string key = name;
        connect(button, &QPushButton::clicked, this, [this, key]() {
            on_link_clicked(key);
        });
    }
}


void HelloWindow::set_app_icon()
{
    const QIcon icon(QString::fromStdString(session.preferences().logo_path));
    if (!icon.isNull()) {
        QApplication::setWindowIcon(icon);
        setWindowIcon(icon);
    }
}


void HelloWindow::populate_languages()
{
    const QSignalBlocker blocker(language_selector);
    language_selector->clear();
    for (const LocaleId& locale : session.available_locales()) {
        language_selector->addItem(languageDisplayName(locale), QString::fromStdString(locale));
    }
}


void HelloWindow::sync_session_to_ui()
{
    {
        const QSignalBlocker blocker(language_selector);
        const int index = language_selector->findData(QString::fromStdString(session.current_locale()));
        if (index >= 0) {
            language_selector->setCurrentIndex(index);
        }
    }
    {
        const QSignalBlocker blocker(autostart_switch);
        autostart_switch->setChecked(session.autostart_enabled());
    }
}


void HelloWindow::retranslate_ui()
{
    setWindowTitle(QString::fromUtf8(APP_DISPLAY_NAME));

    if (welcome_title) {
        welcome_title->setText(tr("Welcome!"));
    }
    if (welcome_label) {
        welcome_label->setText(tr("Thank you for joining our community!<br><br>"
                                  "We, the developers, hope you will enjoy using this system as much as we enjoy "
                                  "building it. The links below will help you get started with your new operating "
                                  "system. So enjoy the experience, and don't hesitate to send us your feedback."));
    }
    if (pages_heading) {
        pages_heading->setText(tr("<b>Documentation</b>"));
    }
    if (links_heading) {
        links_heading->setText(tr("<b>Support</b>"));
    }
    if (install_label) {
        install_label->setText(tr("<b>Installation</b>"));
    }
    if (install_button) {
        install_button->setText(tr("Launch installer"));
    }
    if (language_label) {
        language_label->setText(tr("Language:"));
    }
    if (autostart_switch) {
        autostart_switch->setText(tr("Launch at start"));
    }
    if (home_button) {
        home_button->setToolTip(tr("Home"));
    }
    if (about_button) {
        about_button->setToolTip(tr("About"));
    }

    for (const auto& [page, button] : page_buttons) {
        if (button) {
            button->setText(page_title(page));
        }
    }
    for (const auto& [name, button] : link_buttons) {
        if (button) {
            button->setText(link_title(name));
        }
    }

    refresh_pages();
}


void HelloWindow::refresh_pages()
{
    for (const auto& [page, label] : page_labels) {
        if (label) {
            label->setText(QString::fromStdString(session.page_text(page)));
        }
    }
}


void HelloWindow::on_language_selected(int index)
{
    if (index < 0) {
        return;
    }
    const std::string requested = language_selector->itemData(index).toString().toStdString();
    const LocaleId active = session.change_locale(requested);
    if (ui_logger) {
        ui_logger->info("Language selected: '{}', active: '{}'", requested, active);
    }
    // An accepted locale comes back through changeEvent(LanguageChange).
    if (active != requested) {
        sync_session_to_ui();
        retranslate_ui();
    }
}


void HelloWindow::on_autostart_toggled(bool checked)
{
    const AutostartResult result = session.set_autostart(checked);
    {
        const QSignalBlocker blocker(autostart_switch);
        autostart_switch->setChecked(session.autostart_enabled());
    }
    if (result) {
        return;
    }
    if (ui_logger) {
        ui_logger->error("Autostart change to {} failed: {}", checked, result.detail);
    }
    QMessageBox::warning(this, QString::fromUtf8(APP_DISPLAY_NAME),
                         QString::fromUtf8(ERR_AUTOSTART_FAILED) + QStringLiteral("\n\n")
                             + QString::fromStdString(result.detail));
}


void HelloWindow::on_page_requested(const PageId& page)
{
    const auto it = page_indexes.find(page);
    if (it == page_indexes.end()) {
        return;
    }
    stack->setCurrentIndex(it->second);
    home_button->setEnabled(true);
}


void HelloWindow::on_home_requested()
{
    stack->setCurrentIndex(home_page_index_);
    home_button->setEnabled(false);
}


void HelloWindow::on_link_clicked(const std::string& name)
{
    const auto url = session.url_for(name);
    if (!url) {
        if (ui_logger) {
            ui_logger->warn("No URL configured for link '{}'", name);
        }
        QMessageBox::information(this, QString::fromUtf8(APP_DISPLAY_NAME), QString::fromUtf8(ERR_LINK_UNAVAILABLE));
        return;
    }
    if (!QDesktopServices::openUrl(QUrl(QString::fromStdString(*url))) && ui_logger) {
        ui_logger->warn("Failed to open {}", *url);
    }
}


void HelloWindow::on_install_clicked()
{
    const QString installer = QString::fromStdString(session.preferences().installer_path);
    if (QProcess::startDetached(installer, {})) {
        if (ui_logger) {
            ui_logger->info("Installer started: {}", installer.toStdString());
        }
        return;
    }
    if (ui_logger) {
        ui_logger->error("Failed to start installer {}", installer.toStdString());
    }
    QMessageBox::warning(this, QString::fromUtf8(APP_DISPLAY_NAME), QString::fromUtf8(ERR_INSTALLER_LAUNCH_FAILED));
}


void HelloWindow::on_about_clicked()
{
    HelloHelpActions::show_about(this, session.preferences().logo_path,
                                 session.url_for("home").value_or(std::string()));
}


QString HelloWindow::page_title(const PageId& page)
{
    if (page == "readme") {
        return tr("Read me");
    }
    if (page == "release") {
        return tr("Release info");
    }
    if (page == "involved") {
        return tr("Get involved");
    }
    QString title = QString::fromStdString(page);
    if (!title.isEmpty()) {
        title[0] = title[0].toUpper();
    }
    return title;
}


QString HelloWindow::link_title(const std::string& name)
{
    if (name == "wiki") {
        return tr("Wiki");
    }
    if (name == "forum") {
        return tr("Forum");
    }
    if (name == "chat") {
        return tr("Chat room");
    }
    if (name == "mailling") {
        return tr("Mailling lists");
    }
    if (name == "development") {
        return tr("Development");
    }
    if (name == "donate") {
        return tr("Donate");
    }
    if (name == "home") {
        return tr("Website");
    }
    return QString::fromStdString(name);
}


#ifdef DISTRO_HELLO_TEST_BUILD
void HelloWindow::test_select_locale(const LocaleId& locale)
{
    const int index = language_selector->findData(QString::fromStdString(locale));
    language_selector->setCurrentIndex(index);
}

LocaleId HelloWindow::test_selected_locale() const
{
    return language_selector->currentData().toString().toStdString();
}

int HelloWindow::test_language_count() const
{
    return language_selector->count();
}

void HelloWindow::test_toggle_autostart(bool checked)
{
    autostart_switch->setChecked(checked);
}

bool HelloWindow::test_autostart_checked() const
{
    return autostart_switch && autostart_switch->isChecked();
}

void HelloWindow::test_open_page(const PageId& page)
{
    if (auto it = page_buttons.find(page); it != page_buttons.end() && it->second) {
        it->second->click();
    }
}

void HelloWindow::test_go_home()
{
    home_button->click();
}

bool HelloWindow::test_showing_home() const
{
    return stack->currentIndex() == home_page_index_;
}

QString HelloWindow::test_page_text(const PageId& page) const
{
    const auto it = page_labels.find(page);
    return (it != page_labels.end() && it->second) ? it->second->text() : QString();
}

bool HelloWindow::test_install_visible() const
{
    return install_button && !install_button->isHidden();
}
#endif


void HelloWindow::changeEvent(QEvent* event)
{
    if (event && event->type() == QEvent::LanguageChange) {
        retranslate_ui();
    }
    QMainWindow::changeEvent(event);
}


void HelloWindow::closeEvent(QCloseEvent* event)
{
    shutdown();
    QMainWindow::closeEvent(event);
}
