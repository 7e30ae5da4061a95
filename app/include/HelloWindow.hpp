#ifndef HELLO_WINDOW_HPP
#define HELLO_WINDOW_HPP

#include "HelloSession.hpp"
#include "Types.hpp"

#include <QMainWindow>
#include <QPointer>

#include <map>
#include <memory>
#include <string>
#include <vector>

class QCheckBox;
class QComboBox;
class QEvent;
class QLabel;
class QPushButton;
class QStackedWidget;
class QWidget;

namespace spdlog { class logger; }

class HelloWindow : public QMainWindow
{
public:
    explicit HelloWindow(HelloSession& session, QWidget* parent = nullptr);
    ~HelloWindow() override;

    void run();
    void shutdown();

#ifdef DISTRO_HELLO_TEST_BUILD
    void test_select_locale(const LocaleId& locale);
    LocaleId test_selected_locale() const;
    int test_language_count() const;
    void test_toggle_autostart(bool checked);
    bool test_autostart_checked() const;
    void test_open_page(const PageId& page);
    void test_go_home();
    bool test_showing_home() const;
    QString test_page_text(const PageId& page) const;
    bool test_install_visible() const;
#endif

protected:
    void closeEvent(QCloseEvent* event) override;
    void changeEvent(QEvent* event) override;

private:
    friend class HelloUiBuilder;

    void connect_signals();
    void set_app_icon();
    void populate_languages();
    void sync_session_to_ui();
    void retranslate_ui();
    void refresh_pages();

    void on_language_selected(int index);
    void on_autostart_toggled(bool checked);
    void on_page_requested(const PageId& page);
    void on_home_requested();
    void on_link_clicked(const std::string& name);
    void on_install_clicked();
    void on_about_clicked();

    static QString page_title(const PageId& page);
    static QString link_title(const std::string& name);

    HelloSession& session;

    QPointer<QLabel> logo_label;
    QPointer<QLabel> welcome_title;
    QPointer<QLabel> welcome_label;
    QPointer<QLabel> subtitle_label;
    QPointer<QStackedWidget> stack;
    QPointer<QWidget> home_page;
    QPointer<QLabel> pages_heading;
    QPointer<QLabel> links_heading;
    QPointer<QLabel> install_label;
    QPointer<QPushButton> install_button;
    QPointer<QLabel> language_label;
    QPointer<QComboBox> language_selector;
    QPointer<QCheckBox> autostart_switch;
    QPointer<QPushButton> home_button;
    QPointer<QPushButton> about_button;

    std::map<PageId, QPointer<QPushButton>> page_buttons;
    std::map<PageId, QPointer<QLabel>> page_labels;
    std::map<PageId, int> page_indexes;
    std::map<std::string, QPointer<QPushButton>> link_buttons;
    int home_page_index_{0};

    std::shared_ptr<spdlog::logger> ui_logger;
    bool shut_down_{false};
};

#endif // HELLO_WINDOW_HPP
