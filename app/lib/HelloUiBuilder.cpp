#include "HelloUiBuilder.hpp"

#include "HelloWindow.hpp"
#include "Utils.hpp"

#include <QCheckBox>
#include <QComboBox>
#include <QFileInfo>
#include <QFont>
#include <QGridLayout>
#include <QHBoxLayout>
#include <QLabel>
#include <QPixmap>
#include <QPushButton>
#include <QScrollArea>
#include <QSizePolicy>
#include <QStackedWidget>
#include <QVBoxLayout>
#include <QWidget>

#include <app_version.hpp>

namespace {
constexpr int kLogoSize = 64;
constexpr int kPageMargin = 10;
constexpr int kLinkColumns = 3;
}

void HelloUiBuilder::build(HelloWindow& window) {
    window.setWindowTitle(QString::fromUtf8(APP_DISPLAY_NAME));
    window.resize(780, 560);

    QWidget* central = new QWidget(&window);
    auto* main_layout = new QVBoxLayout(central);
    main_layout->setContentsMargins(12, 12, 12, 12);
    main_layout->setSpacing(8);

    build_header(window, main_layout, central);

    window.stack = new QStackedWidget(central);
    main_layout->addWidget(window.stack, 1);
    build_home_page(window);
    build_content_pages(window);
    window.stack->setCurrentIndex(window.home_page_index_);

    build_footer(window, main_layout, central);
    window.setCentralWidget(central);
}

void HelloUiBuilder::build_header(HelloWindow& window, QBoxLayout* layout, QWidget* parent) {
    auto* header_layout = new QHBoxLayout();

    window.home_button = new QPushButton(parent);
    window.home_button->setIcon(icon_for(window, "go-home", QStyle::SP_ArrowBack));
    window.home_button->setEnabled(false);
    header_layout->addWidget(window.home_button);

    window.logo_label = new QLabel(parent);
    const QString logo_path = QString::fromStdString(window.session.preferences().logo_path);
    if (QFileInfo(logo_path).isFile()) {
        QPixmap logo(logo_path);
        if (!logo.isNull()) {
            window.logo_label->setPixmap(logo.scaled(kLogoSize, kLogoSize, Qt::KeepAspectRatio, Qt::SmoothTransformation));
        }
    }
    header_layout->addWidget(window.logo_label);

    auto* title_layout = new QVBoxLayout();
    window.welcome_title = new QLabel(parent);
    QFont title_font = window.welcome_title->font();
    title_font.setPointSizeF(title_font.pointSizeF() * 1.6);
    title_font.setBold(true);
    window.welcome_title->setFont(title_font);
    title_layout->addWidget(window.welcome_title);

    const LsbInfo lsb = Utils::read_lsb_release();
    window.subtitle_label = new QLabel(
        QString::fromStdString(lsb.codename + " " + lsb.release), parent);
    title_layout->addWidget(window.subtitle_label);
    header_layout->addLayout(title_layout, 1);

    window.about_button = new QPushButton(parent);
    window.about_button->setIcon(icon_for(window, "help-about", QStyle::SP_MessageBoxInformation));
    header_layout->addWidget(window.about_button);

    layout->addLayout(header_layout);
}

void HelloUiBuilder::build_home_page(HelloWindow& window) {
    window.home_page = new QWidget(window.stack);
    auto* home_layout = new QVBoxLayout(window.home_page);
    home_layout->setSpacing(10);

    window.welcome_label = new QLabel(window.home_page);
    window.welcome_label->setWordWrap(true);
    window.welcome_label->setTextFormat(Qt::RichText);
    home_layout->addWidget(window.welcome_label);

    window.pages_heading = new QLabel(window.home_page);
    home_layout->addWidget(window.pages_heading);
    auto* pages_layout = new QHBoxLayout();
    for (const PageId& page : window.session.pages()) {
        auto* button = new QPushButton(window.home_page);
        button->setObjectName(QString::fromStdString(page));
        button->setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Fixed);
        pages_layout->addWidget(button);
        window.page_buttons[page] = button;
    }
    home_layout->addLayout(pages_layout);

    window.links_heading = new QLabel(window.home_page);
    home_layout->addWidget(window.links_heading);
    auto* links_layout = new QGridLayout();
    int position = 0;
    for (const auto& [name, url] : window.session.preferences().urls) {
        auto* button = new QPushButton(window.home_page);
        button->setObjectName(QString::fromStdString(name));
        button->setToolTip(QString::fromStdString(url));
        button->setIcon(icon_for(window, "external-link", QStyle::SP_CommandLink));
        button->setLayoutDirection(Qt::RightToLeft);
        links_layout->addWidget(button, position / kLinkColumns, position % kLinkColumns);
        window.link_buttons[name] = button;
        ++position;
    }
    home_layout->addLayout(links_layout);

    auto* install_layout = new QHBoxLayout();
    window.install_label = new QLabel(window.home_page);
    window.install_button = new QPushButton(window.home_page);
    window.install_button->setIcon(icon_for(window, "system-software-install", QStyle::SP_DriveHDIcon));
    install_layout->addWidget(window.install_label, 1);
    install_layout->addWidget(window.install_button);
    home_layout->addLayout(install_layout);
    const bool live = window.session.is_live_session();
    window.install_label->setVisible(live);
    window.install_button->setVisible(live);

    home_layout->addStretch(1);
    window.home_page_index_ = window.stack->addWidget(window.home_page);
}

void HelloUiBuilder::build_content_pages(HelloWindow& window) {
    for (const PageId& page : window.session.pages()) {
        auto* scroll = new QScrollArea(window.stack);
        scroll->setWidgetResizable(true);
        auto* viewport = new QWidget(scroll);
        auto* viewport_layout = new QVBoxLayout(viewport);
        viewport_layout->setContentsMargins(kPageMargin, kPageMargin, kPageMargin, kPageMargin);
        auto* label = new QLabel(viewport);
        label->setWordWrap(true);
        label->setTextFormat(Qt::RichText);
        label->setOpenExternalLinks(true);
        label->setAlignment(Qt::AlignTop | Qt::AlignLeft);
        viewport_layout->addWidget(label);
        viewport_layout->addStretch(1);
        scroll->setWidget(viewport);
        window.page_labels[page] = label;
        window.page_indexes[page] = window.stack->addWidget(scroll);
    }
}

void HelloUiBuilder::build_footer(HelloWindow& window, QBoxLayout* layout, QWidget* parent) {
    auto* footer_layout = new QHBoxLayout();
    window.language_label = new QLabel(parent);
    window.language_selector = new QComboBox(parent);
    window.language_selector->setSizeAdjustPolicy(QComboBox::AdjustToContents);
    footer_layout->addWidget(window.language_label);
    footer_layout->addWidget(window.language_selector);
    footer_layout->addStretch(1);

    window.autostart_switch = new QCheckBox(parent);
    footer_layout->addWidget(window.autostart_switch);
    layout->addLayout(footer_layout);
}

QIcon HelloUiBuilder::icon_for(HelloWindow& window, const char* name, QStyle::StandardPixmap fallback) {
    const QString image = QString::fromStdString(window.session.preferences().image_path(name).string());
    if (QFileInfo(image).isFile()) {
        return QIcon(image);
    }
    QIcon icon = QIcon::fromTheme(QString::fromLatin1(name));
    if (icon.isNull()) {
        icon = window.style()->standardIcon(fallback);
    }
    return icon;
}
