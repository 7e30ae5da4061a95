#ifndef HELLO_UI_BUILDER_HPP
#define HELLO_UI_BUILDER_HPP

#include <QIcon>
#include <QStyle>

class HelloWindow;
class QBoxLayout;
class QWidget;

class HelloUiBuilder {
public:
    void build(HelloWindow& window);

private:
    void build_header(HelloWindow& window, QBoxLayout* layout, QWidget* parent);
    void build_home_page(HelloWindow& window);
    void build_content_pages(HelloWindow& window);
    void build_footer(HelloWindow& window, QBoxLayout* layout, QWidget* parent);
    QIcon icon_for(HelloWindow& window, const char* name, QStyle::StandardPixmap fallback);
};

#endif
