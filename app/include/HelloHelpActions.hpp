#ifndef HELLO_HELP_ACTIONS_HPP
#define HELLO_HELP_ACTIONS_HPP

#include <string>

class QWidget;

class HelloHelpActions {
public:
    static void show_about(QWidget* parent, const std::string& logo_path, const std::string& website);
};

#endif
