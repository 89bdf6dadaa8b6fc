#include <string>
#include <vector>

#include "app/LexTableApp.hpp"

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    lextable::app::LexTableApp app;
    return app.Run(args);
}
