#include "core/application.h"
#include <iostream>
#include <exception>

int main(int argc, char* argv[]) {
    try {
        core::Application app(argc, argv);
        return app.run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return -1;
    } catch (...) {
        std::cerr << "Unknown Fatal Error" << std::endl;
        return -1;
    }
}
