#include <exception>
#include <iostream>

#include "isocal/application/date_calc_app.h"

int main(int argc, char* argv[]) {
    try {
        isocal::application::DateCalcApp app(std::cout);
        return app.run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "!! 关键错误: " << e.what() << std::endl;
        return static_cast<int>(isocal::application::ExitStatus::UNEXPECTED_ERROR);
    }
}
