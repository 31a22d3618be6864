/*!
  \file main.cpp
  \brief Точка входа контроллера перезагрузки
  \details Создаёт ServiceController и передаёт ему аргументы командной строки.
*/

#include "../include/service_controller.hpp"

int main(int argc, char** argv) {
    ServiceController controller;
    return controller.run(argc, argv);
}
