/*!
  \file tornet.cpp
  \date October 2026
  \brief Основной файл проекта tornet.
  \details Функция основной точки входа в программу.
*/

#include "../include/application.hpp"

int main(int argc, char** argv) {
    Application app;
    return app.run(argc, argv);
}
