/**
 * @file application.hpp
 * @date October 2026
 * @brief Точка сборки tornet: разбор аргументов, настройка, запуск сценария
 *
 * @details
 * Application::run() выполняет последовательность:
 *  1. Разбор командной строки и проверка интервала
 *  2. Загрузка настроек (значения по умолчанию, файл, --override)
 *  3. Настройка логгеров
 *  4. Установка обработчиков сигналов
 *  5. --stop или --ip как самостоятельные команды
 *  6. Проверка наличия tor и доступа в интернет
 *  7. Применение политики выходных узлов (--prefer-ru, --prefer-country)
 *  8. Запуск службы и ротация IP
 *
 * Фатальные ошибки (FatalError) логируются одной строкой CRITICAL и
 * превращаются в код завершения. Если завершение запрошено сигналом до
 * запуска службы, служба не запускается и run() возвращает 0.
 *
 * Системные зависимости берутся из Platform; по умолчанию это
 * SystemPlatform, создаваемая при первом обращении.
 */
#pragma once

#include <memory>

#include "../include/argumentparser.hpp"
#include "../include/cancellation_token.hpp"
#include "../include/configmanager.hpp"
#include "../include/platform.hpp"
#include "../include/rotation_interval.hpp"

class Application {
 public:
  static constexpr const char *kVersion = "2.2.1";

  Application() = default;
  explicit Application(std::unique_ptr<Platform> platform)
      : platform_(std::move(platform)) {}

  /**
   * @brief Выполнить программу
   * @return Код завершения процесса
   *
   * @code
   int main(int argc, char** argv) {
       Application app;
       return app.run(argc, argv);
   }
   @endcode
   */
  int run(int argc, char **argv);

  /// Токен, который срабатывает при SIGINT/SIGQUIT/SIGTERM
  CancellationToken &cancellation() { return cancel_; }

 private:
  void initLogger(const ParsedArgs &args, const ToolSettings &settings);
  int execute(const ParsedArgs &args, const ToolSettings &settings,
              const RotationConfig &rotation);

  static RotationConfig rotationFromArgs(const ParsedArgs &args);
  static void printBanner();
  static void printVersion();

  std::unique_ptr<Platform> platform_;
  CancellationToken cancel_;
};
