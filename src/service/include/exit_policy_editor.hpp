/**
 * @file exit_policy_editor.hpp
 * @date October 2026
 * @brief Запись политики выходных узлов в torrc
 *
 * @details Редактор выполняет read-modify-write всего файла:
 *  1. Читает все строки
 *  2. Удаляет строки, которые после обрезки пробелов начинаются с ExitNodes
 *     или StrictNodes, а также собственный маркер от прошлых запусков
 *  3. Дописывает маркер, ExitNodes (если список стран не пуст) и StrictNodes
 *  4. Перезаписывает файл
 *
 * Остальные строки сохраняются без изменений. Повторная запись той же
 * политики даёт побайтно идентичный файл.
 */
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "exit_policy.hpp"

class ExitPolicyEditor {
 public:
  static constexpr const char* kMarker = "# --- tornet exit policy ---";
  static constexpr const char* kExitNodesKey = "ExitNodes";
  static constexpr const char* kStrictNodesKey = "StrictNodes";

  /// Стандартные расположения torrc в порядке проверки
  static const std::vector<std::string>& defaultCandidates();

  explicit ExitPolicyEditor(
      std::vector<std::string> candidates = defaultCandidates());

  /**
   * @brief Найти torrc
   * @param explicitPath Путь из командной строки; возвращается как есть,
   * если это существующий файл
   * @return Первый существующий кандидат или пусто
   */
  std::optional<std::string> locateConfigPath(
      const std::string& explicitPath = "") const;

  /**
   * @brief Записать политику в файл
   * @throw TorrcReadError Файл не существует или не читается
   * @throw TorrcWriteError Файл не удалось перезаписать
   */
  void writePolicy(const std::string& path, const ExitPolicy& policy) const;

  /**
   * @brief Прочитать политику, записанную в файле сейчас
   * @details Без директивы StrictNodes strict == false; при нескольких
   * директивах побеждает последняя, как в самом Tor.
   * @throw TorrcReadError Файл не читается
   */
  ExitPolicy readPolicy(const std::string& path) const;

  /// Преобразование строк без ввода-вывода; основа writePolicy()
  static std::vector<std::string> applyPolicy(
      const std::vector<std::string>& lines, const ExitPolicy& policy);

 private:
  static std::vector<std::string> readLines(const std::string& path);

  std::vector<std::string> candidates_;
};
