/**
 * @file errors.hpp
 * @date October 2026
 * @brief Фатальные ошибки tornet и стабильные коды завершения
 *
 * @details Каждое фатальное условие имеет собственный тип исключения и
 * собственный код завершения процесса. Коды используются в скриптах и не
 * должны меняться между версиями. Нефатальные ситуации (ненулевой код
 * systemctl, пустой ответ пробы) исключениями не являются.
 */
#pragma once

#include <stdexcept>
#include <string>

/**
 * @enum ExitCode
 * @brief Коды завершения процесса
 */
enum class ExitCode : int {
  Success = 0,
  UsageError = 1,
  MissingPrivilege = 2,
  NoServiceManager = 3,
  NoPackageManager = 4,  ///< Зарезервирован за установщиком зависимостей
  MalformedInterval = 8,
  NoConnectivity = 9,
  RelayNotInstalled = 10,
  TorrcNotFound = 20,
  TorrcUnreadable = 22,
  TorrcUnwritable = 23,
};

inline int toInt(ExitCode code) { return static_cast<int>(code); }

/// Краткое имя кода для логов
std::string describeExitCode(ExitCode code);

/**
 * @class FatalError
 * @brief База всех ошибок, завершающих процесс
 */
class FatalError : public std::runtime_error {
 public:
  FatalError(ExitCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  ExitCode code() const noexcept { return code_; }

 private:
  ExitCode code_;
};

class UsageError : public FatalError {
 public:
  explicit UsageError(const std::string& message)
      : FatalError(ExitCode::UsageError, message) {}
};

class PrivilegeError : public FatalError {
 public:
  explicit PrivilegeError(const std::string& message)
      : FatalError(ExitCode::MissingPrivilege, message) {}
};

class ServiceManagerError : public FatalError {
 public:
  explicit ServiceManagerError(const std::string& message)
      : FatalError(ExitCode::NoServiceManager, message) {}
};

class IntervalFormatError : public FatalError {
 public:
  explicit IntervalFormatError(const std::string& message)
      : FatalError(ExitCode::MalformedInterval, message) {}
};

class ConnectivityError : public FatalError {
 public:
  explicit ConnectivityError(const std::string& message)
      : FatalError(ExitCode::NoConnectivity, message) {}
};

class RelayMissingError : public FatalError {
 public:
  explicit RelayMissingError(const std::string& message)
      : FatalError(ExitCode::RelayNotInstalled, message) {}
};

class TorrcNotFoundError : public FatalError {
 public:
  explicit TorrcNotFoundError(const std::string& message)
      : FatalError(ExitCode::TorrcNotFound, message) {}
};

class TorrcReadError : public FatalError {
 public:
  explicit TorrcReadError(const std::string& message)
      : FatalError(ExitCode::TorrcUnreadable, message) {}
};

class TorrcWriteError : public FatalError {
 public:
  explicit TorrcWriteError(const std::string& message)
      : FatalError(ExitCode::TorrcUnwritable, message) {}
};
