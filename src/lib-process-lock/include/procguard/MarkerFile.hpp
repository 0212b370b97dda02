/**
 * @file MarkerFile.hpp
 * @brief Формат и атомарная запись файлов-маркеров (lock и PID файлы)
 *
 * @author procguard Development Team
 * @date Сентябрь 2026
 * @version 1.0
 * @license MIT
 *
 * @details Формат:
 * - строка 1: pid в десятичном виде;
 * - строка 2 (только у lock-маркеров): время создания
 *   "<секунды эпохи>.<6 цифр микросекунд>".
 *
 * Маркер никогда не изменяется на месте. Публикация идёт через временный
 * файл в том же каталоге: запись, fsync, затем link() (создание с EEXIST)
 * либо rename() (замена). Читатель видит либо старый, либо новый файл
 * целиком.
 */
#pragma once

#include <sys/stat.h>
#include <sys/types.h>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace procguard {

using Clock = std::chrono::system_clock;

/// Разобранное содержимое маркера
struct MarkerRecord {
    std::optional<pid_t> pid;                   ///< nullopt, если строка pid испорчена
    std::optional<Clock::time_point> created_at;  ///< nullopt, если метки нет
};

/// Маркер, прочитанный с диска
struct MarkerSnapshot {
    std::string raw;                ///< Содержимое файла как есть
    MarkerRecord record;
    Clock::time_point modified_at;  ///< st_mtime файла

    /// Время создания из файла, иначе время модификации
    Clock::time_point effectiveCreatedAt() const {
        return record.created_at.value_or(modified_at);
    }
};

/**
 * @brief Разобрать pid: положительное десятичное число, пробелы по краям
 *        допускаются
 */
std::optional<pid_t> parsePid(const std::string& text);

std::string formatTimestamp(Clock::time_point tp);
std::optional<Clock::time_point> parseTimestamp(const std::string& text);

/// Содержимое маркера; без created_at получается содержимое PID-файла
std::string formatMarker(pid_t pid,
                         const std::optional<Clock::time_point>& created_at =
                             std::nullopt);
MarkerRecord parseMarker(const std::string& text);

/**
 * @brief Прочитать маркер
 * @return std::nullopt, если файла нет
 * @throw std::system_error При прочих ошибках чтения
 */
std::optional<MarkerSnapshot> readMarker(const std::filesystem::path& path);

/**
 * @brief Атомарно создать маркер, если его ещё нет
 * @return false, если файл уже существует (EEXIST)
 * @throw std::system_error При любой другой ошибке
 */
bool publishMarker(const std::filesystem::path& path,
                   const std::string& content, mode_t mode = 0644);

/**
 * @brief Атомарно заменить (или создать) маркер
 * @throw std::system_error При ошибке
 */
void replaceMarker(const std::filesystem::path& path,
                   const std::string& content, mode_t mode = 0644);

/**
 * @brief Удалить маркер
 * @return false, если файла уже нет
 * @throw std::system_error При прочих ошибках
 */
bool removeMarker(const std::filesystem::path& path);

/**
 * @brief Удалить маркер, признанный устаревшим, только если он не изменился
 *
 * @details Маркер переносится в "<path>.stale.<pid>", перечитывается и
 * сравнивается с judgedRaw. При совпадении удаляется, иначе возвращается
 * на место через link(): конкурент, успевший опубликовать свежий маркер,
 * его не теряет.
 *
 * @param judgedRaw Содержимое маркера на момент проверки
 * @return true, если удалён именно проверенный маркер
 * @throw std::system_error При ошибках файловой системы
 */
bool takeOverMarker(const std::filesystem::path& path,
                    const std::string& judgedRaw);

}  // namespace procguard
