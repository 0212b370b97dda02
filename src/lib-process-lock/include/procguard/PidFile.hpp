/**
 * @file PidFile.hpp
 * @brief PID-файл сервиса
 *
 * @author procguard Development Team
 * @date Сентябрь 2026
 * @version 1.0
 * @license MIT
 *
 * @details PID-файл - это маркер блокировки, содержимое которого является
 * идентификатором работающего сервиса: одна строка с pid в десятичном виде.
 * Устаревание определяется только проверкой процесса.
 */
#pragma once

#include <sys/types.h>

#include <filesystem>
#include <memory>
#include <string>

#include "procguard/Events.hpp"
#include "procguard/ProcessProbe.hpp"

namespace procguard {

enum class PidFileState {
    Absent,             ///< Файла нет
    ValidOwnedByUs,     ///< В файле pid текущего процесса
    ValidOwnedByOther,  ///< В файле pid другого живого процесса
    Stale               ///< Процесс мёртв или содержимое испорчено
};

const char* toString(PidFileState state) noexcept;

struct PidFileStatus {
    PidFileState state = PidFileState::Absent;
    pid_t pid = 0;  ///< pid из файла, 0 если не разобран
};

/**
 * @class PidFile
 * @brief Создание, проверка, перезапись и удаление PID-файла
 *
 * @note Если autoRemove включён, деструктор удаляет файл, созданный этим
 * объектом.
 */
class PidFile {
public:
    /**
     * @param filename Путь к файлу; относительный путь делается абсолютным
     * @param sink Получатель событий
     * @param probe Проверка процессов; nullptr - kill(pid, 0)
     * @param ownerDescription Имя владельца для диагностики
     * @throw std::invalid_argument Пустое имя файла
     */
    explicit PidFile(const std::string& filename, EventSink sink = EventSink(),
                     std::shared_ptr<IProcessProbe> probe = nullptr,
                     std::string ownerDescription = "procguard");
    ~PidFile();

    PidFile(const PidFile&) = delete;
    PidFile& operator=(const PidFile&) = delete;

    const std::filesystem::path& path() const { return path_; }
    const std::string& ownerDescription() const { return ownerDescription_; }

    bool autoRemove() const { return autoRemove_; }
    void setAutoRemove(bool value) { autoRemove_ = value; }

    /// Был ли файл создан этим объектом и ещё не удалён
    bool created() const { return created_; }
    /// pid, последним записанный этим объектом
    pid_t writtenPid() const { return writtenPid_; }

    /**
     * @brief Классифицировать текущий файл
     * @throw InvalidPidFileError Каталог отсутствует или недоступен для поиска,
     *        путь не является обычным файлом
     * @throw PidFileError Ошибка чтения
     */
    PidFileStatus check() const;

    /**
     * @brief Создать файл с pid процесса
     * @param force Удалить существующий файл без проверки владельца
     * @param pid pid для записи, 0 - текущий процесс
     * @throw InvalidPidFileError Каталог недоступен для записи
     * @throw PidFileInUseError Файл принадлежит другому живому процессу либо
     *        был заменён другим процессом во время создания
     */
    void create(bool force = false, pid_t pid = 0);

    /**
     * @brief Перезаписать файл новым pid (после fork)
     * @throw PidFileError Файл не создавался этим объектом
     * @throw InvalidPidFileError Содержимое файла испорчено
     * @throw PidFileInUseError Файл перехвачен другим живым процессом
     */
    void recreate(pid_t pid = 0);

    /**
     * @brief Удалить файл; повторный вызов не является ошибкой
     * @throw PidFileError Файл принадлежит другому живому процессу
     */
    void remove();

private:
    void checkDirectory(bool requireWrite) const;
    // Классификация без проверки каталога; judgedRaw получает содержимое
    PidFileStatus inspect(std::string* judgedRaw) const;
    void removeExisting();
    bool takeOverExisting(const std::string& judgedRaw);

    std::filesystem::path path_;
    EventSink sink_;
    std::shared_ptr<IProcessProbe> probe_;
    std::string ownerDescription_;
    bool autoRemove_ = true;
    bool created_ = false;
    pid_t writtenPid_ = 0;
};

}  // namespace procguard
