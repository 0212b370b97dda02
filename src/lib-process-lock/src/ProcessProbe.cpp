/**
 * @file ProcessProbe.cpp
 * @brief Проверка процесса через kill(pid, 0) и /proc
 *
 * @author procguard Development Team
 * @date Октябрь 2026
 * @version 1.0
 * @license MIT
 */

#include "procguard/ProcessProbe.hpp"

#include <cerrno>
#include <csignal>
#include <fstream>
#include <iterator>
#include <string>

namespace procguard {

const char* toString(Liveness liveness) noexcept {
    switch (liveness) {
        case Liveness::Alive:
            return "alive";
        case Liveness::Dead:
            return "dead";
        case Liveness::Unknown:
            return "unknown";
    }
    return "unknown";
}

namespace {

// Зомби (Z) и завершающийся процесс (X) по /proc/<pid>/stat.
// Без procfs ответ всегда false.
bool isDefunct(pid_t pid) {
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    if (!stat) return false;
    const std::string line((std::istreambuf_iterator<char>(stat)),
                           std::istreambuf_iterator<char>());

    // Имя команды в скобках может содержать пробелы и ')'
    const auto close = line.rfind(')');
    if (close == std::string::npos || close + 2 >= line.size()) return false;
    const char state = line[close + 2];
    return state == 'Z' || state == 'X';
}

}  // namespace

Liveness SignalProcessProbe::probe(pid_t pid) const {
    // kill() с pid <= 0 адресует группы процессов
    if (pid <= 0) return Liveness::Dead;

    // Несобранный зомби принимает сигналы, но владельцем уже не является
    if (::kill(pid, 0) == 0) {
        return isDefunct(pid) ? Liveness::Dead : Liveness::Alive;
    }
    if (errno == ESRCH) return Liveness::Dead;
    return Liveness::Unknown;
}

std::shared_ptr<IProcessProbe> defaultProcessProbe() {
    static std::shared_ptr<IProcessProbe> probe =
        std::make_shared<SignalProcessProbe>();
    return probe;
}

}  // namespace procguard
