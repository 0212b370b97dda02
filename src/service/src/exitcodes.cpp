/**
 * @file exitcodes.cpp
 * @brief Отображение исключений procguard в коды завершения
 *
 * @author procguard Development Team
 * @date Октябрь 2026
 * @version 1.0
 * @license MIT
 */

#include "exitcodes.hpp"

#include "procguard/Errors.hpp"

namespace procguard {

int exitCodeFor(const std::exception_ptr& error) noexcept {
    if (!error) return EXIT_OK;
    try {
        std::rethrow_exception(error);
    } catch (const PidFileInUseError&) {
        return EXIT_ALREADY_RUNNING;
    } catch (const PidFileError&) {
        return EXIT_PIDFILE_ERROR;
    } catch (const DaemonizeError& e) {
        switch (e.stage()) {
            case DaemonizeStage::Fork:
                return EXIT_FORK_FAILED;
            case DaemonizeStage::Session:
                return EXIT_SETSID_FAILED;
            default:
                return EXIT_DAEMONIZE_FAILED;
        }
    } catch (const LockTimeout&) {
        return EXIT_LOCK_TIMEOUT;
    } catch (const LockError&) {
        return EXIT_LOCK_ERROR;
    } catch (const std::exception&) {
        return EXIT_OTHER_FAILURE;
    }
    return EXIT_OTHER_FAILURE;
}

}  // namespace procguard
