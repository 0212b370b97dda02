/**
 * @file main.cpp
 * @brief Точка входа procguardd
 *
 * @author procguard Development Team
 * @date Октябрь 2026
 * @version 1.0
 * @license MIT
 */

#include "service_controller.hpp"

int main(int argc, char **argv) {
    procguard::ServiceController controller;
    return controller.run(argc, argv);
}
