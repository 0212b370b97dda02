/**
 * @file environmentprocessor.cpp
 * @brief Реализация подстановки переменных окружения
 *
 * @author procguard Development Team
 * @date Октябрь 2026
 * @version 1.0
 * @license MIT
 */

#include "environmentprocessor.hpp"

#include <cstdlib>
#include <cstring>

namespace procguard {

void EnvironmentProcessor::process(nlohmann::json &config) const {
    walkJson(config, [this](std::string &value) { resolveVariable(value); });
}

void EnvironmentProcessor::walkJson(
    nlohmann::json &node,
    const std::function<void(std::string &)> &func) const {
    if (node.is_object() || node.is_array()) {
        for (auto &element : node) {
            walkJson(element, func);
        }
    } else if (node.is_string()) {
        std::string str = node.get<std::string>();
        func(str);
        node = str;
    }
}

void EnvironmentProcessor::resolveVariable(std::string &value) const {
    size_t start_pos = 0;
    const std::string prefix = "$ENV{";

    while ((start_pos = value.find(prefix, start_pos)) != std::string::npos) {
        size_t end_pos = value.find('}', start_pos + prefix.length());
        if (end_pos == std::string::npos) break;

        std::string var_name = value.substr(start_pos + prefix.length(),
                                            end_pos - start_pos - prefix.length());

        if (const char *env_val = std::getenv(var_name.c_str())) {
            value.replace(start_pos, end_pos - start_pos + 1, env_val);
            start_pos += std::strlen(env_val);
        } else {
            start_pos = end_pos + 1;
        }
    }
}

}  // namespace procguard
