#include "Env.hpp"

#include <cstdlib>
#include <string_view>

bool Env::envEnabled(const std::string& env) {
    auto ret = getenv(env.c_str());
    if (!ret)
        return false;

    const std::string_view sv = ret;

    return !sv.empty() && sv != "0";
}

std::optional<std::string> Env::envValue(const std::string& env) {
    const auto RET = getenv(env.c_str());
    if (!RET || RET[0] == '\0')
        return std::nullopt;

    return std::string{RET};
}

bool Env::isTrace() {
    static bool TRACE = envEnabled("MEMLANE_TRACE");
    return TRACE;
}
