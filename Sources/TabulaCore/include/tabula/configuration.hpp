#pragma once

#include "log.hpp"
#include "scheduler.hpp"
#include <memory>
#include <optional>
#include <string>

namespace tabula {

// Configuration shared by the SQLite store and the notifiers built on it
struct configuration {
    std::string path = ":memory:";
    std::shared_ptr<scheduler> sched;  // null means immediate delivery
    bool read_only = false;
    int busy_timeout_ms = 5000;
    std::optional<log_level> log;      // applied when a database is opened

    configuration() = default;
    configuration(const std::string& p) : path(p) {}
    configuration(const std::string& p, std::shared_ptr<scheduler> s)
        : path(p), sched(std::move(s)) {}
};

} // namespace tabula
