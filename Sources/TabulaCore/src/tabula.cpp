#include "tabula/log.hpp"

namespace tabula {

std::atomic<log_level> g_log_level{log_level::off};

} // namespace tabula
