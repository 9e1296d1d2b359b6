#include "bc7comp_log.h"

#include <atomic>

namespace bc7comp {

static std::atomic<int> g_log_level(BC7_LOG_WARNING);

void bc7comp_set_log_level(bc7_log_level level)
{
    g_log_level.store(level, std::memory_order_relaxed);
}

bc7_log_level bc7comp_get_log_level()
{
    return static_cast<bc7_log_level>(g_log_level.load(std::memory_order_relaxed));
}

} // namespace bc7comp
