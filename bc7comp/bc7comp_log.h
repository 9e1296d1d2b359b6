#pragma once

#include <cstdio>

namespace bc7comp {

enum bc7_log_level {
    BC7_LOG_ERROR = 0,
    BC7_LOG_WARNING,
    BC7_LOG_INFO,
    BC7_LOG_DEBUG
};

// Messages above this level are dropped. Defaults to BC7_LOG_WARNING.
void bc7comp_set_log_level(bc7_log_level level);
bc7_log_level bc7comp_get_log_level();

} // namespace bc7comp

#define BC7COMP_LOG(level, tag, fmt, ...) \
    do { \
        if ((level) <= ::bc7comp::bc7comp_get_log_level()) \
            fprintf(stderr, "[bc7comp] " tag ": " fmt "\n", ##__VA_ARGS__); \
    } while (0)

#define BC7COMP_LOGE(fmt, ...) BC7COMP_LOG(::bc7comp::BC7_LOG_ERROR, "error", fmt, ##__VA_ARGS__)
#define BC7COMP_LOGW(fmt, ...) BC7COMP_LOG(::bc7comp::BC7_LOG_WARNING, "warning", fmt, ##__VA_ARGS__)
#define BC7COMP_LOGI(fmt, ...) BC7COMP_LOG(::bc7comp::BC7_LOG_INFO, "info", fmt, ##__VA_ARGS__)
#define BC7COMP_LOGD(fmt, ...) BC7COMP_LOG(::bc7comp::BC7_LOG_DEBUG, "debug", fmt, ##__VA_ARGS__)
