#ifndef APP_INCLUDE_PERIPHERAL_STATE_EVENT_H_
#define APP_INCLUDE_PERIPHERAL_STATE_EVENT_H_

#include <app_event_manager.h>

#ifdef __cplusplus
extern "C"
{
#endif

extern const char *peripheral_state_to_str[];

enum peripheral_state_t
{
    PERIPHERAL_STATE_IDLE = 0,
    PERIPHERAL_STATE_SCANNING,
    PERIPHERAL_STATE_CONNECTING,
    PERIPHERAL_STATE_CONNECTED,
    PERIPHERAL_STATE_DISCONNECTING,
    PERIPHERAL_STATE_ERROR,
};

struct peripheral_state_event
{
    struct app_event_header header;

    enum peripheral_state_t state;
    // err_t value when state is PERIPHERAL_STATE_ERROR, 0 otherwise
    int fault;
};

APP_EVENT_TYPE_DECLARE(peripheral_state_event);

#ifdef __cplusplus
}
#endif

#endif // APP_INCLUDE_PERIPHERAL_STATE_EVENT_H_
