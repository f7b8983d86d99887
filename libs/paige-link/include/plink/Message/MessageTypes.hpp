#pragma once

#include <QSet>
#include <QString>

namespace plink {

/// Server -> client message types
namespace ServerMessageType {
    constexpr const char* CONNECTION_INIT          = "connection:init";
    constexpr const char* CONNECTION_ERROR         = "connection:error";
    constexpr const char* SESSION_START            = "session:start";
    constexpr const char* SESSION_RESTORE          = "session:restore";
    constexpr const char* SESSION_END              = "session:end";
    constexpr const char* DASHBOARD_DREYFUS        = "dashboard:dreyfus";
    constexpr const char* DASHBOARD_STATS          = "dashboard:stats";
    constexpr const char* DASHBOARD_IN_PROGRESS    = "dashboard:in_progress";
    constexpr const char* DASHBOARD_ISSUES         = "dashboard:issues";
    constexpr const char* DASHBOARD_CHALLENGES     = "dashboard:challenges";
    constexpr const char* DASHBOARD_MATERIALS      = "dashboard:materials";
    constexpr const char* FS_TREE                  = "fs:tree";
    constexpr const char* FS_TREE_UPDATE           = "fs:tree_update";
    constexpr const char* BUFFER_CONTENT           = "buffer:content";
    constexpr const char* SAVE_ACK                 = "save:ack";
    constexpr const char* EXPLORER_HINT_FILES      = "explorer:hint_files";
    constexpr const char* EXPLORER_CLEAR_HINTS     = "explorer:clear_hints";
    constexpr const char* EDITOR_DECORATIONS       = "editor:decorations";
    constexpr const char* EDITOR_CLEAR_DECORATIONS = "editor:clear_decorations";
    constexpr const char* COACHING_MESSAGE         = "coaching:message";
    constexpr const char* COACHING_REVIEW_RESULT   = "coaching:review_result";
    constexpr const char* COACHING_CLEAR           = "coaching:clear";
    constexpr const char* PHASE_TRANSITION         = "phase:transition";
    constexpr const char* OBSERVER_NUDGE           = "observer:nudge";
    constexpr const char* ERROR_FILE_NOT_FOUND     = "error:file_not_found";
    constexpr const char* ERROR_PERMISSION_DENIED  = "error:permission_denied";
    constexpr const char* ERROR_GENERAL            = "error:general";
    constexpr const char* AUDIO_CHUNK              = "audio:chunk";
    constexpr const char* AUDIO_COMPLETE           = "audio:complete";
}

/// Client -> server message types
namespace ClientMessageType {
    constexpr const char* CONNECTION_HELLO         = "connection:hello";
    constexpr const char* CONNECTION_READY         = "connection:ready";
    constexpr const char* DASHBOARD_STATS_PERIOD   = "dashboard:stats_period";
    constexpr const char* DASHBOARD_RESUME_TASK    = "dashboard:resume_task";
    constexpr const char* DASHBOARD_START_ISSUE    = "dashboard:start_issue";
    constexpr const char* FILE_OPEN                = "file:open";
    constexpr const char* FILE_CLOSE               = "file:close";
    constexpr const char* FILE_SAVE                = "file:save";
    constexpr const char* BUFFER_UPDATE            = "buffer:update";
    constexpr const char* EDITOR_CURSOR            = "editor:cursor";
    constexpr const char* EDITOR_SCROLL            = "editor:scroll";
    constexpr const char* EDITOR_SELECTION         = "editor:selection";
    constexpr const char* TERMINAL_READY           = "terminal:ready";
    constexpr const char* TERMINAL_INPUT           = "terminal:input";
    constexpr const char* TERMINAL_RESIZE          = "terminal:resize";
    constexpr const char* HINTS_LEVEL_CHANGE       = "hints:level_change";
    constexpr const char* USER_EXPLAIN             = "user:explain";
    constexpr const char* USER_REVIEW              = "user:review";
    constexpr const char* COACHING_DISMISS         = "coaching:dismiss";
    constexpr const char* COACHING_FEEDBACK        = "coaching:feedback";
    constexpr const char* USER_IDLE_START          = "user:idle_start";
    constexpr const char* USER_IDLE_END            = "user:idle_end";
    constexpr const char* USER_NAVIGATION          = "user:navigation";
    constexpr const char* PHASE_EXPAND_STEP        = "phase:expand_step";
    constexpr const char* AUDIO_CONTROL            = "audio:control";
}

/// High-frequency editor and activity events the server ingests without
/// acknowledging individually.
inline QSet<QString> defaultFireAndForgetTypes()
{
    return {
        ClientMessageType::BUFFER_UPDATE,
        ClientMessageType::EDITOR_CURSOR,
        ClientMessageType::EDITOR_SCROLL,
        ClientMessageType::EDITOR_SELECTION,
        ClientMessageType::TERMINAL_INPUT,
        ClientMessageType::TERMINAL_RESIZE,
        ClientMessageType::USER_IDLE_START,
        ClientMessageType::USER_IDLE_END,
        ClientMessageType::USER_NAVIGATION,
        ClientMessageType::COACHING_DISMISS,
        ClientMessageType::COACHING_FEEDBACK,
        ClientMessageType::HINTS_LEVEL_CHANGE,
        ClientMessageType::PHASE_EXPAND_STEP,
    };
}

} // namespace plink
