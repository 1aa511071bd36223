#pragma once

#include <string_view>

namespace consulthub::hub::msg {

// Closed catalog of envelope type tags.
inline constexpr std::string_view kConnectionConfirmed = "connection_confirmed";
inline constexpr std::string_view kJoinConsultation    = "join_consultation";
inline constexpr std::string_view kLeaveConsultation   = "leave_consultation";
inline constexpr std::string_view kChatMessage         = "chat_message";
inline constexpr std::string_view kTypingStart         = "typing_start";
inline constexpr std::string_view kTypingStop          = "typing_stop";
inline constexpr std::string_view kPing                = "ping";
inline constexpr std::string_view kPong                = "pong";

} // namespace consulthub::hub::msg
