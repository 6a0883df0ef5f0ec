#pragma once

#include <optional>
#include <string>

namespace vclock {
namespace domain {

// -----------------------------------------------------------------------------
// ActionType: things a simulated agent can do on a platform
// -----------------------------------------------------------------------------
//
// @brief  Closed enumeration of agent actions across the Twitter-, Reddit-
//         and Facebook-style platforms the simulation drives.
//
// @details
// The clock never interprets an ActionType. Drivers convert it to its wire
// name with actionTypeToString() and pass that string as the action hint of
// TickClock::synthesizeTimestamp(), where it only diversifies the seed.
// Wire names are part of the reproducibility contract: renaming one changes
// every timestamp issued for that action.
// -----------------------------------------------------------------------------
enum class ActionType {
  Exit,
  Refresh,
  SearchUser,
  SearchPosts,
  CreatePost,
  LikePost,
  UnlikePost,
  DislikePost,
  UndoDislikePost,
  ReportPost,
  Follow,
  Unfollow,
  Mute,
  Unmute,
  Trend,
  SignUp,
  Repost,
  QuotePost,
  UpdateRecTable,
  CreateComment,
  LikeComment,
  UnlikeComment,
  DislikeComment,
  UndoDislikeComment,
  DoNothing,
  PurchaseProduct,
  Interview,
  JoinGroup,
  LeaveGroup,
  SendToGroup,
  CreateGroup,
  ListenFromGroup,

  // Facebook-style actions
  SendFriendRequest,
  AcceptFriendRequest,
  RejectFriendRequest,
  Unfriend,
  GetFriendRequests,
  GetFriends,
  ReactToPost,
  RemoveReaction,
  CreateGroupPost,
  ShareToGroup,
};

// Wire name, e.g. ActionType::CreatePost → "create_post".
const char* actionTypeToString(ActionType type);

// Inverse of actionTypeToString(); std::nullopt for unknown names.
std::optional<ActionType> actionTypeFromString(const std::string& name);

}  // namespace domain
}  // namespace vclock
