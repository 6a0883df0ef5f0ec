#include "vclock/domain/action_type.hpp"

#include <unordered_map>

namespace vclock {
namespace domain {

const char* actionTypeToString(ActionType type) {
  using A = ActionType;
  switch (type) {
    case A::Exit:                return "exit";
    case A::Refresh:             return "refresh";
    case A::SearchUser:          return "search_user";
    case A::SearchPosts:         return "search_posts";
    case A::CreatePost:          return "create_post";
    case A::LikePost:            return "like_post";
    case A::UnlikePost:          return "unlike_post";
    case A::DislikePost:         return "dislike_post";
    case A::UndoDislikePost:     return "undo_dislike_post";
    case A::ReportPost:          return "report_post";
    case A::Follow:              return "follow";
    case A::Unfollow:            return "unfollow";
    case A::Mute:                return "mute";
    case A::Unmute:              return "unmute";
    case A::Trend:               return "trend";
    case A::SignUp:              return "sign_up";
    case A::Repost:              return "repost";
    case A::QuotePost:           return "quote_post";
    case A::UpdateRecTable:      return "update_rec_table";
    case A::CreateComment:       return "create_comment";
    case A::LikeComment:         return "like_comment";
    case A::UnlikeComment:       return "unlike_comment";
    case A::DislikeComment:      return "dislike_comment";
    case A::UndoDislikeComment:  return "undo_dislike_comment";
    case A::DoNothing:           return "do_nothing";
    case A::PurchaseProduct:     return "purchase_product";
    case A::Interview:           return "interview";
    case A::JoinGroup:           return "join_group";
    case A::LeaveGroup:          return "leave_group";
    case A::SendToGroup:         return "send_to_group";
    case A::CreateGroup:         return "create_group";
    case A::ListenFromGroup:     return "listen_from_group";
    case A::SendFriendRequest:   return "send_friend_request";
    case A::AcceptFriendRequest: return "accept_friend_request";
    case A::RejectFriendRequest: return "reject_friend_request";
    case A::Unfriend:            return "unfriend";
    case A::GetFriendRequests:   return "get_friend_requests";
    case A::GetFriends:          return "get_friends";
    case A::ReactToPost:         return "react_to_post";
    case A::RemoveReaction:      return "remove_reaction";
    case A::CreateGroupPost:     return "create_group_post";
    case A::ShareToGroup:        return "share_to_group";
  }
  return "unknown";
}

std::optional<ActionType> actionTypeFromString(const std::string& name) {
  // Built once from the forward mapping so the two can never disagree.
  static const std::unordered_map<std::string, ActionType> kByName = [] {
    std::unordered_map<std::string, ActionType> m;
    for (int i = 0; i <= static_cast<int>(ActionType::ShareToGroup); ++i) {
      const auto type = static_cast<ActionType>(i);
      m.emplace(actionTypeToString(type), type);
    }
    return m;
  }();

  const auto it = kByName.find(name);
  if (it == kByName.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace domain
}  // namespace vclock
