#ifndef __TETHER_CHAT_REDUCER__
#define __TETHER_CHAT_REDUCER__

#include "Reducer.hpp"

namespace tether {
/**
 * @brief Transitions for worktree chats.
 *
 * Only one response may stream per chat.  Submitting while one is streaming
 * is rejected: messages stay as they are and `chat.error` says why.  A
 * streaming message accepts deltas until it is completed or failed, and is
 * immutable afterwards.
 */
class ChatReducer {
 public:
  static void apply(ReduceContext &ctx, const SubmitChatMessage &action);
  static void apply(ReduceContext &ctx, const UpdateChatMessage &action);
  static void apply(ReduceContext &ctx, const CompleteChatMessage &action);
  static void apply(ReduceContext &ctx, const FailChatMessage &action);
  static void apply(ReduceContext &ctx, const ClearChat &action);

  static constexpr const char *BUSY_ERROR =
      "A response is still streaming; wait for it to finish or clear the chat";

 protected:
  /**
   * @brief Finds the message an update targets, or nullptr if it is gone or
   * no longer streaming.
   */
  static ChatMessage *findStreamingMessage(ReduceContext &ctx,
                                           const optional<string> &worktreeId,
                                           const optional<string> &messageId,
                                           Worktree **worktree);
};
}  // namespace tether

#endif  // __TETHER_CHAT_REDUCER__
