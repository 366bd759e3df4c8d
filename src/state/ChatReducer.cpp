#include "ChatReducer.hpp"

namespace tether {
namespace {
void trimHistory(ChatState &chat) {
  if (chat.messages.size() > size_t(MAX_CHAT_MESSAGES)) {
    chat.messages.erase(
        chat.messages.begin(),
        chat.messages.begin() + (chat.messages.size() - MAX_CHAT_MESSAGES));
  }
}
}  // namespace

ChatMessage *ChatReducer::findStreamingMessage(
    ReduceContext &ctx, const optional<string> &worktreeId,
    const optional<string> &messageId, Worktree **worktree) {
  *worktree = ctx.resolveWorktree(worktreeId);
  if (*worktree == nullptr) {
    return nullptr;
  }
  ChatState &chat = (*worktree)->chat;
  optional<string> target = messageId ? messageId : chat.streaming_message_id;
  if (!target) {
    return nullptr;
  }
  for (auto &message : chat.messages) {
    if (message.id == *target) {
      return message.status == MessageStatus::Streaming ? &message : nullptr;
    }
  }
  return nullptr;
}

void ChatReducer::apply(ReduceContext &ctx, const SubmitChatMessage &action) {
  Project &project = ctx.requireActiveProject();
  Worktree &worktree = ctx.requireActiveWorktree();
  ChatState &chat = worktree.chat;
  if (chat.streaming_message_id) {
    chat.error = string(BUSY_ERROR);
    return;
  }

  ChatMessage user;
  user.id = ctx.meta.id(0);
  user.role = ChatRole::User;
  user.content = action.text;
  user.timestamp = ctx.meta.timestamp_ms;
  user.status = MessageStatus::Complete;
  chat.messages.push_back(user);

  ChatMessage assistant;
  assistant.id = ctx.meta.id(1);
  assistant.role = ChatRole::Assistant;
  assistant.timestamp = ctx.meta.timestamp_ms;
  assistant.status = MessageStatus::Streaming;
  chat.messages.push_back(assistant);

  chat.streaming_message_id = assistant.id;
  chat.error.reset();
  trimHistory(chat);

  ctx.emit(StartCompletionEffect{worktree.id, assistant.id, action.text,
                                 worktree.path});
  ctx.logActivity(project, "chat", "info", "Chat request sent");
}

void ChatReducer::apply(ReduceContext &ctx, const UpdateChatMessage &action) {
  Worktree *worktree;
  ChatMessage *message = findStreamingMessage(ctx, action.worktree_id,
                                              action.message_id, &worktree);
  if (message == nullptr) {
    VLOG(1) << "Dropping stale chat delta";
    return;
  }
  message->content.append(action.delta);
}

void ChatReducer::apply(ReduceContext &ctx,
                        const CompleteChatMessage &action) {
  Worktree *worktree;
  ChatMessage *message = findStreamingMessage(ctx, action.worktree_id,
                                              action.message_id, &worktree);
  if (message == nullptr) {
    return;
  }
  message->status = MessageStatus::Complete;
  if (worktree->chat.streaming_message_id == message->id) {
    worktree->chat.streaming_message_id.reset();
  }
}

void ChatReducer::apply(ReduceContext &ctx, const FailChatMessage &action) {
  Worktree *worktree;
  ChatMessage *message = findStreamingMessage(ctx, action.worktree_id,
                                              action.message_id, &worktree);
  if (message == nullptr) {
    return;
  }
  message->status = MessageStatus::Error;
  message->error = action.error;
  worktree->chat.error = action.error;
  if (worktree->chat.streaming_message_id == message->id) {
    worktree->chat.streaming_message_id.reset();
  }
  const Project *project = ctx.state().findProjectOfWorktree(worktree->id);
  ctx.logActivity(*project, "chat", "error",
                  "Chat request failed: " + action.error);
}

void ChatReducer::apply(ReduceContext &ctx, const ClearChat &action) {
  Worktree *worktree = ctx.resolveWorktree(action.worktree_id);
  if (worktree == nullptr) {
    return;
  }
  worktree->chat = ChatState();
  ctx.emit(CancelCompletionEffect{worktree->id});
}
}  // namespace tether
