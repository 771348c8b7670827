#include "issue_store_notifier.hpp"

#include "internal/util/errors.hpp"

namespace refinery::notify {

IssueStoreNotifier::IssueStoreNotifier(std::shared_ptr<beads::IssueStore> store) : store_(std::move(store)) {
}

void IssueStoreNotifier::Send(const Message& message) {
  if (message.to.empty()) {
    throw util::InvalidArgument("message has no recipient");
  }

  beads::CreateOptions options;
  options.type        = beads::model::kTypeMessage;
  options.title       = message.subject;
  options.description = message.body;
  options.assignee    = message.to;
  options.actor       = message.from;
  options.labels      = {beads::model::kLabelMessage};

  beads::ThrowIfStoreError(store_->Create(options, nullptr), "send message to " + message.to);
}

} // namespace refinery::notify
