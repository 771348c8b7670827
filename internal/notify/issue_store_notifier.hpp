#pragma once

#include <memory>

#include "internal/beads/issue_store.hpp"
#include "internal/notify/notifier.hpp"

namespace refinery::notify {

/*
  Delivers mail as `message` issues labeled gt:message and assigned to the
  recipient. Agents read their inbox by listing open messages.
*/
class IssueStoreNotifier final : public Notifier {
 public:
  explicit IssueStoreNotifier(std::shared_ptr<beads::IssueStore> store);

  void Send(const Message& message) override;

 private:
  std::shared_ptr<beads::IssueStore> store_;
};

} // namespace refinery::notify
