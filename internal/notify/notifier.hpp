#pragma once

#include <string>

namespace refinery::notify {

struct Message {
  std::string from;
  std::string to;
  std::string subject;
  std::string body;
};

/*
  Outbound mail to agents. Send throws on delivery failure; callers in the
  merge pipeline treat that as best-effort and log it.
*/
class Notifier {
 public:
  virtual ~Notifier() = default;

  virtual void Send(const Message& message) = 0;
};

struct MergeFailure {
  std::string rig;
  std::string worker;
  std::string branch;
  std::string source_issue;
  std::string target;
  std::string failure_type; // conflict | tests | build
  std::string error;
};

// "MERGE_FAILED <worker>" with one "Key: value" line per field.
Message NewMergeFailedMessage(const MergeFailure& failure, const std::string& recipient);

Message NewRejectedMessage(const std::string& rig, const std::string& worker, const std::string& branch, const std::string& source_issue,
                           const std::string& reason);

// "<rig>/witness"
std::string DefaultRecipient(const std::string& rig);

} // namespace refinery::notify
