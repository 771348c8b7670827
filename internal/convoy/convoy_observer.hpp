#pragma once

#include <string>
#include <vector>

namespace refinery::convoy {

/*
  Convoy continuation after an issue closes.

  Returns the ids of the convoys tracking the issue. Never throws; problems
  are logged.
*/
class ConvoyObserver {
 public:
  virtual ~ConvoyObserver() = default;

  virtual std::vector<std::string> CheckConvoysForIssue(const std::string& issue_id) = 0;
};

} // namespace refinery::convoy
