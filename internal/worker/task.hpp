#pragma once

#include <functional>
#include <string>

namespace outbox::worker {

/*
  A unit of background work.

  `name` only shows up in logs when the task fails.
*/
struct Task {
  std::string           name;
  std::function<void()> run;
};

}
