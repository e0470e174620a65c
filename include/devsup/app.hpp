#pragma once

namespace devsup {

struct App {
  int run(int argc, char **argv);
};

} // namespace devsup
