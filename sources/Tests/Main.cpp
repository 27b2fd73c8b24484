/**************************************************************************
 *   Created: 2013/11/11 22:42:27
 *    Author: Eugene V. Palchukovsky
 *    E-mail: eugene@palchukovsky.com
 * -------------------------------------------------------------------
 *   Project: Ecosystem Connector
 *       URL: http://robotdk.com
 * Copyright: Eugene V. Palchukovsky
 **************************************************************************/

#include "Prec.hpp"

namespace {

struct CloseStopper : private boost::noncopyable {
  explicit CloseStopper(bool wait) : m_wait(wait) {}
  ~CloseStopper() {
    if (m_wait) {
      std::cout << "Press Enter to exit." << std::endl;
      getchar();
    }
  }

 private:
  const bool m_wait;
};
}  // namespace

int main(int argc, char **argv) {
  std::unique_ptr<CloseStopper> closeStopper;
  for (int i = 1; !closeStopper && i < argc; ++i) {
    const std::string arg(argv[i]);
    if (boost::iequals(arg, "wait")) {
      closeStopper = boost::make_unique<CloseStopper>(true);
    }
  }

  // Gateway dummies close sockets which the client could still write into.
  signal(SIGPIPE, SIG_IGN);

  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
