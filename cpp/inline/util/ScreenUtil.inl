#include "util/ScreenUtil.hpp"

#include <sys/ioctl.h>
#include <unistd.h>

namespace util {

inline int get_screen_width() {
  struct winsize w;
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
    return w.ws_col;
  }
  return 80;
}

inline void clearscreen(std::ostream& os) {
  os << "\033[2J\033[H";
  os.flush();
}

}  // namespace util
