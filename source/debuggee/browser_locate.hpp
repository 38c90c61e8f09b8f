#ifndef CDPDBG_BROWSER_LOCATE_HPP
#define CDPDBG_BROWSER_LOCATE_HPP

// Locating a CDP-capable browser when the launch request names none.

#include <string>

namespace browser_locate {

// First well-known browser that exists, or "" if none does. Bare names are
// looked up on $PATH, absolute paths are checked directly.
std::string find_browser_executable();

} // namespace browser_locate

#endif // CDPDBG_BROWSER_LOCATE_HPP
