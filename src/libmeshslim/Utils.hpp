#ifndef meshslim_Utils_hpp_
#define meshslim_Utils_hpp_

#include <string>

#include "libmeshslim.h"

namespace MeshSlim {

// Logging level: 0 fatal, 1 error, 2 warning, 3 info, 4 debug, 5 trace.
extern void set_logging_level(unsigned int level);
extern unsigned int level_string_to_boost(std::string level);
extern std::string  get_string_logging_level(unsigned level);
extern unsigned get_logging_level();
// Install the default filter (warning) unless set_logging_level() was called before.
// Called by the library entry points.
extern void init_default_logging_level();
// Log a message through boost::log at the given logging level.
extern void trace(unsigned int level, const char *message);

} // namespace MeshSlim

#endif // meshslim_Utils_hpp_
