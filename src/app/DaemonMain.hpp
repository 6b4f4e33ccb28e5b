#pragma once

namespace mp::app
{

// Runs the presence daemon until SIGINT/SIGTERM.
//   --state <db>          state database (default: <data root>/meshpresence.db)
//   --replay <file.json>  feed the engine from a recorded transport document
//   --log <file>          append log lines here instead of the data root
//   --run-seconds <n>     stop automatically after n seconds
int daemon_main(int argc, char *argv[]);

} // namespace mp::app
