#ifndef __CLI_HPP__
#define __CLI_HPP__

#include <vector>
#include <string>
#include <ostream>

#include "specindex.h"
#include "util.hpp"
#include "batch.hpp"

namespace specindex {

    namespace cli {

        // The settings given on the command line.
        class DLL_EXPORT Options {
        public:
            specindex::batch::config::BatchConfig config;
            int logLevel;
            bool help;

            Options();
        };

        // Print the usage message.
        void usage(std::ostream &out);

        // Parse the arguments, not including the program name. --indices takes
        // one or more names, each of which may be a comma-separated list;
        // repeats are dropped. Throws std::invalid_argument for an unknown
        // argument, a missing value or an unknown index or sensor name.
        Options parse(const std::vector<std::string> &args);

        // Parse the arguments and run the batch: open the run log, check the
        // configuration, process every scene and write the summary. Returns
        // the exit status: 0 once the batch completes, whatever the outcome of
        // the individual scenes and indices; 1 for a bad command line or a
        // setup error. The callbacks, if given, receive the batch progress
        // unless the log is verbose.
        int run(const std::vector<std::string> &args, specindex::util::Logger &log,
                specindex::util::Callbacks *callbacks = nullptr);

    } // cli

} // specindex

#endif
