#ifndef __UTIL_HPP__
#define __UTIL_HPP__

#include <vector>
#include <memory>
#include <mutex>
#include <fstream>
#include <sstream>
#include <string>

#include "specindex.h"

namespace specindex {

    namespace util {

        // Provides methods for handling status callbacks.
        class Callbacks {
        public:
            virtual ~Callbacks() = 0;
            virtual void stepCallback(float status) const = 0;
            virtual void overallCallback(float status) const = 0;
        };

        // A line-oriented log sink shared by the workers of a run. Each
        // message is written as a whole line under a lock, to the log file
        // (if one is open) and to the console stream (if enabled).
        class DLL_EXPORT Logger {
        private:
            int m_level;
            std::ostream *m_console;
            std::unique_ptr<std::ofstream> m_file;
            std::string m_filename;
            std::mutex m_mtx;

        public:
            // Create a logger at the given level that echoes to std::cerr.
            Logger(int level = SI_LOG_INFO);

            // Open (append) the given log file. Creates the parent directory
            // if necessary.
            void open(const std::string &filename);

            // Close the log file; console output continues.
            void close();

            // The name of the open log file, or empty.
            const std::string& filename() const;

            // Set the console stream. Null disables console output.
            void console(std::ostream *str);

            int level() const;

            void level(int level);

            // Write one line at the given level. The level check is done
            // by the si_log macros.
            void write(int level, const std::string &msg);

            // Return the label for a log level.
            static const char* levelName(int level);

            ~Logger();
        };

        /**
         * Provides utility methods for the file system and the console.
         */
        class Util {
        public:

            static void splitString(const std::string &str, std::vector<std::string> &lst);

            /**
             * Prints out a status message; a percentage representing current
             * of total steps.
             */
            static void status(int step, int of, const std::string &message = "", bool end = false);

            // Returns the local time formatted with the given strftime pattern.
            static std::string timestamp(const std::string &fmt = "%Y%m%d_%H%M%S");

            static bool rm(const std::string &name);

            // Create the directory and any missing parents. Returns true if the
            // directory exists afterwards.
            static bool mkdir(const std::string &dir);

            static bool exists(const std::string &name);

            static bool isDir(const std::string &name);

            // Join two path components.
            static std::string join(const std::string &a, const std::string &b);

            // Return the last component of a path, e.g. the scene directory name.
            static std::string basename(const std::string &path);

            // Populates the vector with the files contained in dir. If ext is specified, filters
            // the files by that extension (case-insensitive). If dir is a file, it is added to the list.
            // Returns the number of files found.
            static int dirlist(const std::string &dir, std::vector<std::string> &files,
                const std::string &ext = std::string());

            // Populates the vector with the names (not paths) of the subdirectories
            // of dir, sorted. Returns the number found.
            static int subdirs(const std::string &dir, std::vector<std::string> &names);

            static std::string lower(const std::string &str);

            static std::string upper(const std::string &str);

        };

    } // util

} // specindex

#endif
