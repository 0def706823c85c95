#ifndef __REPORT_HPP__
#define __REPORT_HPP__

#include <vector>
#include <string>

#include "specindex.h"
#include "indices.hpp"
#include "scene.hpp"

namespace specindex {

    namespace report {

        // Writes the per-scene summary of a batch run as CSV: a scene column,
        // one column per requested index and the elapsed seconds.
        class DLL_EXPORT ReportWriter {
        public:

            // The file name for a summary written now: summary_<timestamp>.csv.
            static std::string summaryName();

            // The cell for one result: "success", "skipped: <reason>" or
            // "failed: <reason>". An index with no result is "failed: not run".
            static std::string cell(const specindex::scene::IndexResult *result);

            // The header row.
            static std::vector<std::string> header(const std::vector<specindex::index::Index> &indices);

            // The row for one scene.
            static std::vector<std::string> row(const specindex::scene::SceneReport &report,
                    const std::vector<specindex::index::Index> &indices);

            // Write the reports in the given order. Throws std::runtime_error if
            // the file cannot be written.
            static void write(const std::string &filename, const std::vector<specindex::scene::SceneReport> &reports,
                    const std::vector<specindex::index::Index> &indices);
        };

    } // report

} // specindex

#endif
