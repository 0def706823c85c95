#include <vector>
#include <string>
#include <sstream>
#include <iomanip>

#include <boost/filesystem.hpp>

#include "specindex.h"
#include "util.hpp"
#include "csv.hpp"
#include "report.hpp"

using namespace specindex;
using namespace specindex::report;
using namespace specindex::scene;
using namespace specindex::util;

std::string ReportWriter::summaryName() {
	return "summary_" + Util::timestamp() + ".csv";
}

std::string ReportWriter::cell(const IndexResult *result) {
	if(!result)
		return "failed: not run";
	if(result->status == Status::Success)
		return statusName(result->status);
	return statusName(result->status) + ": " + result->reason;
}

std::vector<std::string> ReportWriter::header(const std::vector<index::Index> &indices) {
	std::vector<std::string> row;
	row.push_back("scene");
	for(const index::Index &idx : indices)
		row.push_back(index::name(idx));
	row.push_back("time_sec");
	return row;
}

std::vector<std::string> ReportWriter::row(const SceneReport &report, const std::vector<index::Index> &indices) {
	std::vector<std::string> row;
	row.push_back(report.scene);
	for(const index::Index &idx : indices)
		row.push_back(cell(report.result(idx)));
	std::stringstream ss;
	ss << std::fixed << std::setprecision(2) << report.elapsed;
	row.push_back(ss.str());
	return row;
}

void ReportWriter::write(const std::string &filename, const std::vector<SceneReport> &reports,
		const std::vector<index::Index> &indices) {
	boost::filesystem::path p(filename);
	if(p.has_parent_path() && !Util::mkdir(p.parent_path().string()))
		si_runerr("Failed to create directory for " << filename);

	csv::CSVWriter out(filename);
	out.write(header(indices));
	for(const SceneReport &report : reports)
		out.write(row(report, indices));
	out.close();
}
