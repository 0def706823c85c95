#include <vector>
#include <string>
#include <map>
#include <chrono>

#include "specindex.h"
#include "errors.hpp"
#include "util.hpp"
#include "raster.hpp"
#include "bands.hpp"
#include "indices.hpp"
#include "scene.hpp"

using namespace specindex;
using namespace specindex::scene;
using namespace specindex::scene::config;
using namespace specindex::raster;
using namespace specindex::bands;
using namespace specindex::util;

namespace {

	double since(const std::chrono::steady_clock::time_point &start) {
		return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
	}

} // anon

std::string specindex::scene::statusName(Status status) {
	switch(status) {
	case Status::Success: return "success";
	case Status::Failed:  return "failed";
	case Status::Skipped: return "skipped";
	}
	si_argerr("Unknown status: " << (int) status);
}

IndexResult::IndexResult(index::Index index) :
	index(index),
	status(Status::Failed),
	elapsed(0) {
}

bool IndexResult::ok() const {
	return status == Status::Success;
}

SceneReport::SceneReport(const std::string &scene) :
	scene(scene),
	elapsed(0),
	fatal(false) {
}

const IndexResult* SceneReport::result(index::Index index) const {
	for(const IndexResult &r : results) {
		if(r.index == index)
			return &r;
	}
	return nullptr;
}

void SceneReport::fail(const std::vector<index::Index> &indices, const std::string &reason) {
	fatal = true;
	error = reason;
	results.clear();
	for(const index::Index &idx : indices) {
		IndexResult r(idx);
		r.status = Status::Failed;
		r.reason = reason;
		results.push_back(r);
	}
}

size_t SceneReport::succeeded() const {
	size_t n = 0;
	for(const IndexResult &r : results)
		if(r.status == Status::Success) ++n;
	return n;
}

size_t SceneReport::failed() const {
	size_t n = 0;
	for(const IndexResult &r : results)
		if(r.status == Status::Failed) ++n;
	return n;
}

size_t SceneReport::skipped() const {
	size_t n = 0;
	for(const IndexResult &r : results)
		if(r.status == Status::Skipped) ++n;
	return n;
}


SceneProcessor::SceneProcessor(const SceneConfig &config, Logger &log) :
	m_config(config),
	m_log(log) {
	m_config.check();
}

std::string SceneProcessor::outputDir(const std::string &scene) const {
	return Util::join(m_config.outputRoot, scene);
}

void SceneProcessor::write(MemRaster<float> &grid, const GeoRef &georef, const std::string &outDir,
		const std::string &filename) const {
	if(!Util::mkdir(outDir))
		si_throw(WriteError, "Failed to create output directory " << outDir);
	try {
		Raster<float> out(filename, 1, grid.cols(), grid.rows(), georef, grid.nodata());
		out.writeBlock(grid);
		out.close();
	} catch(const std::exception &e) {
		si_throw(WriteError, "Failed to write " << filename << ": " << e.what());
	}
}

IndexResult SceneProcessor::processIndex(BandLoader &loader, index::Index idx, const std::string &outDir) const {
	const std::string name = index::name(idx);
	IndexResult result(idx);
	std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
	try {
		std::vector<std::string> ids = m_config.bandMap.ids(index::roles(idx));
		std::map<std::string, Band*> bands = loader.load(ids);

		std::vector<MemRaster<float>*> grids;
		const GeoRef &georef = bands[ids[0]]->georef;
		for(const std::string &id : ids) {
			Band *band = bands[id];
			if(!band->georef.matches(georef))
				si_warn(m_log, loader.scene() << ": " << name << ": band " << id << " has a different spatial reference than " << ids[0]);
			grids.push_back(band->grid.get());
		}

		std::shared_ptr<MemRaster<float> > out(new MemRaster<float>());
		index::compute(idx, grids, *out, m_config.params);

		std::string filename = Util::join(outDir, name + ".tif");
		write(*out, georef, outDir, filename);

		result.status = Status::Success;
		result.filename = filename;
		if(m_config.keepGrids)
			result.grid = out;
		si_info(m_log, loader.scene() << ": " << name << " saved to " << filename
			<< " [min: " << out->min() << "; max: " << out->max() << "; mean: " << out->mean()
			<< "; valid: " << out->count() << "/" << out->size() << "]");
	} catch(const MissingBandError &e) {
		result.status = Status::Skipped;
		result.reason = "missing " + e.bandList();
		si_warn(m_log, loader.scene() << ": " << name << " skipped: " << e.what());
	} catch(const std::exception &e) {
		result.status = Status::Failed;
		result.reason = e.what();
		si_error(m_log, loader.scene() << ": " << name << " failed: " << e.what());
	}
	result.elapsed = since(start);
	return result;
}

SceneReport SceneProcessor::process(const std::string &scenePath, const std::vector<index::Index> &indices) const {
	SceneReport report(Util::basename(scenePath));
	std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
	si_info(m_log, "Processing scene: " << report.scene);

	try {
		BandLoader loader(scenePath, m_log);
		const std::string outDir = outputDir(report.scene);
		for(const index::Index &idx : indices)
			report.results.push_back(processIndex(loader, idx, outDir));
	} catch(const SceneFatalError &e) {
		report.fail(indices, e.what());
		si_error(m_log, "Scene " << report.scene << " failed: " << e.what());
	}

	report.elapsed = since(start);
	si_info(m_log, "Finished " << report.scene << " in " << std::fixed << std::setprecision(2) << report.elapsed << "s ("
		<< report.succeeded() << " succeeded, " << report.failed() << " failed, " << report.skipped() << " skipped)");
	return report;
}
