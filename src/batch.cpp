#include <vector>
#include <string>

#include <omp.h>

#include <boost/filesystem.hpp>

#include "specindex.h"
#include "errors.hpp"
#include "util.hpp"
#include "scene.hpp"
#include "batch.hpp"

using namespace specindex;
using namespace specindex::batch;
using namespace specindex::batch::config;
using namespace specindex::scene;
using namespace specindex::util;

BatchConfig::BatchConfig() :
	inputRoot("data/input"),
	outputRoot("data/output"),
	indices(specindex::index::allIndices()),
	threads(omp_get_num_procs()),
	logDir("logs"),
	keepGrids(false) {
}

void BatchConfig::check() const {
	if(inputRoot.empty())
		si_argerr("The input directory must be given.");
	if(!Util::isDir(inputRoot))
		si_throw(SetupError, "Input directory not found: " << inputRoot);
	if(outputRoot.empty())
		si_argerr("The output directory must be given.");
	if(indices.empty())
		si_argerr("At least one index must be given.");
	if(threads < 1)
		si_argerr("The number of threads must be at least 1.");
	params.check();
}

specindex::scene::config::SceneConfig BatchConfig::sceneConfig() const {
	specindex::scene::config::SceneConfig cfg;
	cfg.outputRoot = outputRoot;
	cfg.bandMap = bandMap;
	cfg.params = params;
	cfg.keepGrids = keepGrids;
	return cfg;
}


BatchRunner::BatchRunner(const BatchConfig &config, Logger &log) :
	m_config(config),
	m_log(log),
	m_callbacks(nullptr) {
}

void BatchRunner::setCallbacks(Callbacks *callbacks) {
	m_callbacks = callbacks;
}

std::vector<std::string> BatchRunner::discover(const std::string &inputRoot, const std::string &scene) {
	if(!Util::isDir(inputRoot))
		si_throw(SetupError, "Input directory not found: " << inputRoot);

	std::vector<std::string> paths;
	if(!scene.empty()) {
		std::string path = Util::join(inputRoot, scene);
		if(!Util::isDir(path))
			si_throw(SetupError, "Scene not found: " << scene << " in " << inputRoot);
		paths.push_back(path);
		return paths;
	}

	std::vector<std::string> names;
	try {
		Util::subdirs(inputRoot, names);
	} catch(const boost::filesystem::filesystem_error &e) {
		si_throw(SetupError, "Input directory could not be read: " << inputRoot << ": " << e.what());
	}
	for(const std::string &name : names)
		paths.push_back(Util::join(inputRoot, name));
	return paths;
}

SceneReport BatchRunner::processScene(const SceneProcessor &proc, const std::string &scenePath,
		const std::vector<specindex::index::Index> &indices) {
	SceneReport report(Util::basename(scenePath));
	try {
		return proc.process(scenePath, indices);
	} catch(const std::exception &e) {
		report.fail(indices, e.what());
		si_error(m_log, "Scene " << report.scene << " failed: " << e.what());
	} catch(...) {
		report.fail(indices, "unknown error");
		si_error(m_log, "Scene " << report.scene << " failed with an unknown error.");
	}
	return report;
}

std::vector<SceneReport> BatchRunner::run(const std::vector<std::string> &scenePaths,
		const std::vector<specindex::index::Index> &indices, int concurrency) {

	if(concurrency < 1)
		concurrency = omp_get_num_procs();

	int count = (int) scenePaths.size();
	std::vector<SceneReport> reports(count);
	if(!count) {
		si_warn(m_log, "No scenes to process.");
		return reports;
	}

	SceneProcessor proc(m_config.sceneConfig(), m_log);
	int threads = si_min(concurrency, count);
	si_info(m_log, "Processing " << count << " scene(s) with " << threads << " thread(s).");

	if(m_callbacks)
		m_callbacks->overallCallback(0.0f);

	if(count == 1) {
		reports[0] = processScene(proc, scenePaths[0], indices);
		if(m_callbacks)
			m_callbacks->overallCallback(1.0f);
		return reports;
	}

	int done = 0;
	#pragma omp parallel for schedule(dynamic, 1) num_threads(threads)
	for(int i = 0; i < count; ++i) {
		reports[i] = processScene(proc, scenePaths[i], indices);
		int d;
		#pragma omp atomic capture
		d = ++done;
		if(m_callbacks)
			m_callbacks->overallCallback((float) d / count);
	}

	return reports;
}

std::vector<SceneReport> BatchRunner::run() {
	m_config.check();
	std::vector<std::string> scenes = discover(m_config.inputRoot, m_config.scene);
	return run(scenes, m_config.indices, m_config.threads);
}
