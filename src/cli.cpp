#include <vector>
#include <string>
#include <algorithm>
#include <cstdlib>

#include <gdal_priv.h>

#include "specindex.h"
#include "errors.hpp"
#include "util.hpp"
#include "bands.hpp"
#include "indices.hpp"
#include "scene.hpp"
#include "batch.hpp"
#include "report.hpp"
#include "cli.hpp"

using namespace specindex;
using namespace specindex::cli;
using namespace specindex::util;
using namespace specindex::batch;
using namespace specindex::batch::config;

namespace {

	// Return the value following the flag at args[i], advancing i.
	const std::string& next(const std::vector<std::string> &args, size_t &i) {
		if(i + 1 >= args.size())
			si_argerr("Missing value for " << args[i]);
		return args[++i];
	}

	bool isFlag(const std::string &arg) {
		return !arg.empty() && arg[0] == '-';
	}

} // anon

Options::Options() :
	logLevel(SI_LOG_INFO),
	help(false) {
}

void specindex::cli::usage(std::ostream &out) {
	out << "Usage: specindex [options]\n"
		<< " --scene <name>       Process only the named scene.\n"
		<< " --input <dir>        The input directory, containing one directory per\n"
		<< "                      scene. Default data/input.\n"
		<< " --output <dir>       The output directory. Default data/output.\n"
		<< " --indices <name ...> The indices to compute. Any of NDVI, SAVI, EVI, ARVI,\n"
		<< "                      NBR, NBWI, NDBI, GCI. Default all.\n"
		<< " --threads <n>        The number of scenes to process at once. Defaults to\n"
		<< "                      the number of cores.\n"
		<< " --sensor <name>      The band naming preset: landsat8 (B2..B7) or\n"
		<< "                      sentinel2 (B02, B03, B04, B08, B11, B12). Default landsat8.\n"
		<< " --log-dir <dir>      The directory for the run log. Default logs.\n"
		<< " -v                   Verbose messages.\n"
		<< " -q                   Only warnings and errors.\n"
		<< " -h                   Print this message.\n";
}

Options specindex::cli::parse(const std::vector<std::string> &args) {
	Options opts;
	bool indicesGiven = false;

	for(size_t i = 0; i < args.size(); ++i) {
		const std::string &arg = args[i];
		if(arg == "--scene") {
			opts.config.scene = next(args, i);
		} else if(arg == "--input") {
			opts.config.inputRoot = next(args, i);
		} else if(arg == "--output") {
			opts.config.outputRoot = next(args, i);
		} else if(arg == "--indices") {
			std::vector<index::Index> &indices = opts.config.indices;
			if(!indicesGiven)
				indices.clear();
			indicesGiven = true;
			while(i + 1 < args.size() && !isFlag(args[i + 1])) {
				std::vector<std::string> names;
				Util::splitString(args[++i], names);
				for(const std::string &name : names) {
					index::Index idx = index::fromName(name);
					if(std::find(indices.begin(), indices.end(), idx) == indices.end())
						indices.push_back(idx);
				}
			}
			if(indices.empty())
				si_argerr("No indices given.");
		} else if(arg == "--threads") {
			opts.config.threads = atoi(next(args, i).c_str());
		} else if(arg == "--sensor") {
			opts.config.bandMap = bands::BandMap::fromName(next(args, i));
		} else if(arg == "--log-dir") {
			opts.config.logDir = next(args, i);
		} else if(arg == "-v") {
			opts.logLevel = SI_LOG_DEBUG;
		} else if(arg == "-q") {
			opts.logLevel = SI_LOG_WARN;
		} else if(arg == "-h" || arg == "--help") {
			opts.help = true;
		} else {
			si_argerr("Unknown argument: " << arg);
		}
	}
	return opts;
}

int specindex::cli::run(const std::vector<std::string> &args, Logger &log, Callbacks *callbacks) {

	try {

		Options opts = parse(args);
		if(opts.help) {
			usage(std::cerr);
			return 0;
		}
		const BatchConfig &config = opts.config;
		log.level(opts.logLevel);

		log.open(Util::join(config.logDir, "batch_run_" + Util::timestamp() + ".log"));
		si_info(log, "Log file: " << log.filename());

		config.check();

		GDALAllRegister();

		std::vector<std::string> scenes = BatchRunner::discover(config.inputRoot, config.scene);
		si_info(log, "Found " << scenes.size() << " scene(s) in " << config.inputRoot);

		BatchRunner runner(config, log);
		if(log.level() < SI_LOG_DEBUG)
			runner.setCallbacks(callbacks);

		std::vector<scene::SceneReport> reports = runner.run(scenes, config.indices, config.threads);

		std::string summary = Util::join(config.outputRoot, report::ReportWriter::summaryName());
		report::ReportWriter::write(summary, reports, config.indices);
		si_info(log, "Summary written to " << summary);

		size_t failed = 0;
		for(const scene::SceneReport &r : reports)
			failed += r.failed();
		si_info(log, "Batch complete: " << reports.size() << " scene(s), " << failed << " failed index result(s).");

	} catch(const std::invalid_argument &e) {
		si_error(log, e.what());
		usage(std::cerr);
		return 1;
	} catch(const SetupError &e) {
		si_error(log, e.what());
		return 1;
	} catch(const std::exception &e) {
		si_error(log, e.what());
		return 1;
	}

	return 0;
}
