/**
 * Computes spectral indices (NDVI, SAVI, EVI, ...) for every scene under an
 * input directory and writes one GeoTIFF per index and scene, plus a CSV
 * summary of the outcome of each.
 */
#include <vector>
#include <string>

#include "specindex.h"
#include "util.hpp"
#include "cli.hpp"

using namespace specindex::util;

// Prints the fraction of scenes completed.
class StatusCallbacks : public Callbacks {
public:
	void stepCallback(float status) const {
		(void) status;
	}

	void overallCallback(float status) const {
		Util::status((int) (status * 100.0f), 100, "Scenes", status >= 1.0f);
	}
};

int main(int argc, char **argv) {
	std::vector<std::string> args(argv + 1, argv + argc);
	Logger log(SI_LOG_INFO);
	StatusCallbacks callbacks;
	return specindex::cli::run(args, log, &callbacks);
}
