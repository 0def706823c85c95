#include <vector>
#include <string>
#include <mutex>
#include <fstream>

#include <gtest/gtest.h>

#include "specindex.h"
#include "errors.hpp"
#include "util.hpp"
#include "indices.hpp"
#include "scene.hpp"
#include "batch.hpp"
#include "report.hpp"
#include "test_util.hpp"

using namespace specindex;
using namespace specindex::batch;
using namespace specindex::batch::config;
using namespace specindex::scene;
using namespace specindex::index;
using namespace specindex::util;
using namespace specindex::test;

namespace {

	// Records the progress reported by the runner.
	class RecordingCallbacks : public Callbacks {
	public:
		mutable std::mutex mtx;
		mutable std::vector<float> overall;

		void stepCallback(float status) const {
			(void) status;
		}

		void overallCallback(float status) const {
			std::lock_guard<std::mutex> lk(mtx);
			overall.push_back(status);
		}
	};

} // anon

class BatchRunnerTest : public ::testing::Test {
protected:
	TempDir tmp;
	Logger log;
	BatchConfig config;

	void SetUp() {
		log.console(nullptr);
		config.inputRoot = tmp.join("input");
		config.outputRoot = tmp.join("output");
		config.threads = 2;
	}

	std::vector<std::string> scenes(const std::vector<std::string> &names) {
		std::vector<std::string> paths;
		for(const std::string &name : names)
			paths.push_back(writeScene(config.inputRoot, name, landsatBands()));
		return paths;
	}
};

TEST_F(BatchRunnerTest, DiscoverSortsScenes) {
	scenes({"sceneC", "sceneA", "sceneB"});
	std::ofstream(Util::join(config.inputRoot, "readme.txt").c_str()) << "x";

	std::vector<std::string> found = BatchRunner::discover(config.inputRoot);
	ASSERT_EQ(3u, found.size());
	EXPECT_EQ("sceneA", Util::basename(found[0]));
	EXPECT_EQ("sceneB", Util::basename(found[1]));
	EXPECT_EQ("sceneC", Util::basename(found[2]));
}

TEST_F(BatchRunnerTest, DiscoverFilter) {
	scenes({"sceneA", "sceneB"});
	std::vector<std::string> found = BatchRunner::discover(config.inputRoot, "sceneB");
	ASSERT_EQ(1u, found.size());
	EXPECT_EQ(Util::join(config.inputRoot, "sceneB"), found[0]);
	EXPECT_THROW(BatchRunner::discover(config.inputRoot, "sceneZ"), SetupError);
}

TEST_F(BatchRunnerTest, DiscoverMissingRoot) {
	EXPECT_THROW(BatchRunner::discover(tmp.join("nope")), SetupError);
}

TEST_F(BatchRunnerTest, ConfigCheck) {
	scenes({"sceneA"});
	EXPECT_NO_THROW(config.check());

	BatchConfig c = config;
	c.threads = 0;
	EXPECT_THROW(c.check(), std::invalid_argument);

	c = config;
	c.indices.clear();
	EXPECT_THROW(c.check(), std::invalid_argument);

	c = config;
	c.inputRoot = tmp.join("nope");
	EXPECT_THROW(c.check(), SetupError);
}

TEST_F(BatchRunnerTest, Defaults) {
	BatchConfig c;
	EXPECT_EQ("data/input", c.inputRoot);
	EXPECT_EQ("data/output", c.outputRoot);
	EXPECT_EQ("logs", c.logDir);
	EXPECT_EQ(allIndices().size(), c.indices.size());
	EXPECT_GE(c.threads, 1);
	EXPECT_EQ("landsat8", c.bandMap.sensor());
}

TEST_F(BatchRunnerTest, ReportsFollowInputOrder) {
	std::vector<std::string> paths = scenes({"sceneC", "sceneA", "sceneB"});
	BatchRunner runner(config, log);
	std::vector<SceneReport> reports = runner.run(paths, {Index::NDVI, Index::GCI}, 3);
	ASSERT_EQ(3u, reports.size());
	EXPECT_EQ("sceneC", reports[0].scene);
	EXPECT_EQ("sceneA", reports[1].scene);
	EXPECT_EQ("sceneB", reports[2].scene);
	for(const SceneReport &r : reports)
		EXPECT_EQ(2u, r.succeeded()) << r.scene;
}

TEST_F(BatchRunnerTest, MissingSceneDoesNotStopBatch) {
	std::vector<std::string> paths = scenes({"scene1", "scene2", "scene3"});
	Util::rm(paths[1]);

	BatchRunner runner(config, log);
	std::vector<SceneReport> reports = runner.run(paths, {Index::NDVI, Index::NBR}, 2);
	ASSERT_EQ(3u, reports.size());

	EXPECT_FALSE(reports[0].fatal);
	EXPECT_EQ(2u, reports[0].succeeded());

	EXPECT_EQ("scene2", reports[1].scene);
	EXPECT_TRUE(reports[1].fatal);
	EXPECT_EQ(2u, reports[1].failed());

	EXPECT_FALSE(reports[2].fatal);
	EXPECT_EQ(2u, reports[2].succeeded());
}

TEST_F(BatchRunnerTest, SingleSceneRunsInline) {
	std::vector<std::string> paths = scenes({"sceneA"});
	RecordingCallbacks cb;
	BatchRunner runner(config, log);
	runner.setCallbacks(&cb);
	std::vector<SceneReport> reports = runner.run(paths, {Index::EVI}, 8);
	ASSERT_EQ(1u, reports.size());
	EXPECT_EQ(1u, reports[0].succeeded());
	ASSERT_FALSE(cb.overall.empty());
	EXPECT_EQ(1.0f, cb.overall.back());
}

TEST_F(BatchRunnerTest, ProgressReachesCompletion) {
	std::vector<std::string> paths = scenes({"s1", "s2", "s3", "s4"});
	RecordingCallbacks cb;
	BatchRunner runner(config, log);
	runner.setCallbacks(&cb);
	runner.run(paths, {Index::NDVI}, 2);
	// The initial zero and one call per scene.
	ASSERT_EQ(5u, cb.overall.size());
	float top = 0;
	for(float f : cb.overall)
		top = si_max(top, f);
	EXPECT_EQ(1.0f, top);
}

TEST_F(BatchRunnerTest, EmptySceneList) {
	BatchRunner runner(config, log);
	std::vector<SceneReport> reports = runner.run(std::vector<std::string>(), allIndices(), 2);
	EXPECT_TRUE(reports.empty());
}

TEST_F(BatchRunnerTest, RunFromConfig) {
	scenes({"sceneB", "sceneA"});
	config.scene = "sceneB";
	config.indices = {Index::SAVI};
	BatchRunner runner(config, log);
	std::vector<SceneReport> reports = runner.run();
	ASSERT_EQ(1u, reports.size());
	EXPECT_EQ("sceneB", reports[0].scene);
	EXPECT_EQ(Status::Success, reports[0].result(Index::SAVI)->status);
}

TEST_F(BatchRunnerTest, RerunIsIdempotent) {
	std::vector<std::string> paths = scenes({"sceneA", "sceneB"});
	std::vector<Index> indices = allIndices();
	BatchRunner runner(config, log);

	std::vector<SceneReport> first = runner.run(paths, indices, 2);
	std::vector<std::string> bytes;
	for(const SceneReport &r : first) {
		for(const IndexResult &res : r.results)
			bytes.push_back(slurp(res.filename));
	}

	std::vector<SceneReport> second = runner.run(paths, indices, 2);
	size_t k = 0;
	for(size_t i = 0; i < second.size(); ++i) {
		std::vector<std::string> a = report::ReportWriter::row(first[i], indices);
		std::vector<std::string> b = report::ReportWriter::row(second[i], indices);
		// All but time_sec.
		a.pop_back();
		b.pop_back();
		EXPECT_EQ(a, b);
		for(const IndexResult &res : second[i].results) {
			std::string data = slurp(res.filename);
			EXPECT_FALSE(data.empty());
			EXPECT_TRUE(data == bytes[k++]) << res.filename;
		}
	}
}
