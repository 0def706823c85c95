#include <vector>
#include <string>
#include <sstream>
#include <set>

#include <gtest/gtest.h>

#include "specindex.h"
#include "util.hpp"
#include "test_util.hpp"

using namespace specindex::util;
using namespace specindex::test;

TEST(LoggerTest, WritesLevelAndMessage) {
	TempDir tmp;
	std::string filename = Util::join(tmp.join("logs"), "run.log");
	Logger log(SI_LOG_INFO);
	log.console(nullptr);
	log.open(filename);
	EXPECT_EQ(filename, log.filename());
	si_info(log, "scene " << 1 << " done");
	si_warn(log, "careful");
	log.close();

	std::string text = slurp(filename);
	EXPECT_NE(std::string::npos, text.find(" - INFO - scene 1 done\n"));
	EXPECT_NE(std::string::npos, text.find(" - WARNING - careful\n"));
}

TEST(LoggerTest, FiltersByLevel) {
	TempDir tmp;
	std::string filename = tmp.join("run.log");
	Logger log(SI_LOG_WARN);
	log.console(nullptr);
	log.open(filename);
	si_debug(log, "hidden debug");
	si_info(log, "hidden info");
	si_error(log, "shown");
	log.close();

	std::string text = slurp(filename);
	EXPECT_EQ(std::string::npos, text.find("hidden"));
	EXPECT_NE(std::string::npos, text.find(" - ERROR - shown"));
}

TEST(LoggerTest, AppendsToExistingFile) {
	TempDir tmp;
	std::string filename = tmp.join("run.log");
	{
		Logger log;
		log.console(nullptr);
		log.open(filename);
		si_info(log, "first");
	}
	{
		Logger log;
		log.console(nullptr);
		log.open(filename);
		si_info(log, "second");
	}
	std::string text = slurp(filename);
	EXPECT_LT(text.find("first"), text.find("second"));
}

TEST(LoggerTest, ConcurrentLinesStayWhole) {
	TempDir tmp;
	std::string filename = tmp.join("run.log");
	const int count = 400;
	Logger log;
	log.console(nullptr);
	log.open(filename);

	#pragma omp parallel for num_threads(8)
	for(int i = 0; i < count; ++i)
		si_info(log, "line " << i << " " << std::string(200, (char) ('a' + i % 26)) << " end");
	log.close();

	std::istringstream in(slurp(filename));
	std::string line;
	std::set<int> seen;
	while(std::getline(in, line)) {
		// "YYYY-mm-dd HH:MM:SS - INFO - line <i> <payload> end"
		ASSERT_GT(line.size(), 19u) << line;
		std::string rest = line.substr(19);
		ASSERT_EQ(0u, rest.find(" - INFO - line ")) << line;
		std::istringstream fields(rest.substr(15));
		int i = -1;
		std::string payload;
		std::string end;
		fields >> i >> payload >> end;
		ASSERT_TRUE(i >= 0 && i < count) << line;
		EXPECT_EQ(std::string(200, (char) ('a' + i % 26)), payload) << line;
		EXPECT_EQ("end", end) << line;
		EXPECT_TRUE(fields.eof() || fields.peek() == EOF) << line;
		EXPECT_TRUE(seen.insert(i).second) << "duplicate line " << i;
	}
	EXPECT_EQ((size_t) count, seen.size());
}

TEST(UtilTest, Basename) {
	EXPECT_EQ("sceneA", Util::basename("data/input/sceneA"));
	EXPECT_EQ("sceneA", Util::basename("data/input/sceneA/"));
	EXPECT_EQ("B4.tif", Util::basename("B4.tif"));
}

TEST(UtilTest, SubdirsAreSortedNames) {
	TempDir tmp;
	boost::filesystem::create_directories(tmp.join("sceneC"));
	boost::filesystem::create_directories(tmp.join("sceneA"));
	boost::filesystem::create_directories(tmp.join("sceneB"));
	std::ofstream(tmp.join("notes.txt").c_str()) << "x";

	std::vector<std::string> names;
	EXPECT_EQ(3, Util::subdirs(tmp.path(), names));
	ASSERT_EQ(3u, names.size());
	EXPECT_EQ("sceneA", names[0]);
	EXPECT_EQ("sceneB", names[1]);
	EXPECT_EQ("sceneC", names[2]);
}

TEST(UtilTest, DirlistFiltersByExtension) {
	TempDir tmp;
	std::ofstream(tmp.join("a.tif").c_str()) << "x";
	std::ofstream(tmp.join("b.TIF").c_str()) << "x";
	std::ofstream(tmp.join("c.txt").c_str()) << "x";
	std::vector<std::string> files;
	EXPECT_EQ(2, Util::dirlist(tmp.path(), files, ".tif"));
}

TEST(UtilTest, MkdirCreatesParents) {
	TempDir tmp;
	std::string dir = Util::join(tmp.join("a"), "b");
	EXPECT_TRUE(Util::mkdir(dir));
	EXPECT_TRUE(Util::isDir(dir));
	// A file in the way.
	std::ofstream(tmp.join("f").c_str()) << "x";
	EXPECT_FALSE(Util::mkdir(tmp.join("f")));
}

TEST(UtilTest, SplitString) {
	std::vector<std::string> lst;
	Util::splitString("NDVI,,SAVI,EVI", lst);
	ASSERT_EQ(3u, lst.size());
	EXPECT_EQ("NDVI", lst[0]);
	EXPECT_EQ("EVI", lst[2]);
}

TEST(UtilTest, TimestampFormat) {
	std::string ts = Util::timestamp();
	ASSERT_EQ(15u, ts.size());
	EXPECT_EQ('_', ts[8]);
}

TEST(UtilTest, Case) {
	EXPECT_EQ("ndvi", Util::lower("NdVi"));
	EXPECT_EQ("NDVI", Util::upper("NdVi"));
}
